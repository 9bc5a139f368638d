/// @file ThreadPoolScheduler.hpp
/// @brief Fixed-size worker pool running plain and context-carrying jobs (header-only).
#pragma once

#include <Tether/Execution/ContextCarried.hpp>
#include <Tether/Execution/Thread.hpp>
#include <Tether/Execution/ThreadName.hpp>
#include <Tether/Primitives.hpp>
#include <Tether/Utilities/Callable.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Tether::Execution
{
    /// @brief Dispatches jobs onto a fixed set of worker threads in FIFO order.
    ///
    /// Workers are long-lived, so values a job leaves in a worker's context stay there for later
    /// jobs on that worker. Submit with `ExecuteWithContext` to run a job with the submitter's
    /// values instead; the worker's own values are restored when the job ends.
    class ThreadPoolScheduler
    {
    public:
        using Job = Tether::Utilities::Callable<void()>;

        struct Options final
        {
            constexpr Options() noexcept = default;

            /// 0 selects the hardware concurrency.
            UIntSize threadCount {0};
            /// Workers start with a copy of the constructing thread's inheritable locals.
            bool inheritLocals {false};
        };

        explicit ThreadPoolScheduler(Options options = {})
        {
            UIntSize threadCount = options.threadCount;
            if (threadCount == 0)
            {
                threadCount = static_cast<UIntSize>(Thread::HardwareConcurrency());
            }

            m_threads.reserve(threadCount);
            try
            {
                for (UIntSize i = 0; i < threadCount; ++i)
                {
                    Thread::Options threadOptions {};
                    threadOptions.name          = ThreadName::Indexed("Tether.TPW", i);
                    threadOptions.inheritLocals = options.inheritLocals;
                    m_threads.emplace_back([this] { WorkerLoop(); }, threadOptions);
                }
            } catch (...)
            {
                // Copying the inheritable locals for a worker failed; stop the ones already running.
                Shutdown();
                throw;
            }
        }

        /// @brief Runs every queued job, then joins the workers.
        ~ThreadPoolScheduler()
        {
            Shutdown();
        }

        ThreadPoolScheduler(const ThreadPoolScheduler&)            = delete;
        ThreadPoolScheduler& operator=(const ThreadPoolScheduler&) = delete;

        /// @throws std::invalid_argument if `job` is empty.
        void Execute(Job job)
        {
            if (!job)
            {
                throw std::invalid_argument("ThreadPoolScheduler::Execute: empty job");
            }
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push_back(std::move(job));
            }
            m_workAvailable.notify_one();
        }

        /// @brief Runs `fn` with a snapshot of the calling context's values.
        template<typename F>
        void ExecuteWithContext(F fn)
        {
            Execute(Job(CarryContext(std::move(fn))));
        }

        /// @brief Blocks until the queue is empty and no job is running.
        void WaitIdle()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_idle.wait(lock, [this] { return m_queue.empty() && m_running == 0; });
        }

        [[nodiscard]] UIntSize ThreadCount() const noexcept
        {
            return m_threads.size();
        }

    private:
        void Shutdown() noexcept
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_workAvailable.notify_all();
            for (auto& t: m_threads)
            {
                if (t.IsJoinable())
                {
                    t.Join();
                }
            }
        }

        void WorkerLoop() noexcept
        {
            for (;;)
            {
                Job job;
                {
                    std::unique_lock<std::mutex> lock(m_mutex);
                    m_workAvailable.wait(lock, [this] { return m_stop || !m_queue.empty(); });
                    if (m_queue.empty())
                    {
                        return;
                    }
                    job = std::move(m_queue.front());
                    m_queue.pop_front();
                    ++m_running;
                }

                try
                {
                    job();
                } catch (...)
                {
                    std::terminate();
                }
                job.Reset();

                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    --m_running;
                    if (m_running == 0 && m_queue.empty())
                    {
                        m_idle.notify_all();
                    }
                }
            }
        }

        std::mutex              m_mutex {};
        std::condition_variable m_workAvailable {};
        std::condition_variable m_idle {};
        std::deque<Job>         m_queue {};
        UIntSize                m_running {0};
        bool                    m_stop {false};

        std::vector<WorkerThread> m_threads {};
    };
}// namespace Tether::Execution
