/// @file Thread.hpp
/// @brief OS-thread backed thread handle (no std::thread) that hands inheritable locals to the child.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Execution/Config.hpp>
#include <Tether/Execution/ThreadName.hpp>
#include <Tether/Memory/SmartPointers.hpp>
#include <Tether/Primitives.hpp>
#include <Tether/Utilities/Callable.hpp>

#include <atomic>
#include <concepts>
#include <string_view>
#include <utility>

#if !defined(_WIN32)
#include <pthread.h>
#endif

namespace Tether::Execution
{
    /// @brief Joinable OS thread.
    ///
    /// With `Options::inheritLocals`, `Start` propagates the calling context's inheritable store on
    /// the calling thread (so the child sees the parent's values as of `Start`) and the child adopts
    /// it before running `entry`. Primary locals are never inherited.
    class TETHER_API Thread
    {
    public:
#if defined(_WIN32)
        using NativeHandle = void*;
#else
        using NativeHandle = pthread_t;
#endif
        using ThreadId = UInt64;
        using Entry    = Utilities::Callable<void()>;

        enum class OnDestruct : UInt8
        {
            Join,
            Detach,
            Terminate,
        };

        struct Options final
        {
            constexpr Options() noexcept = default;

            ThreadName name {};
            UIntSize   stackSize {0};
            OnDestruct onDestruct {OnDestruct::Terminate};
            bool       inheritLocals {TETHER_THREAD_INHERITS_LOCALS != 0};
        };

        Thread() noexcept = default;

        template<typename F>
            requires std::constructible_from<Entry, F>
        explicit Thread(F&& entry, Options options = {})
        {
            Start(Entry(std::forward<F>(entry)), options);
        }

        ~Thread() noexcept { HandleDestruction_(); }

        Thread(const Thread&)            = delete;
        Thread& operator=(const Thread&) = delete;

        Thread(Thread&& other) noexcept;
        Thread& operator=(Thread&& other) noexcept;

        /// Terminates if this thread is already joinable or `entry` is empty.
        /// @throws whatever propagating the inheritable store throws (a carry-over transform,
        ///         std::bad_alloc). Nothing is started in that case.
        void Start(Entry entry, Options options = {});

        void Join() noexcept;
        void Detach() noexcept;

        [[nodiscard]] bool IsJoinable() const noexcept { return m_joinable; }

        /// OS id of the running thread. On POSIX it reads 0 until the child has published it, and
        /// always 0 once joined or detached.
        [[nodiscard]] ThreadId GetId() const noexcept
        {
            return m_id ? m_id->load(std::memory_order_acquire) : 0;
        }

        [[nodiscard]] NativeHandle NativeHandleValue() noexcept { return m_handle; }

        /// @name Calling-thread queries
        /// @{
        [[nodiscard]] static ThreadId CurrentId() noexcept;

        /// Names the calling thread for debuggers. Linux keeps only the first 15 bytes.
        /// Returns false for an empty name or when the platform refuses it.
        static bool SetCurrentName(std::string_view name) noexcept;

        /// Online processors, at least 1.
        [[nodiscard]] static UInt32 HardwareConcurrency() noexcept;
        /// @}

    private:
        struct Launch;

#if defined(_WIN32)
        static unsigned __stdcall Trampoline_(void* launch) noexcept;
#else
        static void* Trampoline_(void* launch) noexcept;
#endif
        static void Run_(Launch* launch) noexcept;

        void Forget_() noexcept;
        void MoveFrom_(Thread& other) noexcept;
        void HandleDestruction_() noexcept;

        Options                                 m_options {};
        bool                                    m_joinable {false};
        NativeHandle                            m_handle {};
        Memory::Shared<std::atomic<ThreadId>>   m_id {};
    };

    /// @brief `Thread` that always joins on destruction.
    class WorkerThread final
    {
    public:
        WorkerThread() noexcept = default;

        template<typename F>
            requires std::constructible_from<Thread::Entry, F>
        explicit WorkerThread(F&& entry, Thread::Options options = {})
        {
            Start(Thread::Entry(std::forward<F>(entry)), options);
        }

        void Start(Thread::Entry entry, Thread::Options options = {})
        {
            options.onDestruct = Thread::OnDestruct::Join;
            m_thread.Start(std::move(entry), options);
        }

        void               Join() noexcept { m_thread.Join(); }
        [[nodiscard]] bool IsJoinable() const noexcept { return m_thread.IsJoinable(); }

        [[nodiscard]] Thread::ThreadId GetId() const noexcept { return m_thread.GetId(); }

    private:
        Thread m_thread {};
    };
}// namespace Tether::Execution
