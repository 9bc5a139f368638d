/// @file Thread.cpp
/// @brief Tests for Tether::Execution::Thread.

#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Execution/Thread.hpp>
#include <Tether/Locals/ContextLocal.hpp>

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <string>

namespace Tether::Execution
{
    TEST_CASE("Thread queries the calling thread", "[Execution][Thread]")
    {
        CHECK(Thread::CurrentId() != 0);
        CHECK(Thread::HardwareConcurrency() >= 1u);
        CHECK_FALSE(Thread::SetCurrentName(""));
        (void) Thread::SetCurrentName("tether-test");
    }

    TEST_CASE("Thread reports the id its child runs under", "[Execution][Thread]")
    {
        std::atomic<bool>             started {false};
        std::atomic<bool>             release {false};
        std::atomic<Thread::ThreadId> seen {0};

        Thread t([&] {
            seen.store(Thread::CurrentId(), std::memory_order_relaxed);
            started.store(true, std::memory_order_release);
            while (!release.load(std::memory_order_acquire))
            {
            }
        },
                 Thread::Options {});

        while (!started.load(std::memory_order_acquire))
        {
        }
        CHECK(t.GetId() == seen.load(std::memory_order_relaxed));
        CHECK(t.GetId() != Thread::CurrentId());

        Thread moved(std::move(t));
        CHECK_FALSE(t.IsJoinable());
        CHECK(moved.GetId() == seen.load(std::memory_order_relaxed));

        release.store(true, std::memory_order_release);
        moved.Join();
        CHECK(moved.GetId() == 0U);
    }

    TEST_CASE("ThreadName indexed names", "[Execution][Thread]")
    {
        CHECK(ThreadName::Indexed("pool", 0).View() == "pool.0");
        CHECK(ThreadName::Indexed("pool", 42).View() == "pool.42");
    }

    TEST_CASE("Thread starts and joins", "[Execution][Thread]")
    {
        std::atomic<bool> ran {false};

        Thread          t;
        Thread::Options options {};
        options.name       = ThreadName("tether-thread");
        options.onDestruct = Thread::OnDestruct::Terminate;

        t.Start([&] { ran.store(true, std::memory_order_release); }, options);
        CHECK(t.IsJoinable());
        t.Join();
        CHECK_FALSE(t.IsJoinable());
        CHECK(ran.load(std::memory_order_acquire));
    }

    TEST_CASE("WorkerThread joins on destruction", "[Execution][Thread]")
    {
        std::atomic<bool> ran {false};
        {
            WorkerThread t([&] { ran.store(true, std::memory_order_release); });
        }
        CHECK(ran.load(std::memory_order_acquire));
    }

    TEST_CASE("Thread hands inheritable locals to the child", "[Execution][Thread]")
    {
        Locals::InheritableContextLocal<std::string> user {[] { return std::string("none"); }};
        Locals::ContextLocal<int>                    requestId {[] { return -1; }};
        ExecutionContext                             parent;
        ContextScope                                 scope(parent);

        user.Set("alice");
        requestId.Set(7);

        std::string seenUser;
        int         seenRequest = 0;
        bool        requestPresent = true;

        Thread::Options options {};
        options.inheritLocals = true;
        options.onDestruct    = Thread::OnDestruct::Join;

        Thread t([&] {
            seenUser       = user.Get();
            requestPresent = requestId.TryGet() != nullptr;
            seenRequest    = requestId.Get();
            user.Set("changed-by-child");
        },
                 options);

        // Changes after Start are not visible to the child.
        user.Set("bob");
        t.Join();

        CHECK(seenUser == "alice");
        CHECK_FALSE(requestPresent);
        CHECK(seenRequest == -1);
        CHECK(user.Get() == "bob");
    }

    TEST_CASE("Thread inheritance applies the carry-over transform", "[Execution][Thread]")
    {
        Locals::InheritableContextLocal<int> depth {[] { return 0; },
                                                    [](const int& parent) { return parent + 1; }};
        ExecutionContext                     parent;
        ContextScope                         scope(parent);
        depth.Set(3);

        int             seen = 0;
        Thread::Options options {};
        options.inheritLocals = true;
        {
            WorkerThread t([&] { seen = depth.Get(); }, options);
        }
        CHECK(seen == 4);
        CHECK(depth.Get() == 3);
    }

    TEST_CASE("Thread without inheritance starts empty", "[Execution][Thread]")
    {
        Locals::InheritableContextLocal<int> value {[] { return 0; }};
        ExecutionContext                     parent;
        ContextScope                         scope(parent);
        value.Set(5);

        bool            present = true;
        Thread::Options options {};
        options.inheritLocals = false;
        {
            WorkerThread t([&] { present = value.TryGet() != nullptr; }, options);
        }
        CHECK_FALSE(present);
    }
}// namespace Tether::Execution
