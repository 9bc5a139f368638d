/// @file Callable.cpp
/// @brief Tests for Tether::Utilities::Callable using Catch2
///
/// Covers default construction, invocation, small-buffer vs heap storage, move behavior,
/// move-only targets and destruction.

#include <Tether/Utilities/Callable.hpp>

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace
{
    int FreeFunction(int x)
    {
        return x * 2;
    }

    // Exceeds the inline buffer.
    struct LargeFunctor
    {
        alignas(std::max_align_t) char data[100];

        LargeFunctor()
        {
            data[0] = 5;
        }

        int operator()(int x) const
        {
            return x + static_cast<int>(data[0]);
        }
    };

    struct MoveOnlyCallable
    {
        std::unique_ptr<int> p;
        MoveOnlyCallable()
            : p(std::make_unique<int>(10)) {}

        MoveOnlyCallable(MoveOnlyCallable&&) noexcept            = default;
        MoveOnlyCallable& operator=(MoveOnlyCallable&&) noexcept = default;

        MoveOnlyCallable(const MoveOnlyCallable&)            = delete;
        MoveOnlyCallable& operator=(const MoveOnlyCallable&) = delete;

        int operator()() const
        {
            return *p;
        }
    };

    struct DtorCounter
    {
        static inline int count = 0;
        bool              m_moved = false;

        DtorCounter()                   = default;
        DtorCounter(const DtorCounter&) = default;
        DtorCounter(DtorCounter&& other) noexcept
        {
            other.m_moved = true;
        }
        ~DtorCounter()
        {
            if (!m_moved)
            {
                ++count;
            }
        }
        int operator()() const
        {
            return 1;
        }
    };
}// namespace

TEST_CASE("Tether::Utilities::Callable", "[Utilities][Callable]")
{
    using Tether::Utilities::Callable;

    STATIC_CHECK_FALSE(std::is_copy_constructible_v<Callable<void()>>);
    STATIC_CHECK(std::is_nothrow_move_constructible_v<Callable<void()>>);

    SECTION("DefaultConstructor")
    {
        Callable<int(int)> c;
        CHECK_FALSE(c);
        CHECK_THROWS_AS(c(5), std::bad_function_call);
    }

    SECTION("AssignFunctionPointer")
    {
        Callable<int(int)> c = FreeFunction;
        CHECK(c);
        CHECK(c(3) == 6);
    }

    SECTION("NullFunctionPointerIsEmpty")
    {
        int (*fn)(int) = nullptr;
        Callable<int(int)> c(fn);
        CHECK_FALSE(c);
    }

    SECTION("AssignSmallLambda")
    {
        auto               lambda = [](int x) { return x + 7; };
        Callable<int(int)> c(lambda);
        CHECK(c);
        CHECK(c(8) == 15);
    }

    SECTION("MoveConstructor_Small")
    {
        Callable<int(int)> source([](int x) { return x - 1; });
        Callable<int(int)> moved(std::move(source));

        CHECK(moved);
        CHECK(moved(10) == 9);
        CHECK_FALSE(source);
        CHECK_THROWS_AS(source(5), std::bad_function_call);
    }

    SECTION("AssignLargeFunctor")
    {
        LargeFunctor       lf;
        Callable<int(int)> c = lf;
        CHECK(c);
        CHECK(c(10) == 15);
    }

    SECTION("MoveConstructor_Large")
    {
        LargeFunctor       lf;
        Callable<int(int)> source(lf);
        const int          before = source(2);
        Callable<int(int)> moved(std::move(source));

        CHECK(moved);
        CHECK(moved(2) == before);
        CHECK_THROWS_AS(source(1), std::bad_function_call);
    }

    SECTION("MoveAssignment_Large")
    {
        LargeFunctor lfA;
        LargeFunctor lfB;
        lfB.data[0] = 2;

        Callable<int(int)> a(lfA);
        Callable<int(int)> b(lfB);
        CHECK(a(1) == 6);
        CHECK(b(1) == 3);

        a = std::move(b);
        CHECK(a(1) == 3);
        CHECK_FALSE(b);
    }

    SECTION("MoveOnlyTarget")
    {
        Callable<int()> c(MoveOnlyCallable {});
        CHECK(c() == 10);

        Callable<int()> moved(std::move(c));
        CHECK(moved() == 10);
        CHECK_THROWS_AS(c(), std::bad_function_call);
    }

    SECTION("MoveOnlyCapture")
    {
        auto             owned = std::make_unique<std::string>("captured");
        Callable<std::string()> c([p = std::move(owned)] { return *p; });
        CHECK(c() == "captured");
    }

    SECTION("SelfAssignment_Move")
    {
        Callable<int(int)> c = [](int x) { return x + 4; };
        auto&              alias = c;
        c                        = std::move(alias);
        CHECK(c);
        CHECK(c(5) == 9);
    }

    SECTION("AssignNullToNonEmpty")
    {
        Callable<int(int)> c = FreeFunction;
        c                    = nullptr;
        CHECK_FALSE(c);
        CHECK_THROWS_AS(c(1), std::bad_function_call);
    }

    SECTION("VoidReturnType")
    {
        bool             called = false;
        Callable<void()> c      = [&] { called = true; };
        c();
        CHECK(called);

        c.Reset();
        CHECK_FALSE(c);
    }

    SECTION("MultipleArgumentsAndRefForwarding")
    {
        Callable<std::string(const std::string&, int, char)> c =
                [](const std::string& s, int n, char ch) {
                    return s + ":" + std::to_string(n) + ch;
                };

        const std::string base = "base";
        CHECK(c(base, 42, 'X') == "base:42X");
    }

    SECTION("StatefulLambdaByReferenceCapture")
    {
        int                value = 7;
        Callable<int(int)> c([&value](int x) { return x + value; });
        CHECK(c(3) == 10);
        value = 21;
        CHECK(c(3) == 24);
    }

    SECTION("DestructionSemantics")
    {
        DtorCounter::count = 0;
        {
            Callable<int()> c(DtorCounter {});
            CHECK(c() == 1);
            Callable<int()> moved(std::move(c));
            CHECK(moved() == 1);
        }
        CHECK(DtorCounter::count == 1);
    }
}
