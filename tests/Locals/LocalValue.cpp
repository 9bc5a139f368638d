/// @file LocalValue.cpp
/// @brief Tests for Tether::Locals::LocalValue.

#include <Tether/Exceptions/NotSupportedException.hpp>
#include <Tether/Locals/LocalValue.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <typeinfo>
#include <utility>

namespace Tether::Locals
{
    namespace
    {
        struct Counted
        {
            static inline int live = 0;

            std::string text;

            explicit Counted(std::string t)
                : text(std::move(t)) { ++live; }
            Counted(const Counted& other)
                : text(other.text) { ++live; }
            ~Counted() { --live; }
        };
    }// namespace

    TEST_CASE("LocalValue default is empty", "[Locals][LocalValue]")
    {
        LocalValue value;
        CHECK_FALSE(value.HasValue());
        CHECK(value.IsCopyable());
        CHECK_FALSE(value.Holds<int>());
        CHECK(value.TryCast<int>() == nullptr);
        CHECK_THROWS_AS(value.Cast<int>(), std::bad_cast);
        CHECK_FALSE(value.Clone().HasValue());
    }

    TEST_CASE("LocalValue typed access", "[Locals][LocalValue]")
    {
        LocalValue value = LocalValue::From(std::string("trace-1"));
        CHECK(value.HasValue());
        CHECK(value.Holds<std::string>());
        CHECK_FALSE(value.Holds<int>());
        CHECK(value.Cast<std::string>() == "trace-1");
        CHECK(value.TryCast<int>() == nullptr);
        CHECK_THROWS_AS(value.Cast<int>(), std::bad_cast);

        value.Cast<std::string>() += "-x";
        const LocalValue& view = value;
        CHECK(view.Cast<std::string>() == "trace-1-x");
    }

    TEST_CASE("LocalValue owns its object", "[Locals][LocalValue]")
    {
        Counted::live = 0;
        {
            LocalValue value = LocalValue::Make<Counted>("a");
            CHECK(Counted::live == 1);

            LocalValue moved = std::move(value);
            CHECK_FALSE(value.HasValue());
            CHECK(Counted::live == 1);

            moved = LocalValue::Make<Counted>("b");
            CHECK(Counted::live == 1);
            CHECK(moved.Cast<Counted>().text == "b");

            moved.Reset();
            CHECK(Counted::live == 0);
            CHECK_FALSE(moved.HasValue());

            moved = LocalValue::Make<Counted>("c");
        }
        CHECK(Counted::live == 0);
    }

    TEST_CASE("LocalValue clone is a deep copy", "[Locals][LocalValue]")
    {
        Counted::live = 0;
        {
            LocalValue original = LocalValue::Make<Counted>("x");
            LocalValue copy     = original.Clone();
            CHECK(Counted::live == 2);
            CHECK(&copy.Cast<Counted>() != &original.Cast<Counted>());

            copy.Cast<Counted>().text = "y";
            CHECK(original.Cast<Counted>().text == "x");
        }
        CHECK(Counted::live == 0);
    }

    TEST_CASE("LocalValue of a move-only type cannot be cloned", "[Locals][LocalValue]")
    {
        LocalValue value = LocalValue::Make<std::unique_ptr<int>>(std::make_unique<int>(3));
        CHECK_FALSE(value.IsCopyable());
        CHECK(*value.Cast<std::unique_ptr<int>>() == 3);
        CHECK_THROWS_AS(value.Clone(), Exceptions::NotSupportedException);
    }
}// namespace Tether::Locals
