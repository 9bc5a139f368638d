/// @file Token.cpp
/// @brief Tests for Tether::Locals::Token.

#include <Tether/Exceptions/InvalidArgumentException.hpp>
#include <Tether/Locals/Token.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <set>
#include <vector>

namespace Tether::Locals
{
    TEST_CASE("Token identity", "[Locals][Token]")
    {
        Token a = Token::Create();
        Token b = Token::Create();
        Token copy = a;

        CHECK(a);
        CHECK(a == copy);
        CHECK_FALSE(a == b);
        CHECK(a.HashCode() == copy.HashCode());
        CHECK(a.Matches(copy.Weak()));
        CHECK_FALSE(b.Matches(a.Weak()));

        Token null;
        CHECK_FALSE(null);
        CHECK_FALSE(null.Matches(a.Weak()));
    }

    TEST_CASE("Token hash codes advance by the fixed increment", "[Locals][Token]")
    {
        Token first  = Token::Create();
        Token second = Token::Create();
        Token third  = Token::Create();

        CHECK(static_cast<Tether::UInt32>(second.HashCode() - first.HashCode()) == Token::HashIncrement);
        CHECK(static_cast<Tether::UInt32>(third.HashCode() - second.HashCode()) == Token::HashIncrement);
    }

    TEST_CASE("Consecutive tokens occupy distinct home slots", "[Locals][Token]")
    {
        for (std::size_t capacity: {16U, 32U, 64U, 1024U})
        {
            std::vector<Token>    tokens;
            std::set<std::size_t> indices;
            for (std::size_t i = 0; i < capacity; ++i)
            {
                tokens.push_back(Token::Create());
                indices.insert(tokens.back().HashCode() & (capacity - 1));
            }
            CHECK(indices.size() == capacity);
        }
    }

    TEST_CASE("Token dies with its last owner", "[Locals][Token]")
    {
        Token a    = Token::Create();
        auto  weak = a.Weak();
        Token copy = a;

        a.Reset();
        CHECK_FALSE(weak.Expired());
        CHECK(Token::FromWeak(weak) == copy);

        copy.Reset();
        CHECK(weak.Expired());
        CHECK_FALSE(Token::FromWeak(weak));
    }

    TEST_CASE("Token initializer and carry-over", "[Locals][Token]")
    {
        Token plain = Token::Create();
        CHECK_FALSE(plain.HasInitializer());
        CHECK_FALSE(plain.Initialize().HasValue());

        LocalValue parent = LocalValue::From(21);
        CHECK(plain.CarryOverValue(parent).Cast<int>() == 21);

        Token custom = Token::Create([] { return LocalValue::From(7); },
                                     [](const LocalValue& value) { return LocalValue::From(value.Cast<int>() * 2); });
        CHECK(custom.HasInitializer());
        CHECK(custom.Initialize().Cast<int>() == 7);
        CHECK(custom.CarryOverValue(parent).Cast<int>() == 42);
        CHECK(parent.Cast<int>() == 21);
    }

    TEST_CASE("Null token rejects value operations", "[Locals][Token]")
    {
        Token null;
        CHECK(null.HashCode() == 0U);
        CHECK_FALSE(null.HasInitializer());
        CHECK_THROWS_AS((void) null.Initialize(), Exceptions::InvalidArgumentException);
        CHECK_THROWS_AS((void) null.CarryOverValue(LocalValue {}), Exceptions::InvalidArgumentException);
    }
}// namespace Tether::Locals
