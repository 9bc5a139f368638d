/// @file Token.hpp
/// @brief Identity key for context-local slots.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Locals/LocalValue.hpp>
#include <Tether/Memory/SmartPointers.hpp>
#include <Tether/Primitives.hpp>
#include <Tether/Utilities/Callable.hpp>

#include <utility>

namespace Tether::Locals
{
    /// @brief State shared by every copy of a `Token`.
    struct TokenState final
    {
        using Initializer = Utilities::Callable<LocalValue()>;
        using CarryOver   = Utilities::Callable<LocalValue(const LocalValue&)>;

        TokenState(UInt32 hash, Initializer init, CarryOver carry) noexcept
            : hashCode(hash), initializer(std::move(init)), carryOver(std::move(carry))
        {
        }

        const UInt32 hashCode;
        Initializer  initializer;
        CarryOver    carryOver;
    };

    /// @brief Non-owning reference to a token, as held by store slots.
    using WeakToken = Memory::Ticket<TokenState>;

    /// @brief Opaque identity of one context-local variable.
    ///
    /// Copies of a token share state; the token dies when the last copy is released. Stores only
    /// hold `WeakToken`s, so a dead token's entries become reclaimable without the store being told.
    ///
    /// The hash code comes from a process-wide counter advanced by `HashIncrement`. Consecutive
    /// codes spread evenly over any power-of-two table, which keeps probe runs short when the
    /// tokens a context uses were created close together.
    class TETHER_API Token final
    {
    public:
        using Initializer = TokenState::Initializer;
        using CarryOver   = TokenState::CarryOver;

        static constexpr UInt32 HashIncrement = 0x61c88647u;

        /// @brief Null token. Every store operation rejects it.
        Token() noexcept = default;

        /// @brief Creates a fresh token.
        /// @param initializer Produces the value on first access in a context. Empty: first access yields
        ///        an empty `LocalValue`.
        /// @param carryOver Transforms a parent value when a store is propagated. Empty: `LocalValue::Clone`.
        [[nodiscard]] static Token Create(Initializer initializer = {}, CarryOver carryOver = {});

        /// @brief Strong token for a slot's weak reference; null if the token died.
        [[nodiscard]] static Token FromWeak(const WeakToken& weak) noexcept;

        [[nodiscard]] static UInt32 NextHashCode() noexcept;

        explicit operator bool() const noexcept { return static_cast<bool>(m_state); }

        [[nodiscard]] UInt32 HashCode() const noexcept { return m_state ? m_state->hashCode : 0u; }

        [[nodiscard]] bool HasInitializer() const noexcept
        {
            return m_state && static_cast<bool>(m_state->initializer);
        }

        /// @brief Runs the initializer, or returns an empty value when there is none.
        [[nodiscard]] LocalValue Initialize() const;

        /// @brief Value a child context receives for `parent`.
        [[nodiscard]] LocalValue CarryOverValue(const LocalValue& parent) const;

        [[nodiscard]] WeakToken Weak() const noexcept { return Memory::MakeTicket(m_state); }

        /// @brief True if `weak` was taken from this token (or a copy of it).
        [[nodiscard]] bool Matches(const WeakToken& weak) const noexcept { return weak.Refers(m_state); }

        [[nodiscard]] bool operator==(const Token& other) const noexcept { return m_state == other.m_state; }

        /// @brief Drops this owner. The token dies once every copy is reset or destroyed.
        void Reset() noexcept { m_state.Reset(); }

    private:
        explicit Token(Memory::Shared<TokenState> state) noexcept : m_state(std::move(state)) {}

        void RequireState_(const char* operation) const;

        Memory::Shared<TokenState> m_state {};
    };
}// namespace Tether::Locals
