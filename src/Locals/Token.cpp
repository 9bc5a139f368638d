#include <Tether/Locals/Token.hpp>

#include <Tether/Exceptions/InvalidArgumentException.hpp>

#include <atomic>
#include <string>

namespace Tether::Locals
{
    namespace
    {
        std::atomic<UInt32> g_nextHashCode {0};
    }// namespace

    UInt32 Token::NextHashCode() noexcept
    {
        return g_nextHashCode.fetch_add(HashIncrement, std::memory_order_relaxed);
    }

    Token Token::Create(Initializer initializer, CarryOver carryOver)
    {
        return Token(Memory::MakeShared<TokenState>(NextHashCode(), std::move(initializer), std::move(carryOver)));
    }

    Token Token::FromWeak(const WeakToken& weak) noexcept
    {
        return Token(weak.Lock());
    }

    LocalValue Token::Initialize() const
    {
        RequireState_("Token::Initialize");
        if (!m_state->initializer)
            return {};
        return m_state->initializer();
    }

    LocalValue Token::CarryOverValue(const LocalValue& parent) const
    {
        RequireState_("Token::CarryOverValue");
        if (!m_state->carryOver)
            return parent.Clone();
        return m_state->carryOver(parent);
    }

    void Token::RequireState_(const char* operation) const
    {
        if (!m_state)
            throw Exceptions::InvalidArgumentException(std::string(operation) + ": null token");
    }
}// namespace Tether::Locals
