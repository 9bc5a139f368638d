#include <Tether/Locals/ContextSnapshot.hpp>

#include <Tether/Exceptions/InvalidArgumentException.hpp>

#include <initializer_list>
#include <utility>

namespace Tether::Locals
{
    using Execution::ExecutionContext;
    using Execution::StoreKind;

    ContextSnapshot::Scope::Scope(Scope&& other) noexcept
        : m_context(std::exchange(other.m_context, nullptr)),
          m_backups(std::move(other.m_backups))
    {
    }

    ContextSnapshot::Scope& ContextSnapshot::Scope::operator=(Scope&& other) noexcept
    {
        if (this != &other)
        {
            Restore();
            m_context = std::exchange(other.m_context, nullptr);
            m_backups = std::move(other.m_backups);
        }
        return *this;
    }

    void ContextSnapshot::Scope::Restore() noexcept
    {
        ExecutionContext* context = std::exchange(m_context, nullptr);
        if (!context)
            return;

        for (auto it = m_backups.rbegin(); it != m_backups.rend(); ++it)
        {
            const Token token = Token::FromWeak(it->token);
            if (!token)
                continue;

            if (it->present)
            {
                context->EnsureStore(it->kind).Set(token, std::move(it->value));
            }
            else if (auto* store = context->FindStore(it->kind))
            {
                store->Remove(token);
            }
        }
        m_backups.clear();
    }

    ContextSnapshot ContextSnapshot::Capture(ExecutionContext& context, std::span<const Token> tokens, StoreKind kind)
    {
        ContextSnapshot snapshot;
        snapshot.m_entries.reserve(tokens.size());
        for (const Token& token: tokens)
            snapshot.CaptureToken_(context, token, kind);
        return snapshot;
    }

    ContextSnapshot ContextSnapshot::CaptureAll(const ExecutionContext& context)
    {
        ContextSnapshot snapshot;
        for (StoreKind kind: {StoreKind::Primary, StoreKind::Inheritable})
        {
            const auto* store = context.FindStore(kind);
            if (!store)
                continue;
            store->ForEachLive([&](const Token& token, const LocalValue& value) {
                if (!value.IsCopyable())
                    return;
                snapshot.m_entries.push_back(Entry {token.Weak(), kind, true, value.Clone()});
            });
        }
        return snapshot;
    }

    void ContextSnapshot::CaptureToken_(ExecutionContext& context, const Token& token, StoreKind kind)
    {
        if (!token)
            throw Exceptions::InvalidArgumentException("ContextSnapshot::Capture: null token");

        Entry entry {token.Weak(), kind, false, {}};
        if (auto* store = context.FindStore(kind))
        {
            if (const LocalValue* value = store->Find(token))
            {
                entry.present = true;
                entry.value   = value->Clone();
            }
        }
        m_entries.push_back(std::move(entry));
    }

    ContextSnapshot::Scope ContextSnapshot::Apply(ExecutionContext& context) const
    {
        // A throw below unwinds `scope`, which restores the entries installed so far.
        Scope scope;
        scope.m_context = &context;
        scope.m_backups.reserve(m_entries.size());

        for (const Entry& entry: m_entries)
        {
            const Token token = Token::FromWeak(entry.token);
            if (!token)
                continue;

            LocalValue incoming = entry.value.Clone();
            auto*      store    = entry.present ? &context.EnsureStore(entry.kind) : context.FindStore(entry.kind);
            if (!store)
                continue;

            Scope::Backup backup {entry.token, entry.kind, false, {}};
            if (LocalValue* current = store->Find(token))
            {
                backup.present = true;
                backup.value   = std::move(*current);
            }
            scope.m_backups.push_back(std::move(backup));

            if (entry.present)
                store->Set(token, std::move(incoming));
            else
                store->Remove(token);
        }
        return scope;
    }
}// namespace Tether::Locals
