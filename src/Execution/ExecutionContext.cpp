#include <Tether/Execution/ExecutionContext.hpp>

#include <utility>

namespace Tether::Execution
{
    namespace
    {
        thread_local ExecutionContext  t_threadContext {};
        thread_local ExecutionContext* t_installed {nullptr};
    }// namespace

    ExecutionContext& ExecutionContext::Current() noexcept
    {
        return t_installed ? *t_installed : t_threadContext;
    }

    ExecutionContext::Store& ExecutionContext::EnsureStore(StoreKind kind)
    {
        auto& store = StoreFor_(kind);
        if (!store)
            store = Memory::MakeScoped<Store>();
        return *store;
    }

    Memory::Scoped<ExecutionContext::Store> ExecutionContext::SnapshotInheritable() const
    {
        if (!m_inheritable)
            return {};
        return Memory::MakeScoped<Store>(Store::Propagate(*m_inheritable));
    }

    void ExecutionContext::AdoptInheritable(Memory::Scoped<Store> store) noexcept
    {
        m_inheritable = std::move(store);
    }

    void ExecutionContext::InheritFrom(const ExecutionContext& parent)
    {
        AdoptInheritable(parent.SnapshotInheritable());
    }

    void ExecutionContext::Reset() noexcept
    {
        m_primary.Reset();
        m_inheritable.Reset();
    }

    ContextScope::ContextScope(ExecutionContext& context) noexcept
        : m_previous(std::exchange(t_installed, &context))
    {
    }

    ContextScope::~ContextScope()
    {
        t_installed = m_previous;
    }
}// namespace Tether::Execution
