/// @file ExecutionContext.hpp
/// @brief Owner of the local stores of one thread, fiber or task.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Locals/LocalStore.hpp>
#include <Tether/Memory/SmartPointers.hpp>
#include <Tether/Primitives.hpp>

namespace Tether::Execution
{
    enum class StoreKind : UInt8
    {
        Primary,
        Inheritable,
    };

    /// @brief Binds one primary and one inheritable `LocalStore` to an execution context.
    ///
    /// Every thread owns an implicit context, destroyed with the thread. Code that multiplexes
    /// several logical contexts on one thread (fibers, tasks) creates its own `ExecutionContext`
    /// objects and installs them around the work with `ContextScope`.
    ///
    /// Stores are created on first use. A context is only ever used by the code currently running
    /// as that context; propagating or capturing it while it is mutated elsewhere is undefined.
    class TETHER_API ExecutionContext final
    {
    public:
        using Store = Locals::LocalStore;

        ExecutionContext() noexcept = default;
        ~ExecutionContext() { Reset(); }

        ExecutionContext(const ExecutionContext&)            = delete;
        ExecutionContext& operator=(const ExecutionContext&) = delete;
        ExecutionContext(ExecutionContext&&)                 = delete;
        ExecutionContext& operator=(ExecutionContext&&)      = delete;

        /// @brief Context installed by the innermost live `ContextScope` on this thread, else the
        /// thread's own context.
        [[nodiscard]] static ExecutionContext& Current() noexcept;

        /// @brief Store of `kind`, created empty on first use.
        Store& EnsureStore(StoreKind kind);

        [[nodiscard]] Store*       FindStore(StoreKind kind) noexcept { return StoreFor_(kind).Get(); }
        [[nodiscard]] const Store* FindStore(StoreKind kind) const noexcept { return StoreFor_(kind).Get(); }

        /// @brief Independent copy of the inheritable store for a child context, with each
        /// token's carry-over applied. Null when this context has no inheritable store.
        [[nodiscard]] Memory::Scoped<Store> SnapshotInheritable() const;

        /// @brief Replaces the inheritable store (destroying the previous one).
        void AdoptInheritable(Memory::Scoped<Store> store) noexcept;

        void InheritFrom(const ExecutionContext& parent);

        /// @brief Destroys both stores and every value in them.
        void Reset() noexcept;

    private:
        [[nodiscard]] Memory::Scoped<Store>& StoreFor_(StoreKind kind) noexcept
        {
            return kind == StoreKind::Primary ? m_primary : m_inheritable;
        }

        [[nodiscard]] const Memory::Scoped<Store>& StoreFor_(StoreKind kind) const noexcept
        {
            return kind == StoreKind::Primary ? m_primary : m_inheritable;
        }

        Memory::Scoped<Store> m_primary {};
        Memory::Scoped<Store> m_inheritable {};
    };

    /// @brief Installs a context as `ExecutionContext::Current()` for the calling thread.
    ///
    /// Scopes nest; destruction restores the previously current context. A scope must be destroyed
    /// on the thread that created it.
    class TETHER_API ContextScope final
    {
    public:
        explicit ContextScope(ExecutionContext& context) noexcept;
        ~ContextScope();

        ContextScope(const ContextScope&)            = delete;
        ContextScope& operator=(const ContextScope&) = delete;

    private:
        ExecutionContext* m_previous {nullptr};
    };
}// namespace Tether::Execution
