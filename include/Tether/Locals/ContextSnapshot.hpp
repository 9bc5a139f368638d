/// @file ContextSnapshot.hpp
/// @brief Captured context-local values that can be applied around work on another context.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Locals/LocalValue.hpp>
#include <Tether/Locals/Token.hpp>
#include <Tether/Primitives.hpp>

#include <span>
#include <vector>

namespace Tether::Locals
{
    /// @brief Copy of selected context-local values, taken on one context and applied on another.
    ///
    /// Typical use is handing request state (a user, a trace id) from the submitting thread to a
    /// pool worker: capture on submit, `Apply` on the worker around the job. `Apply` returns a
    /// `Scope` that puts the worker's own values back when it is destroyed, whether the job
    /// returned or threw.
    ///
    /// Tokens are held weakly; a token that died after capture is skipped. The snapshot owns copies
    /// of the values and can be applied any number of times.
    class TETHER_API ContextSnapshot final
    {
    public:
        /// @brief Restores what an `Apply` displaced. Restoration happens in reverse apply order.
        ///
        /// The scope keeps a plain pointer to the context it was applied to: that context must
        /// outlive it, and it must be destroyed (or `Restore`d) on the thread running as that context.
        class TETHER_API Scope final
        {
        public:
            Scope() noexcept = default;
            Scope(Scope&& other) noexcept;
            Scope& operator=(Scope&& other) noexcept;
            ~Scope() { Restore(); }

            Scope(const Scope&)            = delete;
            Scope& operator=(const Scope&) = delete;

            /// @brief Restores now instead of at destruction. Later calls do nothing.
            void Restore() noexcept;

            [[nodiscard]] bool Active() const noexcept { return m_context != nullptr; }

        private:
            friend class ContextSnapshot;

            struct Backup
            {
                WeakToken            token {};
                Execution::StoreKind kind {Execution::StoreKind::Primary};
                bool                 present {false};
                LocalValue           value {};
            };

            Execution::ExecutionContext* m_context {nullptr};
            std::vector<Backup>          m_backups {};
        };

        ContextSnapshot() noexcept = default;

        ContextSnapshot(ContextSnapshot&&) noexcept            = default;
        ContextSnapshot& operator=(ContextSnapshot&&) noexcept = default;
        ContextSnapshot(const ContextSnapshot&)                = delete;
        ContextSnapshot& operator=(const ContextSnapshot&)     = delete;

        /// @brief Records, for each token, its value in the `kind` store of `context` or its absence.
        /// @throws Exceptions::InvalidArgumentException for a null token.
        /// @throws Exceptions::NotSupportedException if a captured value is not copyable.
        [[nodiscard]] static ContextSnapshot Capture(Execution::ExecutionContext& context,
                                                     std::span<const Token> tokens,
                                                     Execution::StoreKind kind);

        /// @brief Records every live entry of both stores of `context` whose value is copyable.
        ///
        /// Move-only values are left out; they stay with the context that owns them.
        [[nodiscard]] static ContextSnapshot CaptureAll(const Execution::ExecutionContext& context);

        /// @brief Captures the values of the given `ContextLocal`s, each from its own store.
        template<class... Locals>
        [[nodiscard]] static ContextSnapshot CaptureLocals(Execution::ExecutionContext& context, const Locals&... locals)
        {
            ContextSnapshot snapshot;
            snapshot.m_entries.reserve(sizeof...(Locals));
            (snapshot.CaptureToken_(context, locals.GetToken(), locals.GetKind()), ...);
            return snapshot;
        }

        /// @brief Installs the captured values into `context` (absent ones are removed there).
        ///
        /// If installing fails part way, what was already installed is restored before the
        /// exception propagates. The returned scope is bound to `context` (see `Scope`).
        [[nodiscard]] Scope Apply(Execution::ExecutionContext& context) const;

        [[nodiscard]] UIntSize Size() const noexcept { return m_entries.size(); }
        [[nodiscard]] bool     Empty() const noexcept { return m_entries.empty(); }

    private:
        struct Entry
        {
            WeakToken            token {};
            Execution::StoreKind kind {Execution::StoreKind::Primary};
            bool                 present {false};
            LocalValue           value {};
        };

        void CaptureToken_(Execution::ExecutionContext& context, const Token& token, Execution::StoreKind kind);

        std::vector<Entry> m_entries {};
    };
}// namespace Tether::Locals
