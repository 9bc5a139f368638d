/// @file ContextCarried.hpp
/// @brief Callable wrapper that runs its target with the submitter's context-local values.
#pragma once

#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Locals/ContextSnapshot.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace Tether::Execution
{
    /// @brief Holds a callable and a `ContextSnapshot`; every invocation applies the snapshot to
    /// `ExecutionContext::Current()` for the duration of the call.
    template<typename F>
    class ContextCarried final
    {
    public:
        ContextCarried(F fn, Locals::ContextSnapshot snapshot)
            : m_fn(std::move(fn)), m_snapshot(std::move(snapshot))
        {
        }

        template<typename... Args>
        decltype(auto) operator()(Args&&... args)
        {
            auto scope = m_snapshot.Apply(ExecutionContext::Current());
            return std::invoke(m_fn, std::forward<Args>(args)...);
        }

        [[nodiscard]] F&                             Unwrap() noexcept { return m_fn; }
        [[nodiscard]] const F&                       Unwrap() const noexcept { return m_fn; }
        [[nodiscard]] const Locals::ContextSnapshot& Snapshot() const noexcept { return m_snapshot; }

    private:
        F                       m_fn;
        Locals::ContextSnapshot m_snapshot;
    };

    template<typename T>
    struct IsContextCarried : std::false_type
    {
    };

    template<typename F>
    struct IsContextCarried<ContextCarried<F>> : std::true_type
    {
    };

    /// @brief Wraps `fn` with a snapshot of every copyable value of the current context; move-only
    /// values are not carried. An already carried callable is returned as is.
    template<typename F>
    [[nodiscard]] auto CarryContext(F fn)
    {
        if constexpr (IsContextCarried<F>::value)
            return fn;
        else
            return ContextCarried<F>(std::move(fn), Locals::ContextSnapshot::CaptureAll(ExecutionContext::Current()));
    }

    template<typename F>
    [[nodiscard]] ContextCarried<F> CarryContext(F fn, Locals::ContextSnapshot snapshot)
    {
        return ContextCarried<F>(std::move(fn), std::move(snapshot));
    }
}// namespace Tether::Execution
