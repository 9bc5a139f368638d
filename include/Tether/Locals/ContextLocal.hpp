/// @file ContextLocal.hpp
/// @brief Typed handles to a per-context value.
#pragma once

#include <Tether/Exceptions/InvalidArgumentException.hpp>
#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Locals/LocalValue.hpp>
#include <Tether/Locals/Token.hpp>
#include <Tether/Utilities/Callable.hpp>

#include <concepts>
#include <utility>

namespace Tether::Locals
{
    /// @brief Variable with one independent value per execution context.
    ///
    /// Values live in the primary store of the context they are accessed through, by default
    /// `ExecutionContext::Current()`. The first `Get` in a context runs the initializer.
    ///
    /// Destroying the handle kills its token: entries it left in any context become reclaimable
    /// and are destroyed the next time that context's store walks over them.
    ///
    /// \code
    /// Tether::Locals::ContextLocal<int> counter {[] { return 0; }};
    /// ++counter.Get();
    /// \endcode
    template<typename T>
    class ContextLocal
    {
    public:
        using ValueType   = T;
        using Initializer = Utilities::Callable<T()>;

        /// @brief Initial value `T{}`.
        ContextLocal()
            requires std::default_initializable<T>
            : ContextLocal(Initializer([] { return T {}; }))
        {
        }

        /// @throws Exceptions::InvalidArgumentException if `initializer` is empty.
        explicit ContextLocal(Initializer initializer)
            : ContextLocal(Execution::StoreKind::Primary, std::move(initializer), {})
        {
        }

        ContextLocal(const ContextLocal&)            = delete;
        ContextLocal& operator=(const ContextLocal&) = delete;
        ContextLocal(ContextLocal&&)                 = delete;
        ContextLocal& operator=(ContextLocal&&)      = delete;

        ~ContextLocal() = default;

        /// @brief Value in the current context, initialized on first access.
        [[nodiscard]] T& Get() { return Get(Execution::ExecutionContext::Current()); }

        [[nodiscard]] T& Get(Execution::ExecutionContext& context)
        {
            return context.EnsureStore(m_kind).GetOrInitialize(m_token).template Cast<T>();
        }

        /// @brief Value in the current context, or nullptr. Never initializes and never creates a store.
        [[nodiscard]] T* TryGet() { return TryGet(Execution::ExecutionContext::Current()); }

        [[nodiscard]] T* TryGet(Execution::ExecutionContext& context)
        {
            auto* store = context.FindStore(m_kind);
            if (!store)
                return nullptr;
            LocalValue* value = store->Find(m_token);
            return value ? value->template TryCast<T>() : nullptr;
        }

        void Set(T value) { Set(Execution::ExecutionContext::Current(), std::move(value)); }

        void Set(Execution::ExecutionContext& context, T value)
        {
            context.EnsureStore(m_kind).Set(m_token, LocalValue::Make<T>(std::move(value)));
        }

        /// @brief Drops the value; the next `Get` runs the initializer again.
        bool Remove() { return Remove(Execution::ExecutionContext::Current()); }

        bool Remove(Execution::ExecutionContext& context)
        {
            auto* store = context.FindStore(m_kind);
            return store ? store->Remove(m_token) : false;
        }

        [[nodiscard]] const Token&         GetToken() const noexcept { return m_token; }
        [[nodiscard]] Execution::StoreKind GetKind() const noexcept { return m_kind; }

    protected:
        ContextLocal(Execution::StoreKind kind, Initializer initializer, Token::CarryOver carryOver)
            : m_kind(kind), m_token(MakeToken_(std::move(initializer), std::move(carryOver)))
        {
        }

    private:
        static Token MakeToken_(Initializer initializer, Token::CarryOver carryOver)
        {
            if (!initializer)
                throw Exceptions::InvalidArgumentException("ContextLocal: empty initializer");

            return Token::Create(
                    [init = std::move(initializer)]() { return LocalValue::Make<T>(init()); },
                    std::move(carryOver));
        }

        Execution::StoreKind m_kind;
        Token                m_token;
    };

    /// @brief `ContextLocal` whose values are copied into child contexts when they are created.
    ///
    /// A child (a thread started with `Thread::Options::inheritLocals`, or a context that calls
    /// `ExecutionContext::InheritFrom`) starts with `transform(parentValue)`, by default a copy.
    /// Later changes on either side stay invisible to the other.
    template<typename T>
    class InheritableContextLocal : public ContextLocal<T>
    {
    public:
        using Initializer = typename ContextLocal<T>::Initializer;
        using Transform   = Utilities::Callable<T(const T&)>;

        InheritableContextLocal()
            requires std::default_initializable<T>
            : InheritableContextLocal(Initializer([] { return T {}; }))
        {
        }

        /// @param transform Value a child receives for the parent's value. Empty: copy.
        explicit InheritableContextLocal(Initializer initializer, Transform transform = {})
            : ContextLocal<T>(Execution::StoreKind::Inheritable, std::move(initializer), MakeCarryOver_(std::move(transform)))
        {
        }

    private:
        static Token::CarryOver MakeCarryOver_(Transform transform)
        {
            if (!transform)
                return {};
            return [fn = std::move(transform)](const LocalValue& parent) {
                return LocalValue::Make<T>(fn(parent.Cast<T>()));
            };
        }
    };
}// namespace Tether::Locals
