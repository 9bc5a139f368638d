/// @file Callable.hpp
/// @brief Move-only type-erased callable with small-buffer optimization.
#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace Tether::Utilities
{
    /// \brief Move-only type-erased callable wrapper with small-buffer optimization (SBO).
    ///
    /// Stores any callable object (function pointer, lambda, functor) matching a signature. Objects
    /// that fit the inline buffer and are nothrow-move-constructible live inline; anything else is
    /// heap allocated. Move-only targets (lambdas owning a snapshot, a `Scoped` store, ...) are
    /// accepted. Invoking an empty Callable throws `std::bad_function_call`.
    ///
    /// @tparam Signature Function signature, e.g. R(Args...)
    template<typename Signature>
    class Callable;

    template<typename R, typename... Args>
    class Callable<R(Args...)>
    {
    public:
        Callable() noexcept = default;
        Callable(std::nullptr_t) noexcept {}

        /// \brief Constructs a Callable from any compatible callable object.
        template<
                typename F,
                typename = std::enable_if_t<
                        std::is_invocable_r_v<R, std::decay_t<F>&, Args...> &&
                        !std::is_same_v<std::decay_t<F>, Callable> &&
                        !std::is_same_v<std::decay_t<F>, std::nullptr_t>>>
        Callable(F&& f)
        {
            Init(std::forward<F>(f));
        }

        Callable(const Callable&)            = delete;
        Callable& operator=(const Callable&) = delete;

        Callable(Callable&& other) noexcept
        {
            MoveFrom(std::move(other));
        }

        Callable& operator=(Callable&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                MoveFrom(std::move(other));
            }
            return *this;
        }

        Callable& operator=(std::nullptr_t) noexcept
        {
            Reset();
            return *this;
        }

        ~Callable()
        {
            Reset();
        }

        /// \brief Invokes the stored callable. Throws std::bad_function_call if empty.
        auto operator()(Args... args) const -> R
        {
            if (!m_vtable)
            {
                throw std::bad_function_call();
            }
            return m_vtable->invoke(const_cast<void*>(GetPtr()), std::forward<Args>(args)...);
        }

        explicit operator bool() const noexcept
        {
            return m_vtable != nullptr;
        }

        void Reset() noexcept
        {
            if (m_vtable)
            {
                m_vtable->destroy(GetPtr());
            }
            m_vtable    = nullptr;
            m_usingHeap = false;
        }

    private:
        static constexpr std::size_t BUFFER_SIZE = sizeof(void*) * 4;
        static constexpr std::size_t ALIGNMENT   = alignof(std::max_align_t);

        using InvokeFn  = R (*)(void*, Args&&...);
        using MoveFn    = void (*)(void* dest, void* src) noexcept;
        using DestroyFn = void (*)(void* storagePtr) noexcept;

        struct VTable
        {
            InvokeFn  invoke;
            MoveFn    move;
            DestroyFn destroy;
        };

        template<typename T, bool IsHeap>
        struct VTableFor
        {
            static auto Invoke(void* ptr, Args&&... args) -> R
            {
                auto* obj = static_cast<T*>(ptr);
                return std::invoke(*obj, std::forward<Args>(args)...);
            }

            // Only used for inline targets, which are nothrow-move-constructible.
            static void Move(void* dest, void* src) noexcept
            {
                if constexpr (!IsHeap)
                {
                    ::new (dest) T(std::move(*static_cast<T*>(src)));
                }
                else
                {
                    (void) dest;
                    (void) src;
                    std::terminate();
                }
            }

            static void Destroy(void* ptr) noexcept
            {
                auto* obj = static_cast<T*>(ptr);
                if constexpr (!std::is_trivially_destructible_v<T>)
                {
                    obj->~T();
                }
                if constexpr (IsHeap)
                {
                    ::operator delete(obj, sizeof(T), std::align_val_t {alignof(T)});
                }
            }

            static constexpr VTable value = {
                    .invoke  = &Invoke,
                    .move    = &Move,
                    .destroy = &Destroy,
            };
        };

        alignas(ALIGNMENT) union Storage
        {
            std::byte buffer[BUFFER_SIZE];
            void*     heapPtr;
        } m_storage {};

        bool          m_usingHeap = false;
        const VTable* m_vtable    = nullptr;

        void* GetPtr() noexcept
        {
            return m_usingHeap ? m_storage.heapPtr : static_cast<void*>(m_storage.buffer);
        }

        [[nodiscard]] const void* GetPtr() const noexcept
        {
            return m_usingHeap ? m_storage.heapPtr : static_cast<const void*>(m_storage.buffer);
        }

        template<typename F>
        void Init(F&& f)
        {
            using DecayedF = std::decay_t<F>;

            constexpr bool fitsInline =
                    (sizeof(DecayedF) <= BUFFER_SIZE) &&
                    (alignof(DecayedF) <= ALIGNMENT) &&
                    std::is_nothrow_move_constructible_v<DecayedF>;

            if constexpr (std::is_pointer_v<DecayedF> || std::is_member_pointer_v<DecayedF>)
            {
                if (f == nullptr)
                {
                    return;
                }
            }

            if constexpr (fitsInline)
            {
                ::new (m_storage.buffer) DecayedF(std::forward<F>(f));
                m_usingHeap = false;
                m_vtable    = &VTableFor<DecayedF, false>::value;
            }
            else
            {
                void* raw     = ::operator new(sizeof(DecayedF), std::align_val_t {alignof(DecayedF)});
                auto* heapObj = static_cast<DecayedF*>(raw);
                try
                {
                    ::new (heapObj) DecayedF(std::forward<F>(f));
                } catch (...)
                {
                    ::operator delete(heapObj, sizeof(DecayedF), std::align_val_t {alignof(DecayedF)});
                    throw;
                }
                m_storage.heapPtr = heapObj;
                m_usingHeap       = true;
                m_vtable          = &VTableFor<DecayedF, true>::value;
            }
        }

        void MoveFrom(Callable&& other) noexcept
        {
            if (!other.m_vtable)
            {
                return;
            }

            m_usingHeap = other.m_usingHeap;
            m_vtable    = other.m_vtable;

            if (other.m_usingHeap)
            {
                m_storage.heapPtr       = other.m_storage.heapPtr;
                other.m_storage.heapPtr = nullptr;
            }
            else
            {
                m_vtable->move(static_cast<void*>(m_storage.buffer), other.GetPtr());
                m_vtable->destroy(other.GetPtr());
            }

            other.m_vtable    = nullptr;
            other.m_usingHeap = false;
        }
    };
}// namespace Tether::Utilities
