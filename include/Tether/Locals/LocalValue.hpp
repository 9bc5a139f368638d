/// @file LocalValue.hpp
/// @brief Owned, type-erased value stored in a context-local slot.
#pragma once

#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <Tether/Exceptions/NotSupportedException.hpp>

namespace Tether::Locals
{
    namespace detail
    {
        struct LocalValueDescriptor
        {
            void (*destroy)(void*) noexcept;
            void* (*clone)(const void*);
        };

        template<typename T>
        void DestroyLocalValue(void* ptr) noexcept
        {
            delete static_cast<T*>(ptr);
        }

        template<typename T>
        void* CloneLocalValue(const void* ptr)
        {
            return new T(*static_cast<const T*>(ptr));
        }

        template<typename T>
        constexpr LocalValueDescriptor MakeLocalValueDescriptor() noexcept
        {
            if constexpr (std::is_copy_constructible_v<T>)
                return {&DestroyLocalValue<T>, &CloneLocalValue<T>};
            else
                return {&DestroyLocalValue<T>, nullptr};
        }

        template<typename T>
        inline constexpr LocalValueDescriptor LocalValueDescriptorFor = MakeLocalValueDescriptor<T>();
    }// namespace detail

    /// @brief Move-only owner of one heap-allocated value of any type.
    ///
    /// A single store keeps values of unrelated types (one per token), so slots hold a `LocalValue`
    /// and the typed handles cast it back. Each stored type gets one static descriptor; its address
    /// doubles as the type identity, so `Holds<T>()` is a pointer comparison.
    ///
    /// An empty `LocalValue` is a valid slot value: it is what a token without an initializer
    /// yields on first access.
    class LocalValue final
    {
    public:
        constexpr LocalValue() noexcept = default;

        template<typename T, typename... Args>
        [[nodiscard]] static LocalValue Make(Args&&... args)
        {
            using Stored = std::remove_cv_t<T>;
            static_assert(!std::is_reference_v<T> && !std::is_array_v<T>, "LocalValue stores object types only.");

            LocalValue out;
            out.m_object     = new Stored(std::forward<Args>(args)...);
            out.m_descriptor = &detail::LocalValueDescriptorFor<Stored>;
            return out;
        }

        template<typename T>
            requires(!std::is_same_v<std::remove_cvref_t<T>, LocalValue>)
        [[nodiscard]] static LocalValue From(T&& value)
        {
            return Make<std::remove_cvref_t<T>>(std::forward<T>(value));
        }

        LocalValue(const LocalValue&)            = delete;
        LocalValue& operator=(const LocalValue&) = delete;

        LocalValue(LocalValue&& other) noexcept
            : m_object(std::exchange(other.m_object, nullptr))
            , m_descriptor(std::exchange(other.m_descriptor, nullptr))
        {
        }

        LocalValue& operator=(LocalValue&& other) noexcept
        {
            if (this != &other)
            {
                LocalValue old(std::move(*this));
                m_object     = std::exchange(other.m_object, nullptr);
                m_descriptor = std::exchange(other.m_descriptor, nullptr);
            }
            return *this;
        }

        ~LocalValue() { Reset(); }

        [[nodiscard]] bool HasValue() const noexcept { return m_object != nullptr; }

        [[nodiscard]] bool IsCopyable() const noexcept
        {
            return m_descriptor == nullptr || m_descriptor->clone != nullptr;
        }

        template<typename T>
        [[nodiscard]] bool Holds() const noexcept
        {
            return m_descriptor == &detail::LocalValueDescriptorFor<std::remove_cv_t<T>>;
        }

        template<typename T>
        [[nodiscard]] T* TryCast() noexcept
        {
            return Holds<T>() ? static_cast<T*>(m_object) : nullptr;
        }

        template<typename T>
        [[nodiscard]] const T* TryCast() const noexcept
        {
            return Holds<T>() ? static_cast<const T*>(m_object) : nullptr;
        }

        /// @throws std::bad_cast if empty or holding another type.
        template<typename T>
        [[nodiscard]] T& Cast()
        {
            if (T* p = TryCast<T>())
                return *p;
            throw std::bad_cast();
        }

        template<typename T>
        [[nodiscard]] const T& Cast() const
        {
            if (const T* p = TryCast<T>())
                return *p;
            throw std::bad_cast();
        }

        /// @brief Deep copy. An empty value clones to an empty value.
        /// @throws Exceptions::NotSupportedException if the stored type is not copy-constructible.
        [[nodiscard]] LocalValue Clone() const
        {
            LocalValue out;
            if (!m_descriptor)
                return out;
            if (!m_descriptor->clone)
                throw Exceptions::NotSupportedException("LocalValue::Clone: stored type is not copy-constructible");
            out.m_object     = m_descriptor->clone(m_object);
            out.m_descriptor = m_descriptor;
            return out;
        }

        void Reset() noexcept
        {
            void*             object     = std::exchange(m_object, nullptr);
            const Descriptor* descriptor = std::exchange(m_descriptor, nullptr);
            if (descriptor)
                descriptor->destroy(object);
        }

    private:
        using Descriptor = detail::LocalValueDescriptor;

        void*             m_object {nullptr};
        const Descriptor* m_descriptor {nullptr};
    };
}// namespace Tether::Locals
