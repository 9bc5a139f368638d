/// @file SmartPointers.hpp
/// @brief Header-only smart pointers (`Scoped`, `Shared`, `Ticket`) with allocator support.
///
/// - `Scoped<T, A>`: unique ownership, minimal overhead. Owns the per-context stores.
/// - `Shared<T, A>`: reference-counted ownership. Owns token state.
/// - `Ticket<T, A>`: weak handle to a `Shared` object. A ticket never keeps the object alive, and
///   keeps only the control block allocated, so identity comparisons against a ticket stay valid
///   after the object died.
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include <Tether/Memory/AllocationHelpers.hpp>
#include <Tether/Memory/AllocatorConcept.hpp>
#include <Tether/Memory/SystemAllocator.hpp>

namespace Tether::Memory
{
    namespace detail
    {
        template<class T, class Alloc>
        struct SharedControl final
        {
            std::atomic<std::size_t> strong {1};// number of Shared owners
            std::atomic<std::size_t> weak {1};  // number of Ticket owners + control's self-weak

            [[no_unique_address]] Alloc alloc {};
            void*                       base {nullptr};
            std::size_t                 totalBytes {0};
            std::size_t                 allocAlignment {alignof(std::max_align_t)};
            T*                          objectPtr {nullptr};

            SharedControl(Alloc a, void* b, std::size_t bytes, std::size_t aln) noexcept
                : alloc(std::move(a)), base(b), totalBytes(bytes), allocAlignment(aln) {}

            void DestroyObject() noexcept
            {
                if (objectPtr)
                {
                    std::destroy_at(objectPtr);
                    objectPtr = nullptr;
                }
            }

            void DeallocateSelf() noexcept
            {
                // The allocator lives inside the block being released; move it out first.
                Alloc       local = std::move(alloc);
                void*       mem   = base;
                std::size_t bytes = totalBytes;
                std::size_t aln   = allocAlignment;
                this->~SharedControl();
                local.Deallocate(mem, bytes, aln);
            }
        };
    }// namespace detail

    ////////////////////////////////////////////////////////////////////////////////
    // Scoped<T, Alloc>
    ////////////////////////////////////////////////////////////////////////////////

    /// \brief Unique-ownership smart pointer using an allocator.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Scoped
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        static_assert(!std::is_array_v<T>, "Scoped does not manage arrays.");

        constexpr Scoped() noexcept = default;
        constexpr Scoped(std::nullptr_t) noexcept {}

        explicit Scoped(T* ptr, Alloc alloc = Alloc {}) noexcept : m_ptr(ptr), m_alloc(std::move(alloc)) {}

        Scoped(const Scoped&)            = delete;
        Scoped& operator=(const Scoped&) = delete;

        Scoped(Scoped&& other) noexcept : m_ptr(other.m_ptr), m_alloc(std::move(other.m_alloc))
        {
            other.m_ptr = nullptr;
        }
        Scoped& operator=(Scoped&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_ptr       = other.m_ptr;
                m_alloc     = std::move(other.m_alloc);
                other.m_ptr = nullptr;
            }
            return *this;
        }

        ~Scoped() noexcept { Reset(); }

        [[nodiscard]] T*   Get() const noexcept { return m_ptr; }
        [[nodiscard]] T&   operator*() const { return *m_ptr; }
        [[nodiscard]] T*   operator->() const noexcept { return m_ptr; }
        explicit           operator bool() const noexcept { return m_ptr != nullptr; }
        [[nodiscard]] bool operator==(std::nullptr_t) const noexcept { return m_ptr == nullptr; }

        /// \brief Destroys the owned object. The pointer is cleared before the destructor runs, so
        /// code reached from that destructor observes an empty `Scoped`.
        void Reset() noexcept
        {
            T* old = m_ptr;
            m_ptr  = nullptr;
            if (old)
            {
                DeallocateObject<Alloc, T>(m_alloc, old);
            }
        }

        [[nodiscard]] T* Release() noexcept
        {
            T* p  = m_ptr;
            m_ptr = nullptr;
            return p;
        }

    private:
        T*                          m_ptr {nullptr};
        [[no_unique_address]] Alloc m_alloc {};
    };

    /// \brief Factory: allocate and construct T with a specific allocator.
    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Scoped<T, Alloc> MakeScopedWith(Alloc alloc, Args&&... args)
    {
        T* obj = AllocateObject<Alloc, T>(alloc, std::forward<Args>(args)...);
        return Scoped<T, Alloc>(obj, std::move(alloc));
    }

    /// \brief Factory: allocate and construct T using `SystemAllocator`.
    template<class T, class... Args>
    [[nodiscard]] Scoped<T, SystemAllocator> MakeScoped(Args&&... args)
    {
        return MakeScopedWith<T, SystemAllocator>(SystemAllocator {}, std::forward<Args>(args)...);
    }

    ////////////////////////////////////////////////////////////////////////////////
    // Shared<T, Alloc> and Ticket<T, Alloc>
    ////////////////////////////////////////////////////////////////////////////////

    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Ticket;

    /// \brief Reference-counted shared pointer with weak references.
    ///
    /// Self-weak strategy: the control block holds one implicit weak count so it outlives the
    /// object while tickets remain.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Shared
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        constexpr Shared() noexcept = default;
        constexpr Shared(std::nullptr_t) noexcept {}

        Shared(const Shared& other) noexcept : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                m_ctrl->strong.fetch_add(1, std::memory_order_relaxed);
        }
        Shared& operator=(const Shared& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    m_ctrl->strong.fetch_add(1, std::memory_order_relaxed);
            }
            return *this;
        }

        Shared(Shared&& other) noexcept : m_ctrl(other.m_ctrl) { other.m_ctrl = nullptr; }
        Shared& operator=(Shared&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl       = other.m_ctrl;
                other.m_ctrl = nullptr;
            }
            return *this;
        }

        ~Shared() noexcept { Release(); }

        [[nodiscard]] T* Get() const noexcept { return m_ctrl ? m_ctrl->objectPtr : nullptr; }
        [[nodiscard]] T& operator*() const { return *Get(); }
        [[nodiscard]] T* operator->() const noexcept { return Get(); }
        explicit         operator bool() const noexcept { return Get() != nullptr; }

        /// \brief Identity: both refer to the same control block.
        [[nodiscard]] bool operator==(const Shared& other) const noexcept { return m_ctrl == other.m_ctrl; }

        /// \brief Current strong owners (best-effort; relaxed).
        [[nodiscard]] std::size_t UseCount() const noexcept
        {
            return m_ctrl ? m_ctrl->strong.load(std::memory_order_relaxed) : 0;
        }

        void Reset() noexcept { Release(); }

        friend class Ticket<T, Alloc>;

        template<class U, AllocatorConcept A, class... Args>
        friend Shared<U, A> MakeSharedWith(A alloc, Args&&... args);
        template<class U, AllocatorConcept A>
        friend Ticket<U, A> MakeTicket(const Shared<U, A>&) noexcept;

    private:
        using Control = detail::SharedControl<T, Alloc>;

        explicit Shared(Control* ctrl) noexcept : m_ctrl(ctrl) {}

        /// \brief Release one strong reference; destroy object on last strong, free on last weak.
        void Release() noexcept
        {
            Control* ctrl = m_ctrl;
            m_ctrl        = nullptr;
            if (!ctrl)
                return;
            if (ctrl->strong.fetch_sub(1, std::memory_order_acq_rel) == 1)
            {
                ctrl->DestroyObject();
                if (ctrl->weak.fetch_sub(1, std::memory_order_acq_rel) == 1)
                {
                    ctrl->DeallocateSelf();
                }
            }
        }

        Control* m_ctrl {nullptr};
    };

    /// \brief Weak non-owning handle that can lock to a `Shared` while the object is alive.
    template<class T, AllocatorConcept Alloc>
    class Ticket
    {
    public:
        constexpr Ticket() noexcept = default;
        constexpr Ticket(std::nullptr_t) noexcept {}

        Ticket(const Ticket& other) noexcept : m_ctrl(other.m_ctrl)
        {
            if (m_ctrl)
                m_ctrl->weak.fetch_add(1, std::memory_order_relaxed);
        }
        Ticket& operator=(const Ticket& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl = other.m_ctrl;
                if (m_ctrl)
                    m_ctrl->weak.fetch_add(1, std::memory_order_relaxed);
            }
            return *this;
        }

        Ticket(Ticket&& other) noexcept : m_ctrl(other.m_ctrl) { other.m_ctrl = nullptr; }
        Ticket& operator=(Ticket&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_ctrl       = other.m_ctrl;
                other.m_ctrl = nullptr;
            }
            return *this;
        }

        ~Ticket() noexcept { Release(); }

        void Reset() noexcept { Release(); }

        /// \brief True if this ticket was never bound (or was reset).
        [[nodiscard]] bool Empty() const noexcept { return m_ctrl == nullptr; }

        [[nodiscard]] bool Expired() const noexcept
        {
            return !m_ctrl || m_ctrl->strong.load(std::memory_order_acquire) == 0;
        }

        /// \brief True if this ticket was made from `shared` (or a copy of it).
        [[nodiscard]] bool Refers(const Shared<T, Alloc>& shared) const noexcept
        {
            return m_ctrl != nullptr && m_ctrl == shared.m_ctrl;
        }

        /// \brief Attempt to acquire a strong owner; returns empty once the object is gone.
        [[nodiscard]] Shared<T, Alloc> Lock() const noexcept
        {
            if (!m_ctrl)
                return {};

            std::size_t s = m_ctrl->strong.load(std::memory_order_relaxed);
            while (s != 0)
            {
                if (m_ctrl->strong.compare_exchange_weak(s, s + 1, std::memory_order_acquire, std::memory_order_relaxed))
                    return Shared<T, Alloc>(m_ctrl);
            }
            return {};
        }

    private:
        using Control = detail::SharedControl<T, Alloc>;

        explicit Ticket(Control* ctrl) noexcept : m_ctrl(ctrl) {}

        void Release() noexcept
        {
            Control* ctrl = m_ctrl;
            m_ctrl        = nullptr;
            if (!ctrl)
                return;
            if (ctrl->weak.fetch_sub(1, std::memory_order_acq_rel) == 1)
            {
                // Last weak holder. The self-weak is only dropped after the last strong owner.
                ctrl->DeallocateSelf();
            }
        }

        Control* m_ctrl {nullptr};

        template<class U, AllocatorConcept A>
        friend Ticket<U, A> MakeTicket(const Shared<U, A>&) noexcept;
    };

    /// \brief Create a control block and T in one allocation with a specific allocator.
    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Shared<T, Alloc> MakeSharedWith(Alloc alloc, Args&&... args)
    {
        using Control = detail::SharedControl<T, Alloc>;

        constexpr std::size_t tAlign    = alignof(T);
        constexpr std::size_t ctrlAlign = alignof(Control);
        constexpr std::size_t alignment = ctrlAlign > tAlign ? ctrlAlign : tAlign;
        constexpr std::size_t objOffset = (sizeof(Control) + tAlign - 1) & ~(tAlign - 1);
        constexpr std::size_t total     = objOffset + sizeof(T);

        void* base = alloc.Allocate(total, alignment);
        if (!base)
            throw std::bad_alloc {};

        T* objPtr = nullptr;
        try
        {
            objPtr = std::construct_at(reinterpret_cast<T*>(static_cast<std::byte*>(base) + objOffset), std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(base, total, alignment);
            throw;
        }

        auto* ctrl      = ::new (base) Control(std::move(alloc), base, total, alignment);
        ctrl->objectPtr = objPtr;
        return Shared<T, Alloc>(ctrl);
    }

    /// \brief Create a weak Ticket from a Shared, bumping the weak count.
    template<class T, AllocatorConcept Alloc>
    [[nodiscard]] Ticket<T, Alloc> MakeTicket(const Shared<T, Alloc>& shared) noexcept
    {
        auto* c = shared.m_ctrl;
        if (c)
        {
            c->weak.fetch_add(1, std::memory_order_relaxed);
            return Ticket<T, Alloc>(c);
        }
        return Ticket<T, Alloc> {};
    }

    /// \brief Factory: allocate and construct T using `SystemAllocator`.
    template<class T, class... Args>
    [[nodiscard]] Shared<T, SystemAllocator> MakeShared(Args&&... args)
    {
        return MakeSharedWith<T, SystemAllocator>(SystemAllocator {}, std::forward<Args>(args)...);
    }
}// namespace Tether::Memory
