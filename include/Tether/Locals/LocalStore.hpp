/// @file LocalStore.hpp
/// @brief Open-addressing table from weakly held tokens to per-context values.
///
/// Semantics / constraints:
/// - Capacity is always a power of two (>= 16); probing is linear from `hash & (capacity - 1)`.
/// - Keys are held through `WeakToken`s. A slot whose token died is *dead*: it keeps its place in
///   the probe run until an operation that walks over it expunges it.
/// - Expunging re-places the rest of the run, so any mutating call (including `Find`, which expunges
///   the dead slots it meets) may invalidate pointers and references to values.
/// - Value destructors run inside store operations and must not touch the same store.
/// - A store has one owner at a time; it performs no synchronization of its own.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Exceptions/InvalidArgumentException.hpp>
#include <Tether/Locals/Config.hpp>
#include <Tether/Locals/LocalValue.hpp>
#include <Tether/Locals/Token.hpp>
#include <Tether/Memory/AllocatorConcept.hpp>
#include <Tether/Memory/SystemAllocator.hpp>
#include <Tether/Primitives.hpp>

#include <bit>
#include <cstddef>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <utility>

namespace Tether::Locals
{
    namespace detail
    {
        constexpr std::size_t NextPow2(std::size_t value) noexcept
        {
            if (value <= 1)
                return 1;
            return std::bit_ceil(value);
        }
    }// namespace detail

    /// @brief Per-context store of token -> value entries.
    ///
    /// Design notes:
    /// - Linear probing; at least one slot is always empty, so every probe terminates.
    /// - No tombstones: removal and dead-slot expunge re-thread the run immediately.
    /// - Reclamation of dead entries is folded into lookups, inserts and growth.
    /// - Growth doubles the table once the live count reaches 2/3 of capacity and a full sweep of
    ///   dead slots did not bring it below 1/2.
    template<Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class BasicLocalStore
    {
    public:
        using allocator_type = AllocatorType;
        using size_type      = std::size_t;

        static constexpr size_type kInitialCapacity = TETHER_LOCALS_INITIAL_CAPACITY;

        BasicLocalStore() { Initialize_(kInitialCapacity); }

        explicit BasicLocalStore(const AllocatorType& allocator)
            : m_allocator(allocator)
        {
            Initialize_(kInitialCapacity);
        }

        /// @param initialCapacity Rounded up to a power of two, at least `kInitialCapacity`.
        explicit BasicLocalStore(size_type initialCapacity, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator)
        {
            Initialize_(initialCapacity);
        }

        BasicLocalStore(const BasicLocalStore&)            = delete;
        BasicLocalStore& operator=(const BasicLocalStore&) = delete;

        BasicLocalStore(BasicLocalStore&& other) noexcept
            : m_allocator(std::move(other.m_allocator)),
              m_slots(std::exchange(other.m_slots, nullptr)),
              m_capacity(std::exchange(other.m_capacity, 0)),
              m_mask(std::exchange(other.m_mask, 0)),
              m_size(std::exchange(other.m_size, 0)),
              m_threshold(std::exchange(other.m_threshold, 0))
        {
        }

        BasicLocalStore& operator=(BasicLocalStore&& other) noexcept
        {
            if (this == &other)
                return *this;

            ClearAndRelease_();
            m_allocator = std::move(other.m_allocator);
            m_slots     = std::exchange(other.m_slots, nullptr);
            m_capacity  = std::exchange(other.m_capacity, 0);
            m_mask      = std::exchange(other.m_mask, 0);
            m_size      = std::exchange(other.m_size, 0);
            m_threshold = std::exchange(other.m_threshold, 0);
            return *this;
        }

        ~BasicLocalStore() { ClearAndRelease_(); }

        //--------------------------------------------------------------------------
        // Core ops
        //--------------------------------------------------------------------------

        /// @brief Value stored for `token`, or nullptr. Expunges the dead slots met on the way.
        /// @throws Exceptions::InvalidArgumentException if `token` is null.
        [[nodiscard]] LocalValue* Find(const Token& token)
        {
            RequireToken_(token, "LocalStore::Find");
            if (!m_slots)
                return nullptr;

            size_type index = token.HashCode() & m_mask;
            Slot&     slot  = m_slots[index];
            if (token.Matches(slot.token))
                return &slot.value;
            return FindAfterMiss_(token, index);
        }

        [[nodiscard]] bool Contains(const Token& token) { return Find(token) != nullptr; }

        /// @brief Value stored for `token`; on a miss stores and returns the token's initial value.
        ///
        /// The initializer runs before the store is modified, so it may itself read other tokens
        /// of this store.
        [[nodiscard]] LocalValue& GetOrInitialize(const Token& token)
        {
            if (LocalValue* existing = Find(token))
                return *existing;

            Set(token, token.Initialize());
            return *Find(token);
        }

        /// @brief Associates `value` with `token`, replacing (and destroying) any previous value.
        /// @throws std::bad_alloc if growing the table fails. When growth runs after the insert, the
        ///         entry stays stored and every other entry stays retrievable.
        void Set(const Token& token, LocalValue value)
        {
            RequireToken_(token, "LocalStore::Set");
            if (!m_slots)
                Initialize_(kInitialCapacity);

            size_type index = token.HashCode() & m_mask;
            for (; !m_slots[index].token.Empty(); index = Next_(index))
            {
                Slot& slot = m_slots[index];
                if (token.Matches(slot.token))
                {
                    slot.value = std::move(value);
                    return;
                }
                if (slot.token.Expired())
                {
                    ReplaceStale_(token, std::move(value), index);
                    return;
                }
            }

            if (m_size + 1 >= m_capacity)
            {
                // Only reachable after an earlier growth failed; never fill the last empty slot.
                Rehash_();
                Set(token, std::move(value));
                return;
            }

            Install_(m_slots[index], token, std::move(value));
            const size_type size = ++m_size;
            if (!CleanSomeSlots_(index, size) && size >= m_threshold)
                Rehash_();
        }

        /// @brief Drops the entry for `token`. Returns false if there was none.
        bool Remove(const Token& token)
        {
            RequireToken_(token, "LocalStore::Remove");
            if (!m_slots)
                return false;

            for (size_type index = token.HashCode() & m_mask; !m_slots[index].token.Empty(); index = Next_(index))
            {
                if (token.Matches(m_slots[index].token))
                {
                    ExpungeAt_(index);
                    return true;
                }
            }
            return false;
        }

        /// @brief Destroys every entry. Capacity is kept.
        void Clear() noexcept
        {
            if (!m_slots)
                return;
            for (size_type i = 0; i < m_capacity; ++i)
                ClearSlot_(m_slots[i]);
            m_size = 0;
        }

        /// @brief Expunges every dead slot in one pass. Returns the number of entries reclaimed.
        size_type ExpungeStaleEntries() noexcept
        {
            const size_type before = m_size;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                const Slot& slot = m_slots[i];
                if (!slot.token.Empty() && slot.token.Expired())
                    ExpungeAt_(i);
            }
            return before - m_size;
        }

        /// @brief Calls `fn(const Token&, const LocalValue&)` for every live entry, in slot order.
        template<class Fn>
        void ForEachLive(Fn&& fn) const
        {
            for (size_type i = 0; i < m_capacity; ++i)
            {
                const Slot& slot = m_slots[i];
                if (slot.token.Empty())
                    continue;
                const Token token = Token::FromWeak(slot.token);
                if (token)
                    fn(token, static_cast<const LocalValue&>(slot.value));
            }
        }

        /// @brief Builds a child store from the live entries of `parent`.
        ///
        /// The child has the parent's capacity; each value is the token's carry-over of the parent
        /// value. Dead parent entries are skipped. The result shares nothing with `parent`.
        [[nodiscard]] static BasicLocalStore Propagate(const BasicLocalStore& parent)
        {
            return Propagate(parent, parent.m_allocator);
        }

        [[nodiscard]] static BasicLocalStore Propagate(const BasicLocalStore& parent, const AllocatorType& allocator)
        {
            BasicLocalStore child(parent.m_capacity, allocator);
            for (size_type i = 0; i < parent.m_capacity; ++i)
            {
                const Slot& source = parent.m_slots[i];
                if (source.token.Empty())
                    continue;
                const Token token = Token::FromWeak(source.token);
                if (!token)
                    continue;

                LocalValue value = token.CarryOverValue(source.value);
                size_type  index = token.HashCode() & child.m_mask;
                while (!child.m_slots[index].token.Empty())
                    index = child.Next_(index);
                Install_(child.m_slots[index], token, std::move(value));
                ++child.m_size;
            }
            return child;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        /// @brief Entries not yet expunged; may include dead ones.
        [[nodiscard]] TETHER_ALWAYS_INLINE UIntSize Size() const noexcept { return static_cast<UIntSize>(m_size); }
        [[nodiscard]] TETHER_ALWAYS_INLINE UIntSize Capacity() const noexcept { return static_cast<UIntSize>(m_capacity); }
        [[nodiscard]] TETHER_ALWAYS_INLINE UIntSize Threshold() const noexcept { return static_cast<UIntSize>(m_threshold); }
        [[nodiscard]] TETHER_ALWAYS_INLINE bool     Empty() const noexcept { return m_size == 0; }

    private:
        struct Slot
        {
            WeakToken  token {};
            UInt32     hash {0};
            LocalValue value {};
        };

        [[nodiscard]] TETHER_ALWAYS_INLINE size_type Next_(size_type index) const noexcept { return (index + 1) & m_mask; }
        [[nodiscard]] TETHER_ALWAYS_INLINE size_type Prev_(size_type index) const noexcept { return (index - 1) & m_mask; }

        [[nodiscard]] static bool IsDead_(const Slot& slot) noexcept
        {
            return !slot.token.Empty() && slot.token.Expired();
        }

        static void RequireToken_(const Token& token, const char* operation)
        {
            if (!token)
                throw Exceptions::InvalidArgumentException(std::string(operation) + ": null token");
        }

        static void Install_(Slot& slot, const Token& token, LocalValue value) noexcept
        {
            slot.token = token.Weak();
            slot.hash  = token.HashCode();
            slot.value = std::move(value);
        }

        static void ClearSlot_(Slot& slot) noexcept
        {
            slot.value.Reset();
            slot.token.Reset();
            slot.hash = 0;
        }

        [[nodiscard]] Slot* AllocateSlots_(size_type capacity)
        {
            if (capacity > std::numeric_limits<size_type>::max() / sizeof(Slot))
                throw std::bad_alloc();
            void* mem = m_allocator.Allocate(capacity * sizeof(Slot), alignof(Slot));
            if (!mem)
                throw std::bad_alloc();
            Slot* slots = static_cast<Slot*>(mem);
            for (size_type i = 0; i < capacity; ++i)
                std::construct_at(slots + i);
            return slots;
        }

        void DeallocateSlots_(Slot* slots, size_type capacity) noexcept
        {
            std::destroy_n(slots, capacity);
            m_allocator.Deallocate(slots, capacity * sizeof(Slot), alignof(Slot));
        }

        void Initialize_(size_type requestedCapacity)
        {
            size_type cap = detail::NextPow2(requestedCapacity);
            if (cap < kInitialCapacity)
                cap = kInitialCapacity;

            m_slots     = AllocateSlots_(cap);
            m_capacity  = cap;
            m_mask      = cap - 1;
            m_size      = 0;
            m_threshold = ThresholdFor_(cap);
        }

        void ClearAndRelease_() noexcept
        {
            if (!m_slots)
                return;
            DeallocateSlots_(m_slots, m_capacity);
            m_slots     = nullptr;
            m_capacity  = 0;
            m_mask      = 0;
            m_size      = 0;
            m_threshold = 0;
        }

        [[nodiscard]] static constexpr size_type ThresholdFor_(size_type capacity) noexcept
        {
            return capacity * 2 / 3;
        }

        LocalValue* FindAfterMiss_(const Token& token, size_type index) noexcept
        {
            while (!m_slots[index].token.Empty())
            {
                Slot& slot = m_slots[index];
                if (token.Matches(slot.token))
                    return &slot.value;
                if (slot.token.Expired())
                    ExpungeAt_(index);// the run was re-threaded; look at this index again
                else
                    index = Next_(index);
            }
            return nullptr;
        }

        /// Clears `staleIndex`, then walks the rest of its run: dead slots are cleared, live slots
        /// move to the first empty slot from their home index. Returns the empty slot ending the run.
        size_type ExpungeAt_(size_type staleIndex) noexcept
        {
            ClearSlot_(m_slots[staleIndex]);
            --m_size;

            size_type index = Next_(staleIndex);
            for (; !m_slots[index].token.Empty(); index = Next_(index))
            {
                Slot& slot = m_slots[index];
                if (slot.token.Expired())
                {
                    ClearSlot_(slot);
                    --m_size;
                    continue;
                }

                size_type home = slot.hash & m_mask;
                if (home == index)
                    continue;

                // Vacate first so the probe from home stops here at the latest.
                Slot displaced = std::move(slot);
                ClearSlot_(slot);
                while (!m_slots[home].token.Empty())
                    home = Next_(home);
                m_slots[home] = std::move(displaced);
            }
            return index;
        }

        /// Scans about log2(count) slots after `index` for dead entries, restarting the budget at
        /// capacity whenever one is found. Returns true if anything was expunged.
        bool CleanSomeSlots_(size_type index, size_type count) noexcept
        {
            bool removed = false;
            do
            {
                index = Next_(index);
                if (IsDead_(m_slots[index]))
                {
                    count   = m_capacity;
                    removed = true;
                    index   = ExpungeAt_(index);
                }
            } while ((count >>= 1) != 0);
            return removed;
        }

        /// Set hit a dead slot at `staleIndex` before finding `token`. Stores the entry there (moving
        /// the live entry for `token` back if it sits later in the run) and expunges the run's other
        /// dead slots.
        void ReplaceStale_(const Token& token, LocalValue value, size_type staleIndex) noexcept
        {
            // Earliest dead slot of the run, so the whole run is cleaned in one pass.
            size_type expungeFrom = staleIndex;
            for (size_type i = Prev_(staleIndex); !m_slots[i].token.Empty(); i = Prev_(i))
            {
                if (m_slots[i].token.Expired())
                    expungeFrom = i;
            }

            for (size_type i = Next_(staleIndex); !m_slots[i].token.Empty(); i = Next_(i))
            {
                Slot& slot = m_slots[i];
                if (token.Matches(slot.token))
                {
                    slot.value = std::move(value);
                    std::swap(m_slots[i], m_slots[staleIndex]);

                    // The dead entry now sits at i.
                    if (expungeFrom == staleIndex)
                        expungeFrom = i;
                    CleanSomeSlots_(ExpungeAt_(expungeFrom), m_capacity);
                    return;
                }

                if (slot.token.Expired() && expungeFrom == staleIndex)
                    expungeFrom = i;
            }

            // The dead slot was counted in m_size and stays occupied, so the size is unchanged.
            Install_(m_slots[staleIndex], token, std::move(value));

            if (expungeFrom != staleIndex)
                CleanSomeSlots_(ExpungeAt_(expungeFrom), m_capacity);
        }

        void Rehash_()
        {
            ExpungeStaleEntries();
            if (m_size >= m_threshold - m_threshold / 4)
                Resize_();
        }

        /// Doubles the table. Dead entries are dropped instead of copied. On allocation failure the
        /// current table is left untouched.
        void Resize_()
        {
            if (m_capacity > std::numeric_limits<size_type>::max() / 2)
                throw std::bad_alloc();

            const size_type newCapacity = m_capacity * 2;
            const size_type newMask     = newCapacity - 1;
            Slot*           newSlots    = AllocateSlots_(newCapacity);

            size_type count = 0;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                Slot& slot = m_slots[i];
                if (slot.token.Empty() || slot.token.Expired())
                    continue;

                size_type index = slot.hash & newMask;
                while (!newSlots[index].token.Empty())
                    index = (index + 1) & newMask;
                newSlots[index] = std::move(slot);
                ++count;
            }

            Slot*           oldSlots    = m_slots;
            const size_type oldCapacity = m_capacity;

            m_slots     = newSlots;
            m_capacity  = newCapacity;
            m_mask      = newMask;
            m_size      = count;
            m_threshold = ThresholdFor_(newCapacity);

            // Values of dead entries are destroyed here, after the new table is in place.
            DeallocateSlots_(oldSlots, oldCapacity);
        }

        [[no_unique_address]] AllocatorType m_allocator {};
        Slot*                               m_slots {nullptr};
        size_type                           m_capacity {0};
        size_type                           m_mask {0};
        size_type                           m_size {0};
        size_type                           m_threshold {0};
    };

    using LocalStore = BasicLocalStore<>;
}// namespace Tether::Locals
