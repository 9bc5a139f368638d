/// @file AllocationHelpers.hpp
/// @brief Construction/destruction helpers built atop AllocatorConcept.
#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

#include <Tether/Memory/AllocatorConcept.hpp>

namespace Tether::Memory
{
    template<AllocatorConcept A, class T, class... Args>
    [[nodiscard]] T* AllocateObject(A& alloc, Args&&... args)
    {
        void* mem = alloc.Allocate(sizeof(T), alignof(T));
        if (!mem)
            throw std::bad_alloc();
        try
        {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(mem, sizeof(T), alignof(T));
            throw;
        }
    }

    // Convenience overload: AllocateObject<T>(allocator, args...)
    template<class T, AllocatorConcept A, class... Args>
    [[nodiscard]] T* AllocateObject(A& alloc, Args&&... args)
    {
        return AllocateObject<A, T>(alloc, std::forward<Args>(args)...);
    }

    template<AllocatorConcept A, class T>
    void DeallocateObject(A& alloc, T* ptr) noexcept(std::is_nothrow_destructible_v<T>)
    {
        if (!ptr)
            return;
        ptr->~T();
        alloc.Deallocate(ptr, sizeof(T), alignof(T));
    }
}// namespace Tether::Memory
