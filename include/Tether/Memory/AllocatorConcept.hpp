/// @file AllocatorConcept.hpp
/// @brief Allocator concept used by Tether containers and smart pointers.
#pragma once

#include <concepts>
#include <cstddef>

namespace Tether::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept (minimal, hot-path friendly)
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate reports failure by returning nullptr;
    // callers turn that into std::bad_alloc. Size and alignment passed to Deallocate are the
    // values passed to the matching Allocate.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

}// namespace Tether::Memory
