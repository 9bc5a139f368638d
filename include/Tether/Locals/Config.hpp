/// @file Config.hpp
/// @brief Compile-time configuration for Tether::Locals.
#pragma once

// Slot count of a freshly created store. Must be a power of two and at least 16.
#ifndef TETHER_LOCALS_INITIAL_CAPACITY
#define TETHER_LOCALS_INITIAL_CAPACITY 16
#endif

static_assert(TETHER_LOCALS_INITIAL_CAPACITY >= 16 &&
                      (TETHER_LOCALS_INITIAL_CAPACITY & (TETHER_LOCALS_INITIAL_CAPACITY - 1)) == 0,
              "TETHER_LOCALS_INITIAL_CAPACITY must be a power of two >= 16");
