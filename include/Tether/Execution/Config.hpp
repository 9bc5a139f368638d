/// @file Config.hpp
/// @brief Compile-time configuration for Tether::Execution.
#pragma once

// Default of Thread::Options::inheritLocals: new threads start with a copy of the parent's inheritable store.
#ifndef TETHER_THREAD_INHERITS_LOCALS
#define TETHER_THREAD_INHERITS_LOCALS 1
#endif
