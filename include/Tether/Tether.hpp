/// @file Tether.hpp
/// @brief Umbrella header for the Tether library.
#pragma once

#include <Tether/Defines.hpp>
#include <Tether/Exceptions/Exception.hpp>
#include <Tether/Exceptions/InvalidArgumentException.hpp>
#include <Tether/Exceptions/NotSupportedException.hpp>
#include <Tether/Execution/ContextCarried.hpp>
#include <Tether/Execution/ExecutionContext.hpp>
#include <Tether/Execution/Thread.hpp>
#include <Tether/Execution/ThreadName.hpp>
#include <Tether/Execution/ThreadPoolScheduler.hpp>
#include <Tether/Locals/ContextLocal.hpp>
#include <Tether/Locals/ContextSnapshot.hpp>
#include <Tether/Locals/LocalStore.hpp>
#include <Tether/Locals/LocalValue.hpp>
#include <Tether/Locals/Token.hpp>
#include <Tether/Memory/SmartPointers.hpp>
#include <Tether/Memory/SystemAllocator.hpp>
#include <Tether/Primitives.hpp>
#include <Tether/Utilities/Callable.hpp>
