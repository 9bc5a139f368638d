#pragma once

/// @file NotSupportedException.hpp
/// @brief Declares the NotSupportedException class.

#include <Tether/Exceptions/Exception.hpp>

namespace Tether::Exceptions
{
    /// @class NotSupportedException
    /// @brief Exception thrown when an operation is not supported by the value it is applied to.
    ///
    /// @details
    /// Raised, for example, when a non-copyable value has to be cloned to be carried into another
    /// context.
    class NotSupportedException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit NotSupportedException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a std::string message.
        /// @param message The exception message.
        explicit NotSupportedException(const std::string& message)
            : Exception(message)
        {
        }

        ~NotSupportedException() noexcept override = default;
    };
}// namespace Tether::Exceptions
