#pragma once

/// @file InvalidArgumentException.hpp
/// @brief Declares the InvalidArgumentException class.

#include <Tether/Exceptions/Exception.hpp>

namespace Tether::Exceptions
{
    /// @class InvalidArgumentException
    /// @brief Thrown when an operation receives an argument it can never accept.
    ///
    /// @details
    /// Used for programming errors such as passing a null `Token` to a store, or constructing a
    /// `ContextLocal` with an empty initializer. It is not meant to be recovered from.
    class InvalidArgumentException : public Exception
    {
    public:
        /// @brief Constructor with a C-style string message.
        /// @param message The exception message.
        explicit InvalidArgumentException(const char* message)
            : Exception(message)
        {
        }

        /// @brief Constructor with a std::string message.
        /// @param message The exception message.
        explicit InvalidArgumentException(const std::string& message)
            : Exception(message)
        {
        }

        ~InvalidArgumentException() noexcept override = default;
    };
}// namespace Tether::Exceptions
