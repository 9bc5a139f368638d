#pragma once

#include <stdexcept>
#include <string>

namespace Tether::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by Tether.
    ///
    /// @details
    /// `Exception` gives the library one catchable root. It carries only the message; callers that
    /// need the failing operation encode it in the text (`"LocalStore::Set: ..."`).
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message) : std::runtime_error(message) {}

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message) : std::runtime_error(message) {}

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Tether::Exceptions
