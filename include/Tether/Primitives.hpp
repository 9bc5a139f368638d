// Fundamental type aliases shared by every Tether module.
#pragma once
#include <cstddef>
#include <cstdint>

namespace Tether
{
    /// @brief 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief 32-bit unsigned integer (token hash codes).
    using UInt32 = std::uint32_t;
    /// @brief 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a byte.
    using Byte = std::byte;

    using UIntSize = std::size_t;
    using IntSize  = std::ptrdiff_t;
}// namespace Tether
