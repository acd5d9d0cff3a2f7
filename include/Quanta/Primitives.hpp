// This file belongs to the core module: fundamental type definitions.
#pragma once
#include <cstddef>
#include <cstdint>

namespace Quanta
{
    /// @brief Represents a 64-bit unsigned integer.
    using UInt64 = std::uint64_t;
    /// @brief Represents a 32-bit unsigned integer.
    using UInt32 = std::uint32_t;
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a 64-bit signed integer.
    using Int64 = std::int64_t;
    /// @brief Represents a 32-bit signed integer.
    using Int32 = std::int32_t;

    /// @brief Represents a 64-bit floating point number.
    /// @details Every canonical quantity value is stored as an F64.
    using F64 = double;

    using UIntSize = std::size_t;
    using IntSize  = std::ptrdiff_t;

    /// @brief Represents a character type, usually 8-bit.
    using Char = char;
}// namespace Quanta
