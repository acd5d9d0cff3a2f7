/// @file Text.hpp
/// @brief Number scanning and formatting shared by `Quantity::Parse` and `Quantity::ToString`.
#pragma once

#include <Quanta/Defines.hpp>
#include <Quanta/ParseError.hpp>
#include <Quanta/Primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Quanta
{
    /// @brief Quantity parsing configuration.
    struct ParseOptions
    {
        bool allowAliases {true};
        bool allowExponent {true};
        bool trimWhitespace {false};
    };

    namespace detail
    {
        /// @brief Parses `[+-]? digits* ('.' digits+)? ([eE] [+-]? digits+)?` spanning all of `text`.
        ///
        /// At least one digit is required and a trailing '.' is rejected. Values outside the range of F64
        /// are rejected as well.
        [[nodiscard]] QUANTA_API std::optional<F64> ParseNumber(std::string_view text, bool allowExponent) noexcept;

        [[nodiscard]] QUANTA_API std::string_view TrimWhitespace(std::string_view text) noexcept;
        [[nodiscard]] QUANTA_API std::string_view TrimTrailingWhitespace(std::string_view text) noexcept;

        /// @brief Builds the error value for a failed parse and logs it at debug level.
        [[nodiscard]] QUANTA_API ParseError MakeParseError(ParseErrorCode code, std::string_view input, std::string_view family);

        /// @brief Shortest decimal form of `value` that reads back to the same F64.
        [[nodiscard]] QUANTA_API std::string FormatNumber(F64 value);

        /// @brief `"<value> <symbol>"`.
        [[nodiscard]] QUANTA_API std::string FormatWithSymbol(F64 value, std::string_view symbol);
    }// namespace detail
}// namespace Quanta
