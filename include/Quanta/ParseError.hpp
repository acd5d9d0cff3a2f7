#pragma once

#include <Quanta/Defines.hpp>
#include <Quanta/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace Quanta
{
    /// @brief Reason a quantity string could not be parsed.
    enum class ParseErrorCode : UInt8
    {
        None,
        EmptyInput,
        UnknownSymbol,
        InvalidNumber,
    };

    /// @brief Parsing error payload: the offending input, the target family and a readable message.
    struct ParseError
    {
        ParseErrorCode   code {ParseErrorCode::None};
        std::string      input {};
        std::string_view family {};
        std::string      message {};
    };

    template<typename T>
    using ParseResult = std::expected<T, ParseError>;
}// namespace Quanta
