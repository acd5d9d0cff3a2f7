#include <Quanta/Logging.hpp>
#include <Quanta/Text.hpp>

#include <charconv>
#include <format>
#include <system_error>

namespace Quanta::detail
{
    namespace
    {
        /// @brief Forward-only cursor over a number literal.
        class LiteralCursor
        {
        public:
            explicit LiteralCursor(std::string_view text) noexcept
                : m_current(text.data()), m_end(text.data() + text.size())
            {
            }

            [[nodiscard]] bool IsEof() const noexcept { return m_current >= m_end; }

            [[nodiscard]] char Peek() const noexcept
            {
                if (IsEof())
                    return '\0';
                return *m_current;
            }

            void Advance() noexcept
            {
                if (m_current < m_end)
                    ++m_current;
            }

            bool Consume(char expected) noexcept
            {
                if (Peek() != expected)
                    return false;
                Advance();
                return true;
            }

            UIntSize SkipDigits() noexcept
            {
                UIntSize count = 0;
                while (IsDigit(Peek()))
                {
                    Advance();
                    ++count;
                }
                return count;
            }

            [[nodiscard]] const char* CurrentPtr() const noexcept { return m_current; }

        private:
            [[nodiscard]] static bool IsDigit(char c) noexcept
            {
                return c >= '0' && c <= '9';
            }

            const char* m_current {nullptr};
            const char* m_end {nullptr};
        };

        [[nodiscard]] bool IsWhitespace(char c) noexcept
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }

        [[nodiscard]] std::string_view Describe(ParseErrorCode code) noexcept
        {
            switch (code)
            {
                case ParseErrorCode::EmptyInput: return "input is empty";
                case ParseErrorCode::UnknownSymbol: return "no unit symbol of the family matches";
                case ParseErrorCode::InvalidNumber: return "malformed number";
                case ParseErrorCode::None: break;
            }
            return "unknown error";
        }
    }// namespace

    std::optional<F64> ParseNumber(std::string_view text, bool allowExponent) noexcept
    {
        LiteralCursor cursor {text};

        // std::from_chars accepts '-' but not '+'.
        if (cursor.Consume('+'))
        {
            if (cursor.Peek() == '-')
                return std::nullopt;
        }
        const char* numberBegin = cursor.CurrentPtr();
        cursor.Consume('-');

        const UIntSize integerDigits = cursor.SkipDigits();
        if (cursor.Consume('.'))
        {
            if (cursor.SkipDigits() == 0)
                return std::nullopt;
        }
        else if (integerDigits == 0)
        {
            return std::nullopt;
        }

        if (allowExponent && (cursor.Peek() == 'e' || cursor.Peek() == 'E'))
        {
            cursor.Advance();
            if (!cursor.Consume('+'))
                cursor.Consume('-');
            if (cursor.SkipDigits() == 0)
                return std::nullopt;
        }

        if (!cursor.IsEof())
            return std::nullopt;

        F64        value  = 0.0;
        const auto result = std::from_chars(numberBegin, cursor.CurrentPtr(), value);
        if (result.ec != std::errc {} || result.ptr != cursor.CurrentPtr())
            return std::nullopt;
        return value;
    }

    std::string_view TrimTrailingWhitespace(std::string_view text) noexcept
    {
        while (!text.empty() && IsWhitespace(text.back()))
            text.remove_suffix(1);
        return text;
    }

    std::string_view TrimWhitespace(std::string_view text) noexcept
    {
        while (!text.empty() && IsWhitespace(text.front()))
            text.remove_prefix(1);
        return TrimTrailingWhitespace(text);
    }

    ParseError MakeParseError(ParseErrorCode code, std::string_view input, std::string_view family)
    {
        ParseError error;
        error.code    = code;
        error.input   = std::string {input};
        error.family  = family;
        error.message = std::format("Unable to parse '{}' as {}: {}", input, family, Describe(code));
        Logging::GetLogger()->debug("{}", error.message);
        return error;
    }

    std::string FormatNumber(F64 value)
    {
        return std::format("{}", value);
    }

    std::string FormatWithSymbol(F64 value, std::string_view symbol)
    {
        return std::format("{} {}", FormatNumber(value), symbol);
    }
}// namespace Quanta::detail
