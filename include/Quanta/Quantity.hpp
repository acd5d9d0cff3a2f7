/// @file Quantity.hpp
/// @brief `Quanta::Quantity<Family>`: an immutable value of one quantity family, stored in its canonical unit.
#pragma once

#include <Quanta/Defines.hpp>
#include <Quanta/ParseError.hpp>
#include <Quanta/Primitives.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/Text.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <compare>
#include <expected>
#include <format>
#include <ostream>
#include <string>
#include <string_view>

namespace Quanta
{
    /// @brief A value of one quantity family.
    ///
    /// @details The only state is the canonical value. Values are created through a unit
    /// (`Kilograms.Of(2.0)`), through `FromCanonical`, or by arithmetic. Arithmetic and comparison
    /// within a family act on canonical values; arithmetic across families only exists for pairs
    /// declared in the derivation registry (see Derivation.hpp).
    ///
    /// @tparam Family Tag type of the family; `QuantityTraits<Family>` describes its units.
    template<typename Family>
    class Quantity
    {
    public:
        using FamilyType = Family;
        using UnitType   = UnitOfMeasure<Family>;

        /// @brief Named constructor from a value already expressed in the canonical unit.
        [[nodiscard]] static constexpr Quantity FromCanonical(F64 canonicalValue) noexcept
        {
            return Quantity(canonicalValue);
        }

        /// @brief The value in the family's canonical unit.
        [[nodiscard]] constexpr F64 Value() const noexcept { return m_value; }

        /// @brief The value expressed in `unit`.
        [[nodiscard]] constexpr F64 To(const UnitType& unit) const noexcept
        {
            return unit.FromCanonical(m_value);
        }

        // Arithmetic (same family)
        constexpr Quantity operator+(const Quantity& other) const noexcept
        {
            return Quantity(m_value + other.m_value);
        }
        constexpr Quantity operator-(const Quantity& other) const noexcept
        {
            return Quantity(m_value - other.m_value);
        }
        constexpr Quantity operator-() const noexcept
        {
            return Quantity(-m_value);
        }
        constexpr Quantity operator*(F64 scalar) const noexcept
        {
            return Quantity(m_value * scalar);
        }
        constexpr Quantity operator/(F64 scalar) const noexcept
        {
            return Quantity(m_value / scalar);
        }
        friend constexpr Quantity operator*(F64 scalar, const Quantity& quantity) noexcept
        {
            return quantity * scalar;
        }

        /// @brief Dimensionless ratio of two values of the same family.
        constexpr F64 operator/(const Quantity& other) const noexcept
        {
            return m_value / other.m_value;
        }

        constexpr bool operator==(const Quantity& other) const noexcept
        {
            return m_value == other.m_value;
        }
        constexpr std::partial_ordering operator<=>(const Quantity& other) const noexcept
        {
            return m_value <=> other.m_value;
        }

        [[nodiscard]] constexpr Quantity Abs() const noexcept
        {
            return Quantity(m_value < 0.0 ? -m_value : m_value);
        }

        /// @brief True when `other` lies within `tolerance` of this value.
        [[nodiscard]] constexpr bool Approx(const Quantity& other, const Quantity& tolerance) const noexcept
        {
            return (*this - other).Abs() <= tolerance;
        }

        /// @brief The unit `ToString()` renders in, chosen from the family's threshold table.
        [[nodiscard]] constexpr const UnitType& DisplayUnit() const noexcept;

        /// @brief Renders `"<value> <symbol>"` in the display unit.
        [[nodiscard]] std::string ToString() const;

        /// @brief Renders `"<value> <symbol>"` in `unit`.
        [[nodiscard]] std::string ToString(const UnitType& unit) const;

        /// @brief Parses `"<number> <symbol>"` into a quantity of this family.
        ///
        /// @details Never throws; failures come back as a `ParseError` carrying the input and the
        /// family name.
        [[nodiscard]] static ParseResult<Quantity> Parse(std::string_view text, const ParseOptions& options = {});

        friend std::ostream& operator<<(std::ostream& os, const Quantity& quantity)
        {
            return os << quantity.ToString();
        }

    private:
        constexpr explicit Quantity(F64 canonicalValue) noexcept
            : m_value(canonicalValue)
        {
        }

        F64 m_value;
    };

    template<typename Family>
    constexpr const UnitOfMeasure<Family>& Quantity<Family>::DisplayUnit() const noexcept
    {
        if constexpr (HasDisplayThresholds<Family>)
        {
            const auto& thresholds = QuantityTraits<Family>::DisplayThresholds;
            for (const auto& threshold: thresholds)
            {
                if (To(*threshold.unit) >= threshold.minimum)
                    return *threshold.unit;
            }
            return *thresholds.back().unit;
        }
        else
        {
            return CanonicalUnitOf<Family>();
        }
    }

    template<typename Family>
    std::string Quantity<Family>::ToString() const
    {
        return ToString(DisplayUnit());
    }

    template<typename Family>
    std::string Quantity<Family>::ToString(const UnitType& unit) const
    {
        return detail::FormatWithSymbol(To(unit), unit.Symbol());
    }

    template<typename Family>
    ParseResult<Quantity<Family>> Quantity<Family>::Parse(std::string_view text, const ParseOptions& options)
    {
        constexpr std::string_view familyName = QuantityTraits<Family>::Name;

        const std::string_view body = options.trimWhitespace ? detail::TrimWhitespace(text) : text;
        if (body.empty())
            return std::unexpected(detail::MakeParseError(ParseErrorCode::EmptyInput, text, familyName));

        bool symbolMatched = false;
        for (const auto& entry: SymbolIndex<Family>)
        {
            if (entry.isAlias && !options.allowAliases)
                continue;
            if (!body.ends_with(entry.symbol))
                continue;

            symbolMatched = true;
            const std::string_view digits = detail::TrimTrailingWhitespace(body.substr(0, body.size() - entry.symbol.size()));
            if (const auto number = detail::ParseNumber(digits, options.allowExponent))
                return entry.unit->Of(*number);
        }

        const auto code = symbolMatched ? ParseErrorCode::InvalidNumber : ParseErrorCode::UnknownSymbol;
        return std::unexpected(detail::MakeParseError(code, text, familyName));
    }
}// namespace Quanta

//=== std::formatter integration ===
namespace std
{
    template<typename Family>
    struct formatter<Quanta::Quantity<Family>, char> : public std::formatter<Quanta::F64, char>
    {
        // Format spec applies to the number; the display unit's symbol is appended.
        using Base = std::formatter<Quanta::F64, char>;

        constexpr auto parse(std::format_parse_context& ctx)
        {
            return Base::parse(ctx);
        }

        template<typename FormatContext>
        auto format(const Quanta::Quantity<Family>& quantity, FormatContext& ctx) const
        {
            const auto& unit = quantity.DisplayUnit();
            ctx.advance_to(Base::format(quantity.To(unit), ctx));
            return std::format_to(ctx.out(), " {}", unit.Symbol());
        }
    };
}// namespace std
