#pragma once
#include <Quanta/Defines.hpp>
#include <Quanta/Primitives.hpp>

#include <span>
#include <string_view>

namespace Quanta
{
    template<typename Family>
    class Quantity;

    /// @brief Converter used by non-linear units (temperature scales with offsets and the like).
    using ConversionFunction = F64 (*)(F64) noexcept;

    /// @brief Whether a unit is the canonical unit its family stores values in.
    enum class UnitRole : UInt8
    {
        Alternate,
        Canonical,
    };

    /// @brief A named conversion rule between a family's canonical unit and a user-facing unit.
    ///
    /// @details Linear units carry a multiplier `m` with `canonical = raw * m`. Non-linear units carry an
    /// explicit pair of converters. Declaration errors (empty symbol, zero or non-finite multiplier,
    /// missing converter, canonical unit with a multiplier other than 1) fail compilation when the unit
    /// is declared `constexpr`, and abort through `QUANTA_ABORT` when it is built at run time.
    ///
    /// @tparam Family Tag type of the quantity family the unit belongs to.
    template<typename Family>
    class UnitOfMeasure
    {
    public:
        using FamilyType   = Family;
        using QuantityType = Quantity<Family>;

        /// @brief Declares a linear unit.
        /// @param symbol Display and parse symbol, unique within the family.
        /// @param multiplier Canonical value of one of this unit.
        /// @param role `UnitRole::Canonical` for the family's storage unit.
        /// @param aliases Additional symbols accepted when parsing.
        constexpr UnitOfMeasure(std::string_view                  symbol,
                                F64                               multiplier,
                                UnitRole                          role    = UnitRole::Alternate,
                                std::span<const std::string_view> aliases = {})
            : m_symbol(symbol), m_aliases(aliases), m_multiplier(multiplier), m_role(role)
        {
            if (symbol.empty())
                QUANTA_ABORT("UnitOfMeasure declared with an empty symbol");
            if (multiplier == 0.0)
                QUANTA_ABORT("UnitOfMeasure declared with a zero multiplier");
            if (multiplier != multiplier || multiplier - multiplier != 0.0)
                QUANTA_ABORT("UnitOfMeasure declared with a non-finite multiplier");
            if (role == UnitRole::Canonical && multiplier != 1.0)
                QUANTA_ABORT("Canonical unit must have a multiplier of exactly 1");
        }

        /// @brief Declares a non-linear unit from a pair of converters.
        ///
        /// Non-linear units are never canonical.
        constexpr UnitOfMeasure(std::string_view                  symbol,
                                ConversionFunction                toCanonical,
                                ConversionFunction                fromCanonical,
                                std::span<const std::string_view> aliases = {})
            : m_symbol(symbol), m_aliases(aliases), m_toCanonical(toCanonical), m_fromCanonical(fromCanonical)
        {
            if (symbol.empty())
                QUANTA_ABORT("UnitOfMeasure declared with an empty symbol");
            if (toCanonical == nullptr || fromCanonical == nullptr)
                QUANTA_ABORT("Non-linear UnitOfMeasure declared without both converters");
        }

        [[nodiscard]] constexpr F64 ToCanonical(F64 raw) const noexcept
        {
            if (m_toCanonical != nullptr)
                return m_toCanonical(raw);
            return raw * m_multiplier;
        }

        [[nodiscard]] constexpr F64 FromCanonical(F64 canonical) const noexcept
        {
            if (m_fromCanonical != nullptr)
                return m_fromCanonical(canonical);
            return canonical / m_multiplier;
        }

        /// @brief Creates a quantity holding `raw` of this unit.
        [[nodiscard]] constexpr QuantityType Of(F64 raw) const noexcept
        {
            return QuantityType::FromCanonical(ToCanonical(raw));
        }

        /// @brief Shorthand for `Of`, so units read as builders: `Kilograms(5.0)`.
        [[nodiscard]] constexpr QuantityType operator()(F64 raw) const noexcept
        {
            return Of(raw);
        }

        [[nodiscard]] constexpr std::string_view Symbol() const noexcept { return m_symbol; }
        [[nodiscard]] constexpr std::span<const std::string_view> Aliases() const noexcept { return m_aliases; }
        [[nodiscard]] constexpr bool IsCanonical() const noexcept { return m_role == UnitRole::Canonical; }
        [[nodiscard]] constexpr bool IsLinear() const noexcept { return m_toCanonical == nullptr; }

        /// @brief Linear multiplier; 1 for non-linear units, where it carries no meaning.
        [[nodiscard]] constexpr F64 Multiplier() const noexcept { return m_multiplier; }

        /// @brief Same symbol, role and conversion rule. Aliases are not compared.
        [[nodiscard]] constexpr bool operator==(const UnitOfMeasure& other) const noexcept
        {
            return m_symbol == other.m_symbol && m_role == other.m_role && m_multiplier == other.m_multiplier &&
                   m_toCanonical == other.m_toCanonical && m_fromCanonical == other.m_fromCanonical;
        }

    private:
        std::string_view                  m_symbol;
        std::span<const std::string_view> m_aliases {};
        F64                               m_multiplier {1.0};
        ConversionFunction                m_toCanonical {nullptr};
        ConversionFunction                m_fromCanonical {nullptr};
        UnitRole                          m_role {UnitRole::Alternate};
    };
}// namespace Quanta
