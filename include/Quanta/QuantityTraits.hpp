/// @file QuantityTraits.hpp
/// @brief Per-family metadata (name, units, display thresholds) and its declaration-time checks.
#pragma once

#include <Quanta/Defines.hpp>
#include <Quanta/Primitives.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <algorithm>
#include <array>
#include <concepts>
#include <ranges>
#include <string_view>

namespace Quanta
{
    /// @brief One row of a family's "best unit" table: use `unit` when the value in it is at least `minimum`.
    template<typename Family>
    struct DisplayThreshold
    {
        F64                          minimum;
        const UnitOfMeasure<Family>* unit;
    };

    /// @brief Metadata every quantity family specializes.
    ///
    /// A specialization provides:
    /// - `static constexpr std::string_view Name`
    /// - `static constexpr std::array<const UnitOfMeasure<Family>*, N> Units`
    /// - optionally `static constexpr std::array<DisplayThreshold<Family>, M> DisplayThresholds`,
    ///   evaluated top-down; the last row is the fallback.
    template<typename Family>
    struct QuantityTraits;

    template<typename Family>
    concept QuantityFamily = requires {
        { QuantityTraits<Family>::Name } -> std::convertible_to<std::string_view>;
        { QuantityTraits<Family>::Units.size() } -> std::convertible_to<UIntSize>;
    };

    template<typename Family>
    concept HasDisplayThresholds = QuantityFamily<Family> && requires {
        { QuantityTraits<Family>::DisplayThresholds.size() } -> std::convertible_to<UIntSize>;
    };

    namespace detail
    {
        template<typename Family>
        constexpr UIntSize CountSymbol(std::string_view symbol) noexcept
        {
            UIntSize count = 0;
            for (const auto* unit: QuantityTraits<Family>::Units)
            {
                if (unit == nullptr)
                    continue;
                if (unit->Symbol() == symbol)
                    ++count;
                for (const auto alias: unit->Aliases())
                    if (alias == symbol)
                        ++count;
            }
            return count;
        }

        template<typename Family>
        constexpr bool IsListedUnit(const UnitOfMeasure<Family>* candidate) noexcept
        {
            for (const auto* unit: QuantityTraits<Family>::Units)
                if (unit == candidate)
                    return true;
            return false;
        }
    }// namespace detail

    /// @brief Checks the static invariants of a family declaration.
    ///
    /// @return An empty view when the family is well formed, otherwise a description of the first problem.
    /// Catalog headers `static_assert` on the result right after each family.
    template<QuantityFamily Family>
    constexpr std::string_view ValidateFamily() noexcept
    {
        using Traits = QuantityTraits<Family>;

        if (std::string_view {Traits::Name}.empty())
            return "family has no name";
        if (Traits::Units.size() == 0)
            return "family declares no units";

        UIntSize canonicalCount = 0;
        for (const auto* unit: Traits::Units)
        {
            if (unit == nullptr)
                return "family lists a null unit";
            if (unit->IsCanonical())
                ++canonicalCount;
        }
        if (canonicalCount == 0)
            return "family declares no canonical unit";
        if (canonicalCount > 1)
            return "family declares more than one canonical unit";

        for (const auto* unit: Traits::Units)
        {
            if (detail::CountSymbol<Family>(unit->Symbol()) != 1)
                return "unit symbol is not unique within the family";
            for (const auto alias: unit->Aliases())
                if (alias.empty() || detail::CountSymbol<Family>(alias) != 1)
                    return "unit alias is empty or not unique within the family";
        }

        if constexpr (HasDisplayThresholds<Family>)
        {
            if (Traits::DisplayThresholds.size() == 0)
                return "display threshold table is empty";
            for (const auto& threshold: Traits::DisplayThresholds)
                if (!detail::IsListedUnit<Family>(threshold.unit))
                    return "display threshold names a unit outside the family";
        }
        return {};
    }

    /// @brief The unit a family stores its values in.
    template<QuantityFamily Family>
    constexpr const UnitOfMeasure<Family>& CanonicalUnitOf() noexcept
    {
        for (const auto* unit: QuantityTraits<Family>::Units)
            if (unit->IsCanonical())
                return *unit;
        Unreachable();
    }

    /// @brief Parse lookup entry: one symbol or alias of a unit.
    template<typename Family>
    struct SymbolEntry
    {
        std::string_view             symbol;
        const UnitOfMeasure<Family>* unit;
        bool                         isAlias;
    };

    namespace detail
    {
        template<typename Family>
        constexpr UIntSize SymbolCount() noexcept
        {
            UIntSize count = 0;
            for (const auto* unit: QuantityTraits<Family>::Units)
                count += 1 + unit->Aliases().size();
            return count;
        }

        template<typename Family>
        constexpr auto BuildSymbolIndex() noexcept
        {
            std::array<SymbolEntry<Family>, SymbolCount<Family>()> index {};
            UIntSize                                                next = 0;
            for (const auto* unit: QuantityTraits<Family>::Units)
            {
                index[next++] = SymbolEntry<Family> {unit->Symbol(), unit, false};
                for (const auto alias: unit->Aliases())
                    index[next++] = SymbolEntry<Family> {alias, unit, true};
            }
            QUANTA_ASSERT(next == index.size(), "Symbol index size does not match the family's symbols");
            // Longest first, so "mg" is tried before "g".
            std::ranges::sort(index, [](const SymbolEntry<Family>& a, const SymbolEntry<Family>& b) {
                return a.symbol.size() > b.symbol.size();
            });
            return index;
        }
    }// namespace detail

    /// @brief Every symbol and alias of a family, longest first.
    template<QuantityFamily Family>
    inline constexpr auto SymbolIndex = detail::BuildSymbolIndex<Family>();
}// namespace Quanta
