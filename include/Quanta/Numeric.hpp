/// @file Numeric.hpp
/// @brief Numeric adapter so quantities of one family work with generic algorithms (sum, mean, sort).
#pragma once

#include <Quanta/Primitives.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <optional>
#include <ranges>

namespace Quanta
{
    /// @brief Numeric operations for one family, with an explicit reference unit.
    ///
    /// @details The reference unit defines `One()`, `FromInteger` and `ToDouble`. Everything else acts on
    /// canonical values and does not depend on it.
    template<typename Family>
    class QuantityNumeric
    {
    public:
        using ValueType = Quantity<Family>;

        constexpr explicit QuantityNumeric(const UnitOfMeasure<Family>& reference) noexcept
            : m_reference(&reference)
        {
        }

        [[nodiscard]] constexpr ValueType Zero() const noexcept { return ValueType::FromCanonical(0.0); }
        [[nodiscard]] constexpr ValueType One() const noexcept { return m_reference->Of(1.0); }

        [[nodiscard]] constexpr ValueType Add(const ValueType& a, const ValueType& b) const noexcept { return a + b; }
        [[nodiscard]] constexpr ValueType Subtract(const ValueType& a, const ValueType& b) const noexcept { return a - b; }
        [[nodiscard]] constexpr ValueType Multiply(const ValueType& a, F64 scalar) const noexcept { return a * scalar; }
        [[nodiscard]] constexpr ValueType Divide(const ValueType& a, F64 scalar) const noexcept { return a / scalar; }
        [[nodiscard]] constexpr ValueType Negate(const ValueType& a) const noexcept { return -a; }

        [[nodiscard]] constexpr std::partial_ordering Compare(const ValueType& a, const ValueType& b) const noexcept
        {
            return a <=> b;
        }

        [[nodiscard]] constexpr ValueType FromInteger(Int64 value) const noexcept
        {
            return m_reference->Of(static_cast<F64>(value));
        }

        [[nodiscard]] constexpr F64 ToDouble(const ValueType& a) const noexcept { return a.To(*m_reference); }

        [[nodiscard]] constexpr const UnitOfMeasure<Family>& Reference() const noexcept { return *m_reference; }

    private:
        const UnitOfMeasure<Family>* m_reference;
    };

    template<typename N>
    concept NumericAdapter = requires(const N& numeric, const typename N::ValueType& a, const typename N::ValueType& b, F64 scalar) {
        { numeric.Zero() } -> std::same_as<typename N::ValueType>;
        { numeric.Add(a, b) } -> std::same_as<typename N::ValueType>;
        { numeric.Multiply(a, scalar) } -> std::same_as<typename N::ValueType>;
        { numeric.Divide(a, scalar) } -> std::same_as<typename N::ValueType>;
        { numeric.Compare(a, b) } -> std::convertible_to<std::partial_ordering>;
    };

    /// @brief Sum of `values`; `numeric.Zero()` for an empty range.
    template<NumericAdapter N, std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, typename N::ValueType>
    [[nodiscard]] constexpr typename N::ValueType Sum(const N& numeric, R&& values)
    {
        auto total = numeric.Zero();
        for (const auto& value: values)
            total = numeric.Add(total, value);
        return total;
    }

    /// @brief Arithmetic mean of `values`, or `std::nullopt` for an empty range.
    template<NumericAdapter N, std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, typename N::ValueType>
    [[nodiscard]] constexpr std::optional<typename N::ValueType> Mean(const N& numeric, R&& values)
    {
        auto     total = numeric.Zero();
        UIntSize count = 0;
        for (const auto& value: values)
        {
            total = numeric.Add(total, value);
            ++count;
        }
        if (count == 0)
            return std::nullopt;
        return numeric.Divide(total, static_cast<F64>(count));
    }

    /// @brief Sorts `values` ascending by `numeric.Compare`.
    ///
    /// @details Values unordered against themselves (NaN) are moved to the end first, in unspecified
    /// order, so the comparison used for sorting stays a strict weak ordering.
    template<NumericAdapter N, std::ranges::random_access_range R>
        requires std::permutable<std::ranges::iterator_t<R>>
    constexpr void Sort(const N& numeric, R&& values)
    {
        const auto unordered = std::ranges::partition(values, [&numeric](const auto& value) {
            return numeric.Compare(value, value) != std::partial_ordering::unordered;
        });
        std::ranges::sort(std::ranges::begin(values), unordered.begin(), [&numeric](const auto& a, const auto& b) {
            return numeric.Compare(a, b) == std::partial_ordering::less;
        });
    }
}// namespace Quanta
