/// @file Derivation.hpp
/// @brief Declared relations between quantity families: `A * B = C` and `A / B = C`.
///
/// Relations are explicit specializations of `Product<A, B>` and `Quotient<A, B>`. Nothing is inferred:
/// not transitivity, not commutation. An undeclared combination has no `operator*` / `operator/` and
/// fails to compile.
///
/// The catalog's relations live in `Quanta/Units/Relations.hpp`, not in the family headers. Include it
/// (or `Quanta/Quanta.hpp`) before using cross-family operators or checking `DeclaredProduct` /
/// `DeclaredQuotient` on catalog families: every translation unit must see the same specializations.
#pragma once

#include <Quanta/Defines.hpp>
#include <Quanta/Primitives.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>

#include <array>
#include <concepts>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Quanta
{
    enum class Operation : UInt8
    {
        Multiply,
        Divide,
    };

    [[nodiscard]] constexpr char OperationSymbol(Operation operation) noexcept
    {
        return operation == Operation::Multiply ? '*' : '/';
    }

    /// @brief `Product<A, B>` is specialized for every declared `A * B`. The primary template is empty.
    template<typename Lhs, typename Rhs>
    struct Product
    {
    };

    /// @brief `Quotient<A, B>` is specialized for every declared `A / B`. The primary template is empty.
    template<typename Lhs, typename Rhs>
    struct Quotient
    {
    };

    /// @brief Base of every relation specialization.
    ///
    /// The default `Apply` multiplies or divides the canonical values. Relations whose families need a
    /// normalizing constant (energy per hour, mass in kilograms) hide it with their own `Apply`.
    template<typename Lhs, Operation Op, typename Rhs, typename Result>
    struct Derivation
    {
        using LhsFamily    = Lhs;
        using RhsFamily    = Rhs;
        using ResultFamily = Result;

        static constexpr Operation OPERATION = Op;

        [[nodiscard]] static constexpr Quantity<Result> Apply(const Quantity<Lhs>& lhs, const Quantity<Rhs>& rhs) noexcept
        {
            if constexpr (Op == Operation::Multiply)
                return Quantity<Result>::FromCanonical(lhs.Value() * rhs.Value());
            else
                return Quantity<Result>::FromCanonical(lhs.Value() / rhs.Value());
        }
    };

    template<typename D>
    concept DerivationType = requires(const Quantity<typename D::LhsFamily>& lhs, const Quantity<typename D::RhsFamily>& rhs) {
        typename D::ResultFamily;
        { D::OPERATION } -> std::convertible_to<Operation>;
        { D::Apply(lhs, rhs) } -> std::same_as<Quantity<typename D::ResultFamily>>;
    };

    template<typename Lhs, typename Rhs>
    concept DeclaredProduct = DerivationType<Product<Lhs, Rhs>> && Product<Lhs, Rhs>::OPERATION == Operation::Multiply;

    template<typename Lhs, typename Rhs>
    concept DeclaredQuotient = DerivationType<Quotient<Lhs, Rhs>> && Quotient<Lhs, Rhs>::OPERATION == Operation::Divide;

    template<typename Lhs, typename Rhs>
        requires DeclaredProduct<Lhs, Rhs>
    constexpr auto operator*(const Quantity<Lhs>& lhs, const Quantity<Rhs>& rhs) noexcept
    {
        return Product<Lhs, Rhs>::Apply(lhs, rhs);
    }

    template<typename Lhs, typename Rhs>
        requires DeclaredQuotient<Lhs, Rhs>
    constexpr auto operator/(const Quantity<Lhs>& lhs, const Quantity<Rhs>& rhs) noexcept
    {
        return Quotient<Lhs, Rhs>::Apply(lhs, rhs);
    }

    /// @brief Declares `B * A = C` from a declared `A * B = C`.
    template<typename P>
    struct Commuted : Derivation<typename P::RhsFamily, Operation::Multiply, typename P::LhsFamily, typename P::ResultFamily>
    {
        static_assert(P::OPERATION == Operation::Multiply, "Only products commute");

        [[nodiscard]] static constexpr auto Apply(const Quantity<typename P::RhsFamily>& lhs,
                                                  const Quantity<typename P::LhsFamily>& rhs) noexcept
        {
            return P::Apply(rhs, lhs);
        }
    };

    namespace detail
    {
        /// @brief Canonical factor `k` of a product, such that `C = k * a * b` in canonical values.
        template<typename P>
        constexpr F64 ProductConstant() noexcept
        {
            return P::Apply(Quantity<typename P::LhsFamily>::FromCanonical(1.0),
                            Quantity<typename P::RhsFamily>::FromCanonical(1.0))
                    .Value();
        }
    }// namespace detail

    /// @brief Declares `C / B = A` for a declared product `A * B = C`.
    ///
    /// The product must be bilinear in canonical values, which holds for every product of linear units.
    template<typename P>
    struct SolveForLhs : Derivation<typename P::ResultFamily, Operation::Divide, typename P::RhsFamily, typename P::LhsFamily>
    {
        static_assert(P::OPERATION == Operation::Multiply, "Only products can be solved for an operand");

        [[nodiscard]] static constexpr auto Apply(const Quantity<typename P::ResultFamily>& result,
                                                  const Quantity<typename P::RhsFamily>&    rhs) noexcept
        {
            return Quantity<typename P::LhsFamily>::FromCanonical(result.Value() / (rhs.Value() * detail::ProductConstant<P>()));
        }
    };

    /// @brief Declares `C / A = B` for a declared product `A * B = C`.
    template<typename P>
    struct SolveForRhs : Derivation<typename P::ResultFamily, Operation::Divide, typename P::LhsFamily, typename P::RhsFamily>
    {
        static_assert(P::OPERATION == Operation::Multiply, "Only products can be solved for an operand");

        [[nodiscard]] static constexpr auto Apply(const Quantity<typename P::ResultFamily>& result,
                                                  const Quantity<typename P::LhsFamily>&    lhs) noexcept
        {
            return Quantity<typename P::RhsFamily>::FromCanonical(result.Value() / (lhs.Value() * detail::ProductConstant<P>()));
        }
    };

    /// @brief A declared product whose result can be divided back into either operand.
    template<typename P>
    concept HasInverseDecompositions =
            DerivationType<P> && P::OPERATION == Operation::Multiply &&
            DeclaredQuotient<typename P::ResultFamily, typename P::RhsFamily> &&
            DeclaredQuotient<typename P::ResultFamily, typename P::LhsFamily> &&
            std::same_as<typename Quotient<typename P::ResultFamily, typename P::RhsFamily>::ResultFamily, typename P::LhsFamily> &&
            std::same_as<typename Quotient<typename P::ResultFamily, typename P::LhsFamily>::ResultFamily, typename P::RhsFamily>;

    /// @brief A relation as plain data, for inspecting and testing the derivation graph.
    struct DerivationInfo
    {
        std::string_view lhs;
        Operation        operation;
        std::string_view rhs;
        std::string_view result;

        constexpr bool operator==(const DerivationInfo&) const noexcept = default;
    };

    template<DerivationType D>
    [[nodiscard]] constexpr DerivationInfo Describe() noexcept
    {
        return DerivationInfo {
                QuantityTraits<typename D::LhsFamily>::Name,
                D::OPERATION,
                QuantityTraits<typename D::RhsFamily>::Name,
                QuantityTraits<typename D::ResultFamily>::Name,
        };
    }

    /// @brief `"Mass * Velocity = Momentum"`.
    [[nodiscard]] inline std::string ToString(const DerivationInfo& info)
    {
        return std::format("{} {} {} = {}", info.lhs, OperationSymbol(info.operation), info.rhs, info.result);
    }

    /// @brief A registry of relations, inspectable as a table.
    template<DerivationType... Derivations>
    struct DerivationList
    {
        static constexpr UIntSize SIZE = sizeof...(Derivations);

        [[nodiscard]] static constexpr std::array<DerivationInfo, SIZE> Table() noexcept
        {
            return {Describe<Derivations>()...};
        }

        /// @brief True when no two entries share the same `(lhs, operation, rhs)` key.
        [[nodiscard]] static constexpr bool ValidateDerivations() noexcept
        {
            constexpr auto table = Table();
            for (UIntSize i = 0; i < SIZE; ++i)
                for (UIntSize j = i + 1; j < SIZE; ++j)
                    if (table[i].lhs == table[j].lhs && table[i].operation == table[j].operation && table[i].rhs == table[j].rhs)
                        return false;
            return true;
        }
    };

    /// @brief Looks a relation up by family names.
    [[nodiscard]] constexpr std::optional<DerivationInfo> FindDerivation(std::span<const DerivationInfo> table,
                                                                         std::string_view                 lhs,
                                                                         Operation                        operation,
                                                                         std::string_view                 rhs) noexcept
    {
        for (const auto& info: table)
            if (info.lhs == lhs && info.operation == operation && info.rhs == rhs)
                return info;
        return std::nullopt;
    }
}// namespace Quanta
