/// @file TimeDerivative.hpp
/// @brief Time-derivative pairings: a family and its rate of change over time.
///
/// Declaring `Velocity` as the time derivative of `Length` once yields four operators:
/// `Length / Time -> Velocity`, `Velocity * Time -> Length`, `Time * Velocity -> Length` and
/// `Length / Velocity -> Time`.
#pragma once

#include <Quanta/Derivation.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/UnitOfMeasure.hpp>
#include <Quanta/Units/Time.hpp>

#include <concepts>

namespace Quanta
{
    /// @brief Specialized (through `QUANTA_DECLARE_TIME_DERIVATIVE`) for every family with a declared derivative.
    template<typename Integral>
    struct TimeDerivativeOf
    {
    };

    /// @brief Reverse lookup of `TimeDerivativeOf`, specialized by the same macro.
    template<typename Derivative>
    struct TimeIntegralOf
    {
    };

    /// @brief The conversion rules of one pairing.
    ///
    /// @tparam IntegralUnit Unit of the integral family such that the derivative's canonical unit is
    ///         `IntegralUnit` per `TimeUnit`.
    template<typename Integral,
             typename Derivative,
             const UnitOfMeasure<Integral>&   IntegralUnit,
             const UnitOfMeasure<TimeFamily>& TimeUnit>
    struct TimePairing
    {
        using IntegralFamily   = Integral;
        using DerivativeFamily = Derivative;

        [[nodiscard]] static constexpr Quantity<Derivative> Rate(const Quantity<Integral>& change, const Time& time) noexcept
        {
            return Quantity<Derivative>::FromCanonical(change.To(IntegralUnit) / time.To(TimeUnit));
        }

        [[nodiscard]] static constexpr Quantity<Integral> Accumulate(const Quantity<Derivative>& rate, const Time& time) noexcept
        {
            return IntegralUnit.Of(rate.Value() * time.To(TimeUnit));
        }

        [[nodiscard]] static constexpr Time Duration(const Quantity<Integral>& change, const Quantity<Derivative>& rate) noexcept
        {
            return TimeUnit.Of(change.To(IntegralUnit) / rate.Value());
        }
    };

    template<typename Integral>
    concept HasTimeDerivative = requires {
        typename TimeDerivativeOf<Integral>::DerivativeFamily;
    };

    template<typename Derivative>
    concept HasTimeIntegral = requires {
        typename TimeIntegralOf<Derivative>::IntegralFamily;
    };

    template<HasTimeDerivative Integral>
    struct Quotient<Integral, TimeFamily>
        : Derivation<Integral, Operation::Divide, TimeFamily, typename TimeDerivativeOf<Integral>::DerivativeFamily>
    {
        [[nodiscard]] static constexpr auto Apply(const Quantity<Integral>& change, const Time& time) noexcept
        {
            return TimeDerivativeOf<Integral>::Rate(change, time);
        }
    };

    template<HasTimeIntegral Derivative>
    struct Product<Derivative, TimeFamily>
        : Derivation<Derivative, Operation::Multiply, TimeFamily, typename TimeIntegralOf<Derivative>::IntegralFamily>
    {
        [[nodiscard]] static constexpr auto Apply(const Quantity<Derivative>& rate, const Time& time) noexcept
        {
            return TimeIntegralOf<Derivative>::Accumulate(rate, time);
        }
    };

    template<HasTimeIntegral Derivative>
    struct Product<TimeFamily, Derivative>
        : Derivation<TimeFamily, Operation::Multiply, Derivative, typename TimeIntegralOf<Derivative>::IntegralFamily>
    {
        [[nodiscard]] static constexpr auto Apply(const Time& time, const Quantity<Derivative>& rate) noexcept
        {
            return TimeIntegralOf<Derivative>::Accumulate(rate, time);
        }
    };

    template<HasTimeDerivative Integral, typename Derivative>
        requires std::same_as<typename TimeDerivativeOf<Integral>::DerivativeFamily, Derivative>
    struct Quotient<Integral, Derivative> : Derivation<Integral, Operation::Divide, Derivative, TimeFamily>
    {
        [[nodiscard]] static constexpr Time Apply(const Quantity<Integral>& change, const Quantity<Derivative>& rate) noexcept
        {
            return TimeDerivativeOf<Integral>::Duration(change, rate);
        }
    };
}// namespace Quanta

/// @brief Declares `DerivativeFamily` as the time derivative of `IntegralFamily`.
///
/// The derivative's canonical unit must equal `integralUnit` per `timeUnit`. Use at namespace `Quanta` scope,
/// once per pair.
#define QUANTA_DECLARE_TIME_DERIVATIVE(IntegralFamily, DerivativeFamily, integralUnit, timeUnit)                           \
    template<>                                                                                                            \
    struct TimeDerivativeOf<IntegralFamily> : ::Quanta::TimePairing<IntegralFamily, DerivativeFamily, integralUnit, timeUnit> \
    {                                                                                                                     \
    };                                                                                                                    \
    template<>                                                                                                            \
    struct TimeIntegralOf<DerivativeFamily> : ::Quanta::TimePairing<IntegralFamily, DerivativeFamily, integralUnit, timeUnit> \
    {                                                                                                                     \
    }
