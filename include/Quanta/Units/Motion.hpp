#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct VelocityFamily
    {
    };
    struct AccelerationFamily
    {
    };
    struct JerkFamily
    {
    };
    struct MomentumFamily
    {
    };
    struct ForceFamily
    {
    };

    /// @brief Standard gravity in m/s².
    inline constexpr F64 StandardGravity = 9.80665;

    namespace detail
    {
        inline constexpr std::string_view MeterPerSecondSquaredAliases[] {"m/s2"};
        inline constexpr std::string_view EarthGravityAliases[] {"g0"};
        inline constexpr std::string_view MeterPerSecondCubedAliases[] {"m/s3"};
        inline constexpr std::string_view NewtonSecondAliases[] {"Ns"};
    }// namespace detail

#pragma region Velocity
    inline constexpr UnitOfMeasure<VelocityFamily> MetersPerSecond {"m/s", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<VelocityFamily> KilometersPerHour {"km/h", MetricSystem::Kilo / 3600.0};
    inline constexpr UnitOfMeasure<VelocityFamily> FeetPerSecond {"ft/s", 0.3048};
    inline constexpr UnitOfMeasure<VelocityFamily> UsMilesPerHour {"mph", 1609.344 / 3600.0};
    inline constexpr UnitOfMeasure<VelocityFamily> Knots {"kn", 1852.0 / 3600.0};

    template<>
    struct QuantityTraits<VelocityFamily>
    {
        static constexpr std::string_view Name = "Velocity";

        static constexpr std::array Units {&MetersPerSecond, &KilometersPerHour, &FeetPerSecond, &UsMilesPerHour, &Knots};
    };

    using Velocity = Quantity<VelocityFamily>;

    static_assert(ValidateFamily<VelocityFamily>().empty());
#pragma endregion

#pragma region Acceleration
    inline constexpr UnitOfMeasure<AccelerationFamily> MetersPerSecondSquared {"m/s²", 1.0, UnitRole::Canonical,
                                                                               detail::MeterPerSecondSquaredAliases};
    inline constexpr UnitOfMeasure<AccelerationFamily> FeetPerSecondSquared {"ft/s²", 0.3048};
    inline constexpr UnitOfMeasure<AccelerationFamily> EarthGravities {"g₀", StandardGravity, UnitRole::Alternate,
                                                                       detail::EarthGravityAliases};

    template<>
    struct QuantityTraits<AccelerationFamily>
    {
        static constexpr std::string_view Name = "Acceleration";

        static constexpr std::array Units {&MetersPerSecondSquared, &FeetPerSecondSquared, &EarthGravities};
    };

    using Acceleration = Quantity<AccelerationFamily>;

    static_assert(ValidateFamily<AccelerationFamily>().empty());
#pragma endregion

#pragma region Jerk
    inline constexpr UnitOfMeasure<JerkFamily> MetersPerSecondCubed {"m/s³", 1.0, UnitRole::Canonical, detail::MeterPerSecondCubedAliases};
    inline constexpr UnitOfMeasure<JerkFamily> FeetPerSecondCubed {"ft/s³", 0.3048};

    template<>
    struct QuantityTraits<JerkFamily>
    {
        static constexpr std::string_view Name = "Jerk";

        static constexpr std::array Units {&MetersPerSecondCubed, &FeetPerSecondCubed};
    };

    using Jerk = Quantity<JerkFamily>;

    static_assert(ValidateFamily<JerkFamily>().empty());
#pragma endregion

#pragma region Momentum
    inline constexpr UnitOfMeasure<MomentumFamily> NewtonSeconds {"N·s", 1.0, UnitRole::Canonical, detail::NewtonSecondAliases};

    template<>
    struct QuantityTraits<MomentumFamily>
    {
        static constexpr std::string_view Name = "Momentum";

        static constexpr std::array Units {&NewtonSeconds};
    };

    using Momentum = Quantity<MomentumFamily>;

    static_assert(ValidateFamily<MomentumFamily>().empty());
#pragma endregion

#pragma region Force
    inline constexpr UnitOfMeasure<ForceFamily> Newtons {"N", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ForceFamily> KiloNewtons {"kN", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<ForceFamily> MegaNewtons {"MN", MetricSystem::Mega};
    inline constexpr UnitOfMeasure<ForceFamily> PoundForce {"lbf", 4.4482216152605};
    inline constexpr UnitOfMeasure<ForceFamily> KilogramForce {"kgf", StandardGravity};

    template<>
    struct QuantityTraits<ForceFamily>
    {
        static constexpr std::string_view Name = "Force";

        static constexpr std::array Units {&Newtons, &KiloNewtons, &MegaNewtons, &PoundForce, &KilogramForce};
    };

    using Force = Quantity<ForceFamily>;

    static_assert(ValidateFamily<ForceFamily>().empty());
#pragma endregion
}// namespace Quanta
