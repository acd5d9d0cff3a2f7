#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct LengthFamily
    {
    };
    struct AreaFamily
    {
    };
    struct VolumeFamily
    {
    };
    struct SolidAngleFamily
    {
    };

    namespace detail
    {
        inline constexpr std::string_view MicrometerAliases[] {"um"};
        inline constexpr std::string_view SquareMeterAliases[] {"m2"};
        inline constexpr std::string_view CubicMeterAliases[] {"m3"};
        inline constexpr std::string_view LiterAliases[] {"l"};
    }// namespace detail

#pragma region Length
    inline constexpr UnitOfMeasure<LengthFamily> Meters {"m", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<LengthFamily> Nanometers {"nm", MetricSystem::Nano};
    inline constexpr UnitOfMeasure<LengthFamily> Micrometers {"µm", MetricSystem::Micro, UnitRole::Alternate, detail::MicrometerAliases};
    inline constexpr UnitOfMeasure<LengthFamily> Millimeters {"mm", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<LengthFamily> Centimeters {"cm", MetricSystem::Centi};
    inline constexpr UnitOfMeasure<LengthFamily> Decimeters {"dm", MetricSystem::Deci};
    inline constexpr UnitOfMeasure<LengthFamily> Kilometers {"km", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<LengthFamily> Inches {"in", 0.0254};
    inline constexpr UnitOfMeasure<LengthFamily> Feet {"ft", 0.3048};
    inline constexpr UnitOfMeasure<LengthFamily> Yards {"yd", 0.9144};
    inline constexpr UnitOfMeasure<LengthFamily> UsMiles {"mi", 1609.344};
    inline constexpr UnitOfMeasure<LengthFamily> NauticalMiles {"nmi", 1852.0};

    template<>
    struct QuantityTraits<LengthFamily>
    {
        static constexpr std::string_view Name = "Length";

        static constexpr std::array Units {&Meters, &Nanometers, &Micrometers, &Millimeters, &Centimeters, &Decimeters,
                                           &Kilometers, &Inches, &Feet, &Yards, &UsMiles, &NauticalMiles};

        static constexpr std::array DisplayThresholds {
                DisplayThreshold<LengthFamily> {1.0, &Kilometers},
                DisplayThreshold<LengthFamily> {1.0, &Meters},
                DisplayThreshold<LengthFamily> {1.0, &Centimeters},
                DisplayThreshold<LengthFamily> {0.0, &Millimeters},
        };
    };

    using Length = Quantity<LengthFamily>;

    static_assert(ValidateFamily<LengthFamily>().empty());
#pragma endregion

#pragma region Area
    inline constexpr UnitOfMeasure<AreaFamily> SquareMeters {"m²", 1.0, UnitRole::Canonical, detail::SquareMeterAliases};
    inline constexpr UnitOfMeasure<AreaFamily> SquareCentimeters {"cm²", MetricSystem::Centi * MetricSystem::Centi};
    inline constexpr UnitOfMeasure<AreaFamily> SquareKilometers {"km²", MetricSystem::Kilo * MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<AreaFamily> SquareFeet {"ft²", 0.09290304};
    inline constexpr UnitOfMeasure<AreaFamily> Hectares {"ha", 10000.0};

    template<>
    struct QuantityTraits<AreaFamily>
    {
        static constexpr std::string_view Name = "Area";

        static constexpr std::array Units {&SquareMeters, &SquareCentimeters, &SquareKilometers, &SquareFeet, &Hectares};
    };

    using Area = Quantity<AreaFamily>;

    static_assert(ValidateFamily<AreaFamily>().empty());
#pragma endregion

#pragma region Volume
    inline constexpr UnitOfMeasure<VolumeFamily> CubicMeters {"m³", 1.0, UnitRole::Canonical, detail::CubicMeterAliases};
    inline constexpr UnitOfMeasure<VolumeFamily> CubicCentimeters {"cm³", 1e-6};
    inline constexpr UnitOfMeasure<VolumeFamily> Milliliters {"mL", 1e-6};
    inline constexpr UnitOfMeasure<VolumeFamily> Liters {"L", 1e-3, UnitRole::Alternate, detail::LiterAliases};
    inline constexpr UnitOfMeasure<VolumeFamily> UsGallons {"gal", 0.003785411784};

    template<>
    struct QuantityTraits<VolumeFamily>
    {
        static constexpr std::string_view Name = "Volume";

        static constexpr std::array Units {&CubicMeters, &CubicCentimeters, &Milliliters, &Liters, &UsGallons};
    };

    using Volume = Quantity<VolumeFamily>;

    static_assert(ValidateFamily<VolumeFamily>().empty());
#pragma endregion

#pragma region SolidAngle
    inline constexpr UnitOfMeasure<SolidAngleFamily> SquaredRadians {"sr", 1.0, UnitRole::Canonical};

    template<>
    struct QuantityTraits<SolidAngleFamily>
    {
        static constexpr std::string_view Name = "SolidAngle";

        static constexpr std::array Units {&SquaredRadians};
    };

    using SolidAngle = Quantity<SolidAngleFamily>;

    static_assert(ValidateFamily<SolidAngleFamily>().empty());
#pragma endregion
}// namespace Quanta
