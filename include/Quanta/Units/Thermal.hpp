#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct TemperatureFamily
    {
    };
    struct ThermalCapacityFamily
    {
    };

    inline constexpr F64 CelsiusOffset    = 273.15;
    inline constexpr F64 FahrenheitOffset = 32.0;

    namespace detail
    {
        constexpr F64 CelsiusToKelvin(F64 celsius) noexcept
        {
            return celsius + CelsiusOffset;
        }

        constexpr F64 KelvinToCelsius(F64 kelvin) noexcept
        {
            return kelvin - CelsiusOffset;
        }

        constexpr F64 FahrenheitToKelvin(F64 fahrenheit) noexcept
        {
            return (fahrenheit - FahrenheitOffset) * 5.0 / 9.0 + CelsiusOffset;
        }

        constexpr F64 KelvinToFahrenheit(F64 kelvin) noexcept
        {
            return (kelvin - CelsiusOffset) * 9.0 / 5.0 + FahrenheitOffset;
        }

        inline constexpr std::string_view CelsiusAliases[] {"degC"};
        inline constexpr std::string_view FahrenheitAliases[] {"degF"};
        inline constexpr std::string_view RankineAliases[] {"degR"};
    }// namespace detail

#pragma region Temperature
    inline constexpr UnitOfMeasure<TemperatureFamily> Kelvin {"K", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<TemperatureFamily> Celsius {"°C", detail::CelsiusToKelvin, detail::KelvinToCelsius, detail::CelsiusAliases};
    inline constexpr UnitOfMeasure<TemperatureFamily> Fahrenheit {"°F", detail::FahrenheitToKelvin, detail::KelvinToFahrenheit,
                                                                  detail::FahrenheitAliases};
    inline constexpr UnitOfMeasure<TemperatureFamily> Rankine {"°R", 5.0 / 9.0, UnitRole::Alternate, detail::RankineAliases};

    template<>
    struct QuantityTraits<TemperatureFamily>
    {
        static constexpr std::string_view Name = "Temperature";

        static constexpr std::array Units {&Kelvin, &Celsius, &Fahrenheit, &Rankine};
    };

    using Temperature = Quantity<TemperatureFamily>;

    static_assert(ValidateFamily<TemperatureFamily>().empty());
#pragma endregion

#pragma region ThermalCapacity
    inline constexpr UnitOfMeasure<ThermalCapacityFamily> JoulesPerKelvin {"J/K", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ThermalCapacityFamily> KilojoulesPerKelvin {"kJ/K", MetricSystem::Kilo};

    template<>
    struct QuantityTraits<ThermalCapacityFamily>
    {
        static constexpr std::string_view Name = "ThermalCapacity";

        static constexpr std::array Units {&JoulesPerKelvin, &KilojoulesPerKelvin};
    };

    using ThermalCapacity = Quantity<ThermalCapacityFamily>;

    static_assert(ValidateFamily<ThermalCapacityFamily>().empty());
#pragma endregion
}// namespace Quanta
