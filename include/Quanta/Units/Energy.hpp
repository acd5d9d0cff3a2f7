#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct EnergyFamily
    {
    };
    struct PowerFamily
    {
    };
    struct SpecificEnergyFamily
    {
    };
    struct SpectralPowerFamily
    {
    };
    struct EnergyDensityFamily
    {
    };
    struct RadiantIntensityFamily
    {
    };

    /// @brief Joules in one international table British thermal unit.
    inline constexpr F64 JoulesPerBtu = 1055.05585262;

    inline constexpr F64 SecondsPerHour = 3600.0;

    namespace detail
    {
        inline constexpr F64 JouleMultiplier = 1.0 / SecondsPerHour;
        inline constexpr F64 BtuMultiplier   = JoulesPerBtu / SecondsPerHour;

        inline constexpr std::string_view MicrojouleAliases[] {"uJ"};
        inline constexpr std::string_view GrayAliases[] {"J/kg"};
        inline constexpr std::string_view JoulesPerCubicMeterAliases[] {"J/m3"};
    }// namespace detail

#pragma region Energy
    inline constexpr UnitOfMeasure<EnergyFamily> WattHours {"Wh", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<EnergyFamily> KilowattHours {"kWh", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<EnergyFamily> MegawattHours {"MWh", MetricSystem::Mega};
    inline constexpr UnitOfMeasure<EnergyFamily> GigawattHours {"GWh", MetricSystem::Giga};
    inline constexpr UnitOfMeasure<EnergyFamily> Joules {"J", detail::JouleMultiplier};
    inline constexpr UnitOfMeasure<EnergyFamily> Picojoules {"pJ", detail::JouleMultiplier * MetricSystem::Pico};
    inline constexpr UnitOfMeasure<EnergyFamily> Nanojoules {"nJ", detail::JouleMultiplier * MetricSystem::Nano};
    inline constexpr UnitOfMeasure<EnergyFamily> Microjoules {"µJ", detail::JouleMultiplier * MetricSystem::Micro, UnitRole::Alternate,
                                                              detail::MicrojouleAliases};
    inline constexpr UnitOfMeasure<EnergyFamily> Millijoules {"mJ", detail::JouleMultiplier * MetricSystem::Milli};
    inline constexpr UnitOfMeasure<EnergyFamily> Kilojoules {"kJ", detail::JouleMultiplier * MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<EnergyFamily> Megajoules {"MJ", detail::JouleMultiplier * MetricSystem::Mega};
    inline constexpr UnitOfMeasure<EnergyFamily> Gigajoules {"GJ", detail::JouleMultiplier * MetricSystem::Giga};
    inline constexpr UnitOfMeasure<EnergyFamily> Terajoules {"TJ", detail::JouleMultiplier * MetricSystem::Tera};
    inline constexpr UnitOfMeasure<EnergyFamily> BritishThermalUnits {"Btu", detail::BtuMultiplier};
    inline constexpr UnitOfMeasure<EnergyFamily> MBtus {"MBtu", detail::BtuMultiplier * MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<EnergyFamily> MMBtus {"MMBtu", detail::BtuMultiplier * MetricSystem::Mega};

    template<>
    struct QuantityTraits<EnergyFamily>
    {
        static constexpr std::string_view Name = "Energy";

        static constexpr std::array Units {&WattHours, &KilowattHours, &MegawattHours, &GigawattHours, &Joules, &Picojoules,
                                           &Nanojoules, &Microjoules, &Millijoules, &Kilojoules, &Megajoules, &Gigajoules,
                                           &Terajoules, &BritishThermalUnits, &MBtus, &MMBtus};

        static constexpr std::array DisplayThresholds {
                DisplayThreshold<EnergyFamily> {1.0, &GigawattHours},
                DisplayThreshold<EnergyFamily> {1.0, &MegawattHours},
                DisplayThreshold<EnergyFamily> {1.0, &KilowattHours},
                DisplayThreshold<EnergyFamily> {1.0, &WattHours},
                DisplayThreshold<EnergyFamily> {0.0, &Joules},
        };
    };

    using Energy = Quantity<EnergyFamily>;

    static_assert(ValidateFamily<EnergyFamily>().empty());
#pragma endregion

#pragma region Power
    inline constexpr UnitOfMeasure<PowerFamily> Watts {"W", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<PowerFamily> Milliwatts {"mW", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<PowerFamily> Kilowatts {"kW", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<PowerFamily> Megawatts {"MW", MetricSystem::Mega};
    inline constexpr UnitOfMeasure<PowerFamily> Gigawatts {"GW", MetricSystem::Giga};
    inline constexpr UnitOfMeasure<PowerFamily> BtusPerHour {"Btu/h", detail::BtuMultiplier};

    template<>
    struct QuantityTraits<PowerFamily>
    {
        static constexpr std::string_view Name = "Power";

        static constexpr std::array Units {&Watts, &Milliwatts, &Kilowatts, &Megawatts, &Gigawatts, &BtusPerHour};

        static constexpr std::array DisplayThresholds {
                DisplayThreshold<PowerFamily> {1.0, &Gigawatts},
                DisplayThreshold<PowerFamily> {1.0, &Megawatts},
                DisplayThreshold<PowerFamily> {1.0, &Kilowatts},
                DisplayThreshold<PowerFamily> {1.0, &Watts},
                DisplayThreshold<PowerFamily> {0.0, &Milliwatts},
        };
    };

    using Power = Quantity<PowerFamily>;

    static_assert(ValidateFamily<PowerFamily>().empty());
#pragma endregion

#pragma region SpecificEnergy
    inline constexpr UnitOfMeasure<SpecificEnergyFamily> Grays {"Gy", 1.0, UnitRole::Canonical, detail::GrayAliases};

    template<>
    struct QuantityTraits<SpecificEnergyFamily>
    {
        static constexpr std::string_view Name = "SpecificEnergy";

        static constexpr std::array Units {&Grays};
    };

    using SpecificEnergy = Quantity<SpecificEnergyFamily>;

    static_assert(ValidateFamily<SpecificEnergyFamily>().empty());
#pragma endregion

#pragma region SpectralPower
    inline constexpr UnitOfMeasure<SpectralPowerFamily> WattsPerMeter {"W/m", 1.0, UnitRole::Canonical};

    template<>
    struct QuantityTraits<SpectralPowerFamily>
    {
        static constexpr std::string_view Name = "SpectralPower";

        static constexpr std::array Units {&WattsPerMeter};
    };

    using SpectralPower = Quantity<SpectralPowerFamily>;

    static_assert(ValidateFamily<SpectralPowerFamily>().empty());
#pragma endregion

#pragma region EnergyDensity
    inline constexpr UnitOfMeasure<EnergyDensityFamily> JoulesPerCubicMeter {"J/m³", 1.0, UnitRole::Canonical,
                                                                             detail::JoulesPerCubicMeterAliases};
    inline constexpr UnitOfMeasure<EnergyDensityFamily> KilowattHoursPerCubicMeter {"kWh/m³", SecondsPerHour * MetricSystem::Kilo};

    template<>
    struct QuantityTraits<EnergyDensityFamily>
    {
        static constexpr std::string_view Name = "EnergyDensity";

        static constexpr std::array Units {&JoulesPerCubicMeter, &KilowattHoursPerCubicMeter};
    };

    using EnergyDensity = Quantity<EnergyDensityFamily>;

    static_assert(ValidateFamily<EnergyDensityFamily>().empty());
#pragma endregion

#pragma region RadiantIntensity
    inline constexpr UnitOfMeasure<RadiantIntensityFamily> WattsPerSteradian {"W/sr", 1.0, UnitRole::Canonical};

    template<>
    struct QuantityTraits<RadiantIntensityFamily>
    {
        static constexpr std::string_view Name = "RadiantIntensity";

        static constexpr std::array Units {&WattsPerSteradian};
    };

    using RadiantIntensity = Quantity<RadiantIntensityFamily>;

    static_assert(ValidateFamily<RadiantIntensityFamily>().empty());
#pragma endregion
}// namespace Quanta
