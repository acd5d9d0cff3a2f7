#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct ElectricCurrentFamily
    {
    };
    struct ElectricChargeFamily
    {
    };
    struct ElectricPotentialFamily
    {
    };
    struct ElectricalResistanceFamily
    {
    };
    struct ResistivityFamily
    {
    };

    namespace detail
    {
        inline constexpr std::string_view MicroampereAliases[] {"uA"};
        inline constexpr std::string_view MicrocoulombAliases[] {"uC"};
        inline constexpr std::string_view MicrovoltAliases[] {"uV"};
        inline constexpr std::string_view OhmAliases[] {"ohm"};
        inline constexpr std::string_view MicroohmAliases[] {"uohm"};
        inline constexpr std::string_view OhmMeterAliases[] {"ohm-m"};
    }// namespace detail

#pragma region ElectricCurrent
    inline constexpr UnitOfMeasure<ElectricCurrentFamily> Amperes {"A", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ElectricCurrentFamily> Microamperes {"µA", MetricSystem::Micro, UnitRole::Alternate, detail::MicroampereAliases};
    inline constexpr UnitOfMeasure<ElectricCurrentFamily> Milliamperes {"mA", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<ElectricCurrentFamily> Kiloamperes {"kA", MetricSystem::Kilo};

    template<>
    struct QuantityTraits<ElectricCurrentFamily>
    {
        static constexpr std::string_view Name = "ElectricCurrent";

        static constexpr std::array Units {&Amperes, &Microamperes, &Milliamperes, &Kiloamperes};
    };

    using ElectricCurrent = Quantity<ElectricCurrentFamily>;

    static_assert(ValidateFamily<ElectricCurrentFamily>().empty());
#pragma endregion

#pragma region ElectricCharge
    inline constexpr UnitOfMeasure<ElectricChargeFamily> Coulombs {"C", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ElectricChargeFamily> Microcoulombs {"µC", MetricSystem::Micro, UnitRole::Alternate, detail::MicrocoulombAliases};
    inline constexpr UnitOfMeasure<ElectricChargeFamily> Millicoulombs {"mC", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<ElectricChargeFamily> AmpereHours {"Ah", 3600.0};
    inline constexpr UnitOfMeasure<ElectricChargeFamily> MilliampereHours {"mAh", 3.6};

    template<>
    struct QuantityTraits<ElectricChargeFamily>
    {
        static constexpr std::string_view Name = "ElectricCharge";

        static constexpr std::array Units {&Coulombs, &Microcoulombs, &Millicoulombs, &AmpereHours, &MilliampereHours};
    };

    using ElectricCharge = Quantity<ElectricChargeFamily>;

    static_assert(ValidateFamily<ElectricChargeFamily>().empty());
#pragma endregion

#pragma region ElectricPotential
    inline constexpr UnitOfMeasure<ElectricPotentialFamily> Volts {"V", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ElectricPotentialFamily> Microvolts {"µV", MetricSystem::Micro, UnitRole::Alternate, detail::MicrovoltAliases};
    inline constexpr UnitOfMeasure<ElectricPotentialFamily> Millivolts {"mV", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<ElectricPotentialFamily> Kilovolts {"kV", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<ElectricPotentialFamily> Megavolts {"MV", MetricSystem::Mega};

    template<>
    struct QuantityTraits<ElectricPotentialFamily>
    {
        static constexpr std::string_view Name = "ElectricPotential";

        static constexpr std::array Units {&Volts, &Microvolts, &Millivolts, &Kilovolts, &Megavolts};
    };

    using ElectricPotential = Quantity<ElectricPotentialFamily>;

    static_assert(ValidateFamily<ElectricPotentialFamily>().empty());
#pragma endregion

#pragma region ElectricalResistance
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Ohms {"Ω", 1.0, UnitRole::Canonical, detail::OhmAliases};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Nanohms {"nΩ", MetricSystem::Nano};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Microohms {"µΩ", MetricSystem::Micro, UnitRole::Alternate, detail::MicroohmAliases};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Milliohms {"mΩ", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Kilohms {"kΩ", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Megohms {"MΩ", MetricSystem::Mega};
    inline constexpr UnitOfMeasure<ElectricalResistanceFamily> Gigohms {"GΩ", MetricSystem::Giga};

    template<>
    struct QuantityTraits<ElectricalResistanceFamily>
    {
        static constexpr std::string_view Name = "ElectricalResistance";

        static constexpr std::array Units {&Ohms, &Nanohms, &Microohms, &Milliohms, &Kilohms, &Megohms, &Gigohms};
    };

    using ElectricalResistance = Quantity<ElectricalResistanceFamily>;

    static_assert(ValidateFamily<ElectricalResistanceFamily>().empty());
#pragma endregion

#pragma region Resistivity
    inline constexpr UnitOfMeasure<ResistivityFamily> OhmMeters {"Ω·m", 1.0, UnitRole::Canonical, detail::OhmMeterAliases};

    template<>
    struct QuantityTraits<ResistivityFamily>
    {
        static constexpr std::string_view Name = "Resistivity";

        static constexpr std::array Units {&OhmMeters};
    };

    using Resistivity = Quantity<ResistivityFamily>;

    static_assert(ValidateFamily<ResistivityFamily>().empty());
#pragma endregion
}// namespace Quanta
