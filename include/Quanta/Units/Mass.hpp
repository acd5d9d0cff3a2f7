#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct MassFamily
    {
    };
    struct ChemicalAmountFamily
    {
    };
    struct SubstanceConcentrationFamily
    {
    };
    struct DensityFamily
    {
    };
    struct MassFlowRateFamily
    {
    };
    struct AreaDensityFamily
    {
    };

    /// @brief Grams in one avoirdupois pound.
    inline constexpr F64 GramsPerPound = 453.59237;

    namespace detail
    {
        inline constexpr std::string_view TonneAliases[] {"tonnes"};
        inline constexpr std::string_view MolesPerCubicMeterAliases[] {"mol/m3"};
        inline constexpr std::string_view KilogramsPerCubicMeterAliases[] {"kg/m3"};
        inline constexpr std::string_view GramsPerCubicCentimeterAliases[] {"g/cm3"};
        inline constexpr std::string_view KilogramsPerSquareMeterAliases[] {"kg/m2"};
        inline constexpr std::string_view GramsPerSquareCentimeterAliases[] {"g/cm2"};
    }// namespace detail

#pragma region Mass
    inline constexpr UnitOfMeasure<MassFamily> Grams {"g", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<MassFamily> Micrograms {"mcg", MetricSystem::Micro};
    inline constexpr UnitOfMeasure<MassFamily> Milligrams {"mg", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<MassFamily> Kilograms {"kg", MetricSystem::Kilo};
    inline constexpr UnitOfMeasure<MassFamily> Tonnes {"t", MetricSystem::Mega, UnitRole::Alternate, detail::TonneAliases};
    inline constexpr UnitOfMeasure<MassFamily> Pounds {"lb", GramsPerPound};
    inline constexpr UnitOfMeasure<MassFamily> Ounces {"oz", GramsPerPound / 16.0};

    template<>
    struct QuantityTraits<MassFamily>
    {
        static constexpr std::string_view Name = "Mass";

        static constexpr std::array Units {&Grams, &Micrograms, &Milligrams, &Kilograms, &Tonnes, &Pounds, &Ounces};

        static constexpr std::array DisplayThresholds {
                DisplayThreshold<MassFamily> {1.0, &Tonnes},
                DisplayThreshold<MassFamily> {1.0, &Kilograms},
                DisplayThreshold<MassFamily> {1.0, &Grams},
                DisplayThreshold<MassFamily> {0.0, &Milligrams},
        };
    };

    using Mass = Quantity<MassFamily>;

    static_assert(ValidateFamily<MassFamily>().empty());
#pragma endregion

#pragma region ChemicalAmount
    inline constexpr UnitOfMeasure<ChemicalAmountFamily> Moles {"mol", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<ChemicalAmountFamily> PoundMoles {"lb-mol", GramsPerPound};

    template<>
    struct QuantityTraits<ChemicalAmountFamily>
    {
        static constexpr std::string_view Name = "ChemicalAmount";

        static constexpr std::array Units {&Moles, &PoundMoles};
    };

    using ChemicalAmount = Quantity<ChemicalAmountFamily>;

    static_assert(ValidateFamily<ChemicalAmountFamily>().empty());
#pragma endregion

#pragma region SubstanceConcentration
    inline constexpr UnitOfMeasure<SubstanceConcentrationFamily> MolesPerCubicMeter {"mol/m³", 1.0, UnitRole::Canonical,
                                                                                     detail::MolesPerCubicMeterAliases};
    inline constexpr UnitOfMeasure<SubstanceConcentrationFamily> MolesPerLiter {"mol/L", 1000.0};

    template<>
    struct QuantityTraits<SubstanceConcentrationFamily>
    {
        static constexpr std::string_view Name = "SubstanceConcentration";

        static constexpr std::array Units {&MolesPerCubicMeter, &MolesPerLiter};
    };

    using SubstanceConcentration = Quantity<SubstanceConcentrationFamily>;

    static_assert(ValidateFamily<SubstanceConcentrationFamily>().empty());
#pragma endregion

#pragma region Density
    inline constexpr UnitOfMeasure<DensityFamily> KilogramsPerCubicMeter {"kg/m³", 1.0, UnitRole::Canonical,
                                                                          detail::KilogramsPerCubicMeterAliases};
    inline constexpr UnitOfMeasure<DensityFamily> GramsPerCubicCentimeter {"g/cm³", 1000.0, UnitRole::Alternate,
                                                                           detail::GramsPerCubicCentimeterAliases};

    template<>
    struct QuantityTraits<DensityFamily>
    {
        static constexpr std::string_view Name = "Density";

        static constexpr std::array Units {&KilogramsPerCubicMeter, &GramsPerCubicCentimeter};
    };

    using Density = Quantity<DensityFamily>;

    static_assert(ValidateFamily<DensityFamily>().empty());
#pragma endregion

#pragma region MassFlowRate
    inline constexpr UnitOfMeasure<MassFlowRateFamily> KilogramsPerSecond {"kg/s", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<MassFlowRateFamily> GramsPerSecond {"g/s", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<MassFlowRateFamily> KilogramsPerHour {"kg/h", 1.0 / 3600.0};

    template<>
    struct QuantityTraits<MassFlowRateFamily>
    {
        static constexpr std::string_view Name = "MassFlowRate";

        static constexpr std::array Units {&KilogramsPerSecond, &GramsPerSecond, &KilogramsPerHour};
    };

    using MassFlowRate = Quantity<MassFlowRateFamily>;

    static_assert(ValidateFamily<MassFlowRateFamily>().empty());
#pragma endregion

#pragma region AreaDensity
    inline constexpr UnitOfMeasure<AreaDensityFamily> KilogramsPerSquareMeter {"kg/m²", 1.0, UnitRole::Canonical,
                                                                               detail::KilogramsPerSquareMeterAliases};
    // 1 g/cm² = 1e-3 kg / 1e-4 m²
    inline constexpr UnitOfMeasure<AreaDensityFamily> GramsPerSquareCentimeter {"g/cm²", 10.0, UnitRole::Alternate,
                                                                                detail::GramsPerSquareCentimeterAliases};

    template<>
    struct QuantityTraits<AreaDensityFamily>
    {
        static constexpr std::string_view Name = "AreaDensity";

        static constexpr std::array Units {&KilogramsPerSquareMeter, &GramsPerSquareCentimeter};
    };

    using AreaDensity = Quantity<AreaDensityFamily>;

    static_assert(ValidateFamily<AreaDensityFamily>().empty());
#pragma endregion
}// namespace Quanta
