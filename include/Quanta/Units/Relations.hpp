/// @file Relations.hpp
/// @brief Every product, quotient and time pairing declared between the catalog families.
///
/// Every operator between two different families is listed here. Products that need a unit
/// normalization (grams to kilograms, joules to watt-hours) spell it out in their `Apply`; the
/// others multiply canonical values. Inverse quotients reuse the product's formula.
#pragma once

#include <Quanta/Derivation.hpp>
#include <Quanta/TimeDerivative.hpp>
#include <Quanta/Units/Electro.hpp>
#include <Quanta/Units/Energy.hpp>
#include <Quanta/Units/Mass.hpp>
#include <Quanta/Units/Motion.hpp>
#include <Quanta/Units/Photo.hpp>
#include <Quanta/Units/Space.hpp>
#include <Quanta/Units/Thermal.hpp>
#include <Quanta/Units/Time.hpp>

namespace Quanta
{
#pragma region Time pairings
    QUANTA_DECLARE_TIME_DERIVATIVE(LengthFamily, VelocityFamily, Meters, Seconds);
    QUANTA_DECLARE_TIME_DERIVATIVE(VelocityFamily, AccelerationFamily, MetersPerSecond, Seconds);
    QUANTA_DECLARE_TIME_DERIVATIVE(AccelerationFamily, JerkFamily, MetersPerSecondSquared, Seconds);
    QUANTA_DECLARE_TIME_DERIVATIVE(MomentumFamily, ForceFamily, NewtonSeconds, Seconds);
    QUANTA_DECLARE_TIME_DERIVATIVE(EnergyFamily, PowerFamily, WattHours, Hours);
    QUANTA_DECLARE_TIME_DERIVATIVE(MassFamily, MassFlowRateFamily, Kilograms, Seconds);
    QUANTA_DECLARE_TIME_DERIVATIVE(ElectricChargeFamily, ElectricCurrentFamily, Coulombs, Seconds);
#pragma endregion

#pragma region Products
    template<>
    struct Product<MassFamily, VelocityFamily> : Derivation<MassFamily, Operation::Multiply, VelocityFamily, MomentumFamily>
    {
        static constexpr Momentum Apply(const Mass& mass, const Velocity& velocity) noexcept
        {
            return NewtonSeconds.Of(mass.To(Kilograms) * velocity.To(MetersPerSecond));
        }
    };

    template<>
    struct Product<MassFamily, AccelerationFamily> : Derivation<MassFamily, Operation::Multiply, AccelerationFamily, ForceFamily>
    {
        static constexpr Force Apply(const Mass& mass, const Acceleration& acceleration) noexcept
        {
            return Newtons.Of(mass.To(Kilograms) * acceleration.To(MetersPerSecondSquared));
        }
    };

    template<>
    struct Product<ForceFamily, LengthFamily> : Derivation<ForceFamily, Operation::Multiply, LengthFamily, EnergyFamily>
    {
        static constexpr Energy Apply(const Force& force, const Length& length) noexcept
        {
            return Joules.Of(force.To(Newtons) * length.To(Meters));
        }
    };

    template<>
    struct Product<ForceFamily, VelocityFamily> : Derivation<ForceFamily, Operation::Multiply, VelocityFamily, PowerFamily>
    {
    };

    template<>
    struct Product<LengthFamily, LengthFamily> : Derivation<LengthFamily, Operation::Multiply, LengthFamily, AreaFamily>
    {
    };

    template<>
    struct Product<AreaFamily, LengthFamily> : Derivation<AreaFamily, Operation::Multiply, LengthFamily, VolumeFamily>
    {
    };

    template<>
    struct Product<DensityFamily, VolumeFamily> : Derivation<DensityFamily, Operation::Multiply, VolumeFamily, MassFamily>
    {
        static constexpr Mass Apply(const Density& density, const Volume& volume) noexcept
        {
            return Kilograms.Of(density.To(KilogramsPerCubicMeter) * volume.To(CubicMeters));
        }
    };

    template<>
    struct Product<SubstanceConcentrationFamily, VolumeFamily>
        : Derivation<SubstanceConcentrationFamily, Operation::Multiply, VolumeFamily, ChemicalAmountFamily>
    {
    };

    template<>
    struct Product<SpecificEnergyFamily, MassFamily> : Derivation<SpecificEnergyFamily, Operation::Multiply, MassFamily, EnergyFamily>
    {
        static constexpr Energy Apply(const SpecificEnergy& specificEnergy, const Mass& mass) noexcept
        {
            return Joules.Of(specificEnergy.To(Grays) * mass.To(Kilograms));
        }
    };

    template<>
    struct Product<ElectricPotentialFamily, ElectricCurrentFamily>
        : Derivation<ElectricPotentialFamily, Operation::Multiply, ElectricCurrentFamily, PowerFamily>
    {
    };

    template<>
    struct Product<ElectricalResistanceFamily, ElectricCurrentFamily>
        : Derivation<ElectricalResistanceFamily, Operation::Multiply, ElectricCurrentFamily, ElectricPotentialFamily>
    {
    };

    template<>
    struct Product<ElectricalResistanceFamily, LengthFamily>
        : Derivation<ElectricalResistanceFamily, Operation::Multiply, LengthFamily, ResistivityFamily>
    {
    };

    template<>
    struct Product<ElectricPotentialFamily, ElectricChargeFamily>
        : Derivation<ElectricPotentialFamily, Operation::Multiply, ElectricChargeFamily, EnergyFamily>
    {
        static constexpr Energy Apply(const ElectricPotential& potential, const ElectricCharge& charge) noexcept
        {
            return Joules.Of(potential.To(Volts) * charge.To(Coulombs));
        }
    };

    template<>
    struct Product<ThermalCapacityFamily, TemperatureFamily>
        : Derivation<ThermalCapacityFamily, Operation::Multiply, TemperatureFamily, EnergyFamily>
    {
        static constexpr Energy Apply(const ThermalCapacity& capacity, const Temperature& temperature) noexcept
        {
            return Joules.Of(capacity.To(JoulesPerKelvin) * temperature.To(Kelvin));
        }
    };

    template<>
    struct Product<SolidAngleFamily, LuminousIntensityFamily>
        : Derivation<SolidAngleFamily, Operation::Multiply, LuminousIntensityFamily, LuminousFluxFamily>
    {
    };

    template<>
    struct Product<SpectralPowerFamily, LengthFamily> : Derivation<SpectralPowerFamily, Operation::Multiply, LengthFamily, PowerFamily>
    {
    };

    template<>
    struct Product<SolidAngleFamily, RadiantIntensityFamily>
        : Derivation<SolidAngleFamily, Operation::Multiply, RadiantIntensityFamily, PowerFamily>
    {
    };

    template<>
    struct Product<EnergyDensityFamily, VolumeFamily> : Derivation<EnergyDensityFamily, Operation::Multiply, VolumeFamily, EnergyFamily>
    {
        static constexpr Energy Apply(const EnergyDensity& density, const Volume& volume) noexcept
        {
            return Joules.Of(density.To(JoulesPerCubicMeter) * volume.To(CubicMeters));
        }
    };

    template<>
    struct Product<AreaDensityFamily, AreaFamily> : Derivation<AreaDensityFamily, Operation::Multiply, AreaFamily, MassFamily>
    {
        static constexpr Mass Apply(const AreaDensity& density, const Area& area) noexcept
        {
            return Kilograms.Of(density.To(KilogramsPerSquareMeter) * area.To(SquareMeters));
        }
    };
#pragma endregion

#pragma region Commuted products
    // clang-format off
    template<> struct Product<VelocityFamily, MassFamily> : Commuted<Product<MassFamily, VelocityFamily>> {};
    template<> struct Product<AccelerationFamily, MassFamily> : Commuted<Product<MassFamily, AccelerationFamily>> {};
    template<> struct Product<LengthFamily, ForceFamily> : Commuted<Product<ForceFamily, LengthFamily>> {};
    template<> struct Product<VelocityFamily, ForceFamily> : Commuted<Product<ForceFamily, VelocityFamily>> {};
    template<> struct Product<LengthFamily, AreaFamily> : Commuted<Product<AreaFamily, LengthFamily>> {};
    template<> struct Product<VolumeFamily, DensityFamily> : Commuted<Product<DensityFamily, VolumeFamily>> {};
    template<> struct Product<VolumeFamily, SubstanceConcentrationFamily> : Commuted<Product<SubstanceConcentrationFamily, VolumeFamily>> {};
    template<> struct Product<MassFamily, SpecificEnergyFamily> : Commuted<Product<SpecificEnergyFamily, MassFamily>> {};
    template<> struct Product<ElectricCurrentFamily, ElectricPotentialFamily> : Commuted<Product<ElectricPotentialFamily, ElectricCurrentFamily>> {};
    template<> struct Product<ElectricCurrentFamily, ElectricalResistanceFamily> : Commuted<Product<ElectricalResistanceFamily, ElectricCurrentFamily>> {};
    template<> struct Product<LengthFamily, ElectricalResistanceFamily> : Commuted<Product<ElectricalResistanceFamily, LengthFamily>> {};
    template<> struct Product<ElectricChargeFamily, ElectricPotentialFamily> : Commuted<Product<ElectricPotentialFamily, ElectricChargeFamily>> {};
    template<> struct Product<TemperatureFamily, ThermalCapacityFamily> : Commuted<Product<ThermalCapacityFamily, TemperatureFamily>> {};
    template<> struct Product<LuminousIntensityFamily, SolidAngleFamily> : Commuted<Product<SolidAngleFamily, LuminousIntensityFamily>> {};
    template<> struct Product<LengthFamily, SpectralPowerFamily> : Commuted<Product<SpectralPowerFamily, LengthFamily>> {};
    template<> struct Product<RadiantIntensityFamily, SolidAngleFamily> : Commuted<Product<SolidAngleFamily, RadiantIntensityFamily>> {};
    template<> struct Product<VolumeFamily, EnergyDensityFamily> : Commuted<Product<EnergyDensityFamily, VolumeFamily>> {};
    template<> struct Product<AreaFamily, AreaDensityFamily> : Commuted<Product<AreaDensityFamily, AreaFamily>> {};
    // clang-format on
#pragma endregion

#pragma region Inverse quotients
    // clang-format off
    template<> struct Quotient<MomentumFamily, VelocityFamily> : SolveForLhs<Product<MassFamily, VelocityFamily>> {};
    template<> struct Quotient<MomentumFamily, MassFamily> : SolveForRhs<Product<MassFamily, VelocityFamily>> {};

    template<> struct Quotient<ForceFamily, AccelerationFamily> : SolveForLhs<Product<MassFamily, AccelerationFamily>> {};
    template<> struct Quotient<ForceFamily, MassFamily> : SolveForRhs<Product<MassFamily, AccelerationFamily>> {};

    template<> struct Quotient<EnergyFamily, LengthFamily> : SolveForLhs<Product<ForceFamily, LengthFamily>> {};
    template<> struct Quotient<EnergyFamily, ForceFamily> : SolveForRhs<Product<ForceFamily, LengthFamily>> {};

    template<> struct Quotient<PowerFamily, VelocityFamily> : SolveForLhs<Product<ForceFamily, VelocityFamily>> {};
    template<> struct Quotient<PowerFamily, ForceFamily> : SolveForRhs<Product<ForceFamily, VelocityFamily>> {};

    // Length * Length has a single inverse.
    template<> struct Quotient<AreaFamily, LengthFamily> : SolveForLhs<Product<LengthFamily, LengthFamily>> {};

    template<> struct Quotient<VolumeFamily, LengthFamily> : SolveForLhs<Product<AreaFamily, LengthFamily>> {};
    template<> struct Quotient<VolumeFamily, AreaFamily> : SolveForRhs<Product<AreaFamily, LengthFamily>> {};

    template<> struct Quotient<MassFamily, VolumeFamily> : SolveForLhs<Product<DensityFamily, VolumeFamily>> {};
    template<> struct Quotient<MassFamily, DensityFamily> : SolveForRhs<Product<DensityFamily, VolumeFamily>> {};

    template<> struct Quotient<ChemicalAmountFamily, VolumeFamily> : SolveForLhs<Product<SubstanceConcentrationFamily, VolumeFamily>> {};
    template<> struct Quotient<ChemicalAmountFamily, SubstanceConcentrationFamily> : SolveForRhs<Product<SubstanceConcentrationFamily, VolumeFamily>> {};

    template<> struct Quotient<EnergyFamily, MassFamily> : SolveForLhs<Product<SpecificEnergyFamily, MassFamily>> {};
    template<> struct Quotient<EnergyFamily, SpecificEnergyFamily> : SolveForRhs<Product<SpecificEnergyFamily, MassFamily>> {};

    template<> struct Quotient<PowerFamily, ElectricCurrentFamily> : SolveForLhs<Product<ElectricPotentialFamily, ElectricCurrentFamily>> {};
    template<> struct Quotient<PowerFamily, ElectricPotentialFamily> : SolveForRhs<Product<ElectricPotentialFamily, ElectricCurrentFamily>> {};

    template<> struct Quotient<ElectricPotentialFamily, ElectricCurrentFamily> : SolveForLhs<Product<ElectricalResistanceFamily, ElectricCurrentFamily>> {};
    template<> struct Quotient<ElectricPotentialFamily, ElectricalResistanceFamily> : SolveForRhs<Product<ElectricalResistanceFamily, ElectricCurrentFamily>> {};

    template<> struct Quotient<ResistivityFamily, LengthFamily> : SolveForLhs<Product<ElectricalResistanceFamily, LengthFamily>> {};
    template<> struct Quotient<ResistivityFamily, ElectricalResistanceFamily> : SolveForRhs<Product<ElectricalResistanceFamily, LengthFamily>> {};

    template<> struct Quotient<EnergyFamily, ElectricChargeFamily> : SolveForLhs<Product<ElectricPotentialFamily, ElectricChargeFamily>> {};
    template<> struct Quotient<EnergyFamily, ElectricPotentialFamily> : SolveForRhs<Product<ElectricPotentialFamily, ElectricChargeFamily>> {};

    template<> struct Quotient<EnergyFamily, TemperatureFamily> : SolveForLhs<Product<ThermalCapacityFamily, TemperatureFamily>> {};
    template<> struct Quotient<EnergyFamily, ThermalCapacityFamily> : SolveForRhs<Product<ThermalCapacityFamily, TemperatureFamily>> {};

    template<> struct Quotient<LuminousFluxFamily, LuminousIntensityFamily> : SolveForLhs<Product<SolidAngleFamily, LuminousIntensityFamily>> {};
    template<> struct Quotient<LuminousFluxFamily, SolidAngleFamily> : SolveForRhs<Product<SolidAngleFamily, LuminousIntensityFamily>> {};

    template<> struct Quotient<PowerFamily, LengthFamily> : SolveForLhs<Product<SpectralPowerFamily, LengthFamily>> {};
    template<> struct Quotient<PowerFamily, SpectralPowerFamily> : SolveForRhs<Product<SpectralPowerFamily, LengthFamily>> {};

    template<> struct Quotient<PowerFamily, RadiantIntensityFamily> : SolveForLhs<Product<SolidAngleFamily, RadiantIntensityFamily>> {};
    template<> struct Quotient<PowerFamily, SolidAngleFamily> : SolveForRhs<Product<SolidAngleFamily, RadiantIntensityFamily>> {};

    template<> struct Quotient<EnergyFamily, VolumeFamily> : SolveForLhs<Product<EnergyDensityFamily, VolumeFamily>> {};
    template<> struct Quotient<EnergyFamily, EnergyDensityFamily> : SolveForRhs<Product<EnergyDensityFamily, VolumeFamily>> {};

    template<> struct Quotient<MassFamily, AreaFamily> : SolveForLhs<Product<AreaDensityFamily, AreaFamily>> {};
    template<> struct Quotient<MassFamily, AreaDensityFamily> : SolveForRhs<Product<AreaDensityFamily, AreaFamily>> {};
    // clang-format on
#pragma endregion

    /// @brief The catalog's relations as an inspectable table.
    using CatalogDerivations = DerivationList<
            // Time pairings
            Quotient<LengthFamily, TimeFamily>, Product<VelocityFamily, TimeFamily>, Product<TimeFamily, VelocityFamily>,
            Quotient<LengthFamily, VelocityFamily>,
            Quotient<VelocityFamily, TimeFamily>, Product<AccelerationFamily, TimeFamily>, Product<TimeFamily, AccelerationFamily>,
            Quotient<VelocityFamily, AccelerationFamily>,
            Quotient<AccelerationFamily, TimeFamily>, Product<JerkFamily, TimeFamily>, Product<TimeFamily, JerkFamily>,
            Quotient<AccelerationFamily, JerkFamily>,
            Quotient<MomentumFamily, TimeFamily>, Product<ForceFamily, TimeFamily>, Product<TimeFamily, ForceFamily>,
            Quotient<MomentumFamily, ForceFamily>,
            Quotient<EnergyFamily, TimeFamily>, Product<PowerFamily, TimeFamily>, Product<TimeFamily, PowerFamily>,
            Quotient<EnergyFamily, PowerFamily>,
            Quotient<MassFamily, TimeFamily>, Product<MassFlowRateFamily, TimeFamily>, Product<TimeFamily, MassFlowRateFamily>,
            Quotient<MassFamily, MassFlowRateFamily>,
            Quotient<ElectricChargeFamily, TimeFamily>, Product<ElectricCurrentFamily, TimeFamily>,
            Product<TimeFamily, ElectricCurrentFamily>, Quotient<ElectricChargeFamily, ElectricCurrentFamily>,
            // Products
            Product<MassFamily, VelocityFamily>, Product<MassFamily, AccelerationFamily>, Product<ForceFamily, LengthFamily>,
            Product<ForceFamily, VelocityFamily>, Product<LengthFamily, LengthFamily>, Product<AreaFamily, LengthFamily>,
            Product<DensityFamily, VolumeFamily>, Product<SubstanceConcentrationFamily, VolumeFamily>,
            Product<SpecificEnergyFamily, MassFamily>, Product<ElectricPotentialFamily, ElectricCurrentFamily>,
            Product<ElectricalResistanceFamily, ElectricCurrentFamily>, Product<ElectricalResistanceFamily, LengthFamily>,
            Product<ElectricPotentialFamily, ElectricChargeFamily>, Product<ThermalCapacityFamily, TemperatureFamily>,
            Product<SolidAngleFamily, LuminousIntensityFamily>, Product<SpectralPowerFamily, LengthFamily>,
            Product<SolidAngleFamily, RadiantIntensityFamily>, Product<EnergyDensityFamily, VolumeFamily>,
            Product<AreaDensityFamily, AreaFamily>,
            // Commuted products
            Product<VelocityFamily, MassFamily>, Product<AccelerationFamily, MassFamily>, Product<LengthFamily, ForceFamily>,
            Product<VelocityFamily, ForceFamily>, Product<LengthFamily, AreaFamily>, Product<VolumeFamily, DensityFamily>,
            Product<VolumeFamily, SubstanceConcentrationFamily>, Product<MassFamily, SpecificEnergyFamily>,
            Product<ElectricCurrentFamily, ElectricPotentialFamily>, Product<ElectricCurrentFamily, ElectricalResistanceFamily>,
            Product<LengthFamily, ElectricalResistanceFamily>, Product<ElectricChargeFamily, ElectricPotentialFamily>,
            Product<TemperatureFamily, ThermalCapacityFamily>, Product<LuminousIntensityFamily, SolidAngleFamily>,
            Product<LengthFamily, SpectralPowerFamily>, Product<RadiantIntensityFamily, SolidAngleFamily>,
            Product<VolumeFamily, EnergyDensityFamily>, Product<AreaFamily, AreaDensityFamily>,
            // Inverse quotients
            Quotient<MomentumFamily, VelocityFamily>, Quotient<MomentumFamily, MassFamily>,
            Quotient<ForceFamily, AccelerationFamily>, Quotient<ForceFamily, MassFamily>,
            Quotient<EnergyFamily, LengthFamily>, Quotient<EnergyFamily, ForceFamily>,
            Quotient<PowerFamily, VelocityFamily>, Quotient<PowerFamily, ForceFamily>,
            Quotient<AreaFamily, LengthFamily>,
            Quotient<VolumeFamily, LengthFamily>, Quotient<VolumeFamily, AreaFamily>,
            Quotient<MassFamily, VolumeFamily>, Quotient<MassFamily, DensityFamily>,
            Quotient<ChemicalAmountFamily, VolumeFamily>, Quotient<ChemicalAmountFamily, SubstanceConcentrationFamily>,
            Quotient<EnergyFamily, MassFamily>, Quotient<EnergyFamily, SpecificEnergyFamily>,
            Quotient<PowerFamily, ElectricCurrentFamily>, Quotient<PowerFamily, ElectricPotentialFamily>,
            Quotient<ElectricPotentialFamily, ElectricCurrentFamily>, Quotient<ElectricPotentialFamily, ElectricalResistanceFamily>,
            Quotient<ResistivityFamily, LengthFamily>, Quotient<ResistivityFamily, ElectricalResistanceFamily>,
            Quotient<EnergyFamily, ElectricChargeFamily>, Quotient<EnergyFamily, ElectricPotentialFamily>,
            Quotient<EnergyFamily, TemperatureFamily>, Quotient<EnergyFamily, ThermalCapacityFamily>,
            Quotient<LuminousFluxFamily, LuminousIntensityFamily>, Quotient<LuminousFluxFamily, SolidAngleFamily>,
            Quotient<PowerFamily, LengthFamily>, Quotient<PowerFamily, SpectralPowerFamily>,
            Quotient<PowerFamily, RadiantIntensityFamily>, Quotient<PowerFamily, SolidAngleFamily>,
            Quotient<EnergyFamily, VolumeFamily>, Quotient<EnergyFamily, EnergyDensityFamily>,
            Quotient<MassFamily, AreaFamily>, Quotient<MassFamily, AreaDensityFamily>>;

    static_assert(CatalogDerivations::ValidateDerivations(), "Catalog declares the same relation twice");

    static_assert(HasInverseDecompositions<Product<MassFamily, VelocityFamily>>);
    static_assert(HasInverseDecompositions<Product<MassFamily, AccelerationFamily>>);
    static_assert(HasInverseDecompositions<Product<ForceFamily, LengthFamily>>);
    static_assert(HasInverseDecompositions<Product<ForceFamily, VelocityFamily>>);
    static_assert(HasInverseDecompositions<Product<LengthFamily, LengthFamily>>);
    static_assert(HasInverseDecompositions<Product<AreaFamily, LengthFamily>>);
    static_assert(HasInverseDecompositions<Product<DensityFamily, VolumeFamily>>);
    static_assert(HasInverseDecompositions<Product<SubstanceConcentrationFamily, VolumeFamily>>);
    static_assert(HasInverseDecompositions<Product<SpecificEnergyFamily, MassFamily>>);
    static_assert(HasInverseDecompositions<Product<ElectricPotentialFamily, ElectricCurrentFamily>>);
    static_assert(HasInverseDecompositions<Product<ElectricalResistanceFamily, ElectricCurrentFamily>>);
    static_assert(HasInverseDecompositions<Product<ElectricalResistanceFamily, LengthFamily>>);
    static_assert(HasInverseDecompositions<Product<ElectricPotentialFamily, ElectricChargeFamily>>);
    static_assert(HasInverseDecompositions<Product<ThermalCapacityFamily, TemperatureFamily>>);
    static_assert(HasInverseDecompositions<Product<SolidAngleFamily, LuminousIntensityFamily>>);
    static_assert(HasInverseDecompositions<Product<SpectralPowerFamily, LengthFamily>>);
    static_assert(HasInverseDecompositions<Product<SolidAngleFamily, RadiantIntensityFamily>>);
    static_assert(HasInverseDecompositions<Product<EnergyDensityFamily, VolumeFamily>>);
    static_assert(HasInverseDecompositions<Product<AreaDensityFamily, AreaFamily>>);
}// namespace Quanta
