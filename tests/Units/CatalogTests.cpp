/// @file CatalogTests.cpp
/// @brief Catalog-wide checks: every family validates, every unit round-trips and parses by its own symbols.

#include <Quanta/Quanta.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

using namespace Quanta;

namespace
{
    template<typename Family>
    void CheckUnitsRoundTrip()
    {
        for (const auto* unit: QuantityTraits<Family>::Units)
        {
            INFO(QuantityTraits<Family>::Name << " " << unit->Symbol());
            for (const F64 value: {0.0, 1.0, -42.5, 0.001, 98765.4321})
                CHECK(unit->Of(value).To(*unit) == Catch::Approx(value).margin(1e-9));
        }
    }

    template<typename Family>
    void CheckCanonicalRoundTripIsExact()
    {
        const auto& canonical = CanonicalUnitOf<Family>();
        for (const F64 value: {0.0, -0.0, 1.0 / 3.0, std::numeric_limits<F64>::denorm_min(), std::numeric_limits<F64>::max(),
                               std::numeric_limits<F64>::lowest(), 6.02214076e23})
        {
            INFO(QuantityTraits<Family>::Name);
            CHECK(canonical.Of(value).To(canonical) == value);
            CHECK(Quantity<Family>::FromCanonical(value).Value() == value);
        }
    }

    template<typename Family>
    void CheckEverySymbolParses()
    {
        for (const auto* unit: QuantityTraits<Family>::Units)
        {
            const std::string text = "1 " + std::string {unit->Symbol()};
            INFO(text);
            const auto parsed = Quantity<Family>::Parse(text);
            REQUIRE(parsed.has_value());
            CHECK(*parsed == unit->Of(1.0));

            for (const auto alias: unit->Aliases())
            {
                const std::string aliasText = "1 " + std::string {alias};
                INFO(aliasText);
                const auto viaAlias = Quantity<Family>::Parse(aliasText);
                REQUIRE(viaAlias.has_value());
                CHECK(*viaAlias == unit->Of(1.0));
            }
        }
    }

    template<typename... Families>
    void CheckFamilies()
    {
        (CheckUnitsRoundTrip<Families>(), ...);
        (CheckCanonicalRoundTripIsExact<Families>(), ...);
        (CheckEverySymbolParses<Families>(), ...);
    }
}// namespace

TEST_CASE("Every catalog family is well formed", "[Units][Catalog]")
{
    STATIC_REQUIRE(ValidateFamily<TimeFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<LengthFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<MassFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<EnergyFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<PowerFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<TemperatureFamily>().empty());
    STATIC_REQUIRE(ValidateFamily<ElectricalResistanceFamily>().empty());
}

TEST_CASE("Catalog units round-trip and parse by their own symbols", "[Units][Catalog]")
{
    CheckFamilies<TimeFamily, LengthFamily, AreaFamily, VolumeFamily, SolidAngleFamily>();
    CheckFamilies<VelocityFamily, AccelerationFamily, JerkFamily, MomentumFamily, ForceFamily>();
    CheckFamilies<MassFamily, ChemicalAmountFamily, SubstanceConcentrationFamily, DensityFamily, MassFlowRateFamily,
                  AreaDensityFamily>();
    CheckFamilies<EnergyFamily, PowerFamily, SpecificEnergyFamily, SpectralPowerFamily, EnergyDensityFamily,
                  RadiantIntensityFamily>();
    CheckFamilies<ElectricCurrentFamily, ElectricChargeFamily, ElectricPotentialFamily, ElectricalResistanceFamily,
                  ResistivityFamily>();
    CheckFamilies<TemperatureFamily, ThermalCapacityFamily, LuminousIntensityFamily, LuminousFluxFamily>();
}

TEST_CASE("Equivalent values in different units are equal", "[Units][Catalog]")
{
    CHECK(Kilograms(1.0) == Grams(1000.0));
    CHECK(Tonnes(1.0) == Kilograms(1000.0));
    CHECK(Kilometers(1.0) == Meters(1000.0));
    CHECK(Hours(1.0) == Minutes(60.0));
    CHECK(Days(1.0) == Hours(24.0));
    CHECK(KilowattHours(1.0) == WattHours(1000.0));
    CHECK(Kilowatts(1.0) == Watts(1000.0));
    CHECK(Kilovolts(1.0) == Volts(1000.0));
    CHECK(AmpereHours(1.0) == Coulombs(3600.0));

    CHECK(Joules(3600.0).To(WattHours) == Catch::Approx(1.0));
    CHECK(Pounds(1.0).To(Ounces) == Catch::Approx(16.0));
    CHECK(Pounds(1.0).To(Kilograms) == Catch::Approx(0.45359237));
    CHECK(UsMiles(1.0).To(Feet) == Catch::Approx(5280.0));
    CHECK(Liters(1.0).To(Milliliters) == Catch::Approx(1000.0));
    CHECK(Hectares(1.0).To(SquareMeters) == Catch::Approx(10000.0));
    CHECK(BritishThermalUnits(1.0).To(Joules) == Catch::Approx(JoulesPerBtu));
    CHECK(MMBtus(1.0).To(MBtus) == Catch::Approx(1000.0));
    CHECK(BtusPerHour(1.0).To(Watts) == Catch::Approx(JoulesPerBtu / SecondsPerHour));
    CHECK(KilometersPerHour(36.0).To(MetersPerSecond) == Catch::Approx(10.0));
    CHECK(EarthGravities(1.0).To(MetersPerSecondSquared) == Catch::Approx(StandardGravity));
    CHECK(KilogramForce(1.0).To(Newtons) == Catch::Approx(StandardGravity));
    CHECK(GramsPerCubicCentimeter(1.0).To(KilogramsPerCubicMeter) == Catch::Approx(1000.0));
    CHECK(MolesPerLiter(1.0).To(MolesPerCubicMeter) == Catch::Approx(1000.0));
    CHECK(PoundMoles(1.0).To(Moles) == Catch::Approx(GramsPerPound));
}

TEST_CASE("Temperature scales convert through kelvin", "[Units][Catalog]")
{
    CHECK(Celsius(100.0).To(Kelvin) == Catch::Approx(373.15));
    CHECK(Kelvin(373.15).To(Celsius) == Catch::Approx(100.0));
    CHECK(Fahrenheit(212.0).To(Celsius) == Catch::Approx(100.0));
    CHECK(Celsius(37.0).To(Fahrenheit) == Catch::Approx(98.6));
    CHECK(Kelvin(0.0).To(Rankine) == Catch::Approx(0.0).margin(1e-12));
    CHECK(Celsius(0.0).To(Rankine) == Catch::Approx(491.67));

    // Arithmetic acts on kelvin values.
    CHECK((Celsius(20.0) - Celsius(10.0)).To(Kelvin) == Catch::Approx(10.0));
}
