/// @file TimeDerivativeTests.cpp
/// @brief Tests for time-derivative pairings and the operators they generate.

#include <Quanta/TimeDerivative.hpp>
#include <Quanta/Units/Relations.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <concepts>
#include <string_view>

namespace Quanta
{
    namespace
    {
        struct InformationFamily
        {
        };
        struct DataRateFamily
        {
        };

        constexpr UnitOfMeasure<InformationFamily> Bytes {"B", 1.0, UnitRole::Canonical};
        constexpr UnitOfMeasure<InformationFamily> Kilobytes {"kB", 1000.0};
        constexpr UnitOfMeasure<DataRateFamily>    BytesPerSecond {"B/s", 1.0, UnitRole::Canonical};
        constexpr UnitOfMeasure<DataRateFamily>    KilobytesPerMinute {"kB/min", 1000.0 / 60.0};
    }// namespace

    template<>
    struct QuantityTraits<InformationFamily>
    {
        static constexpr std::string_view Name = "Information";
        static constexpr std::array       Units {&Bytes, &Kilobytes};
    };

    template<>
    struct QuantityTraits<DataRateFamily>
    {
        static constexpr std::string_view Name = "DataRate";
        static constexpr std::array       Units {&BytesPerSecond, &KilobytesPerMinute};
    };

    QUANTA_DECLARE_TIME_DERIVATIVE(InformationFamily, DataRateFamily, Bytes, Seconds);
}// namespace Quanta

using namespace Quanta;

TEST_CASE("A pairing generates all four operators", "[Units][TimeDerivative]")
{
    using Information = Quantity<InformationFamily>;
    using DataRate    = Quantity<DataRateFamily>;

    const auto rate = Kilobytes(1.0) / Seconds(4.0);
    STATIC_REQUIRE(std::same_as<decltype(rate), const DataRate>);
    CHECK(rate == BytesPerSecond(250.0));

    CHECK(BytesPerSecond(250.0) * Seconds(4.0) == Kilobytes(1.0));
    CHECK(Seconds(4.0) * BytesPerSecond(250.0) == Kilobytes(1.0));
    CHECK(Kilobytes(1.0) / BytesPerSecond(250.0) == Seconds(4.0));

    STATIC_REQUIRE(std::same_as<decltype(Kilobytes(1.0) / BytesPerSecond(1.0)), Time>);
    STATIC_REQUIRE(std::same_as<decltype(Seconds(1.0) * BytesPerSecond(1.0)), Information>);
}

TEST_CASE("Pairings are registered in both directions", "[Units][TimeDerivative]")
{
    STATIC_REQUIRE(HasTimeDerivative<LengthFamily>);
    STATIC_REQUIRE(HasTimeIntegral<VelocityFamily>);
    STATIC_REQUIRE(std::same_as<TimeDerivativeOf<LengthFamily>::DerivativeFamily, VelocityFamily>);
    STATIC_REQUIRE(std::same_as<TimeIntegralOf<VelocityFamily>::IntegralFamily, LengthFamily>);
    STATIC_REQUIRE(std::same_as<TimeIntegralOf<JerkFamily>::IntegralFamily, AccelerationFamily>);

    STATIC_REQUIRE_FALSE(HasTimeDerivative<TemperatureFamily>);
    STATIC_REQUIRE_FALSE(HasTimeIntegral<LengthFamily>);
}

TEST_CASE("Rates are expressed per the pairing's time unit", "[Units][TimeDerivative]")
{
    CHECK(Kilometers(36.0) / Hours(1.0) == MetersPerSecond(10.0));
    CHECK(Meters(100.0) / Seconds(20.0) == MetersPerSecond(5.0));

    CHECK(KilowattHours(3.0) / Hours(2.0) == Watts(1500.0));
    CHECK(Kilowatts(2.0) * Hours(3.0) == KilowattHours(6.0));
    CHECK(KilowattHours(6.0) / Kilowatts(2.0) == Hours(3.0));
    CHECK((Joules(3600.0) / Seconds(1.0)).To(Watts) == Catch::Approx(3600.0));

    CHECK(Kilograms(10.0) / Seconds(2.0) == KilogramsPerSecond(5.0));
    CHECK(KilogramsPerSecond(5.0) * Seconds(2.0) == Kilograms(10.0));

    CHECK(AmpereHours(2.0) / Hours(1.0) == Amperes(2.0));
    CHECK(Amperes(2.0) * Hours(1.0) == AmpereHours(2.0));
}

TEST_CASE("Chained pairings each stand on their own", "[Units][TimeDerivative]")
{
    CHECK(MetersPerSecond(10.0) / Seconds(2.0) == MetersPerSecondSquared(5.0));
    CHECK(MetersPerSecond(10.0) / MetersPerSecondSquared(2.0) == Seconds(5.0));
    CHECK(MetersPerSecondSquared(6.0) / Seconds(2.0) == MetersPerSecondCubed(3.0));
    CHECK(MetersPerSecondCubed(3.0) * Seconds(2.0) == MetersPerSecondSquared(6.0));
    CHECK(NewtonSeconds(10.0) / Seconds(2.0) == Newtons(5.0));
    CHECK(NewtonSeconds(10.0) / Newtons(5.0) == Seconds(2.0));
}

TEST_CASE("Pairing helpers compute rate, accumulation and duration", "[Units][TimeDerivative]")
{
    using LengthPairing = TimeDerivativeOf<LengthFamily>;

    STATIC_REQUIRE(LengthPairing::Rate(Meters(100.0), Seconds(20.0)) == MetersPerSecond(5.0));
    STATIC_REQUIRE(LengthPairing::Accumulate(MetersPerSecond(5.0), Seconds(20.0)) == Meters(100.0));
    STATIC_REQUIRE(LengthPairing::Duration(Meters(100.0), MetersPerSecond(5.0)) == Seconds(20.0));
}
