/// @file QuantityTests.cpp
/// @brief Tests for Quanta::Quantity: same-family arithmetic, comparison and IEEE-754 edge values.

#include <Quanta/Units/Energy.hpp>
#include <Quanta/Units/Mass.hpp>
#include <Quanta/Units/Relations.hpp>
#include <Quanta/Units/Space.hpp>
#include <Quanta/Units/Time.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <compare>
#include <concepts>
#include <limits>

using namespace Quanta;

namespace
{
    template<typename A, typename B>
    concept Addable = requires(A a, B b) { a + b; };

    template<typename A, typename B>
    concept Multipliable = requires(A a, B b) { a * b; };
}// namespace

TEST_CASE("Quantities store the canonical value", "[Units][Quantity]")
{
    CHECK(Kilograms(1.5).Value() == 1500.0);
    CHECK(Mass::FromCanonical(250.0) == Grams(250.0));
    CHECK(Kilometers(2.0).To(Meters) == 2000.0);
}

TEST_CASE("Quantities add and subtract within a family", "[Units][Quantity]")
{
    const Mass total = Kilograms(1.0) + Grams(500.0);
    CHECK(total == Grams(1500.0));
    CHECK(total.To(Kilograms) == 1.5);

    const Mass difference = total - Grams(250.0);
    CHECK(difference == Grams(1250.0));

    CHECK(-Grams(3.0) == Grams(-3.0));
}

TEST_CASE("Quantities scale by plain numbers", "[Units][Quantity]")
{
    const Time interval = Seconds(2.5);
    CHECK(interval * 4.0 == Seconds(10.0));
    CHECK(4.0 * interval == Seconds(10.0));
    CHECK(interval / 2.0 == Seconds(1.25));
}

TEST_CASE("Dividing two quantities of a family gives their ratio", "[Units][Quantity]")
{
    CHECK(Kilograms(2.0) / Grams(500.0) == 4.0);
    STATIC_REQUIRE(std::same_as<decltype(Meters(1.0) / Meters(2.0)), F64>);
}

TEST_CASE("Quantities compare by canonical value", "[Units][Quantity]")
{
    CHECK(Kilograms(1.0) == Grams(1000.0));
    CHECK(Kilograms(1.0) != Grams(999.0));
    CHECK(Kilograms(1.0) > Grams(999.0));
    CHECK(Grams(999.0) < Kilograms(1.0));
    CHECK(Kilograms(1.0) >= Grams(1000.0));
    CHECK((Hours(1.0) <=> Minutes(60.0)) == std::partial_ordering::equivalent);
}

TEST_CASE("Abs and Approx act on canonical values", "[Units][Quantity]")
{
    CHECK(Grams(-4.0).Abs() == Grams(4.0));
    CHECK(Grams(4.0).Abs() == Grams(4.0));

    CHECK(Kilograms(1.0).Approx(Grams(1000.4), Grams(0.5)));
    CHECK(Grams(1000.4).Approx(Kilograms(1.0), Grams(0.5)));
    CHECK_FALSE(Kilograms(1.0).Approx(Grams(1001.0), Grams(0.5)));
}

TEST_CASE("Quantity arithmetic is constexpr", "[Units][Quantity]")
{
    STATIC_REQUIRE((Kilograms(1.0) + Grams(500.0)).Value() == 1500.0);
    STATIC_REQUIRE(Kilometers(1.0) == Meters(1000.0));
    STATIC_REQUIRE(Hours(1.0) > Minutes(59.0));
}

TEST_CASE("Quantities never mix families implicitly", "[Units][Quantity]")
{
    STATIC_REQUIRE(Addable<Mass, Mass>);
    STATIC_REQUIRE_FALSE(Addable<Mass, Length>);
    STATIC_REQUIRE_FALSE(Addable<Mass, F64>);
    STATIC_REQUIRE_FALSE(std::convertible_to<Mass, Length>);
    STATIC_REQUIRE_FALSE(std::convertible_to<F64, Mass>);
    STATIC_REQUIRE_FALSE(Multipliable<Mass, Time>);

    // With every relation visible, only declared pairs gain operators.
    STATIC_REQUIRE(Multipliable<Mass, Velocity>);
    STATIC_REQUIRE(DeclaredQuotient<LengthFamily, TimeFamily>);
    STATIC_REQUIRE_FALSE(DeclaredProduct<MassFamily, TimeFamily>);
    STATIC_REQUIRE_FALSE(Addable<Mass, Velocity>);
}

TEST_CASE("IEEE-754 edge values propagate", "[Units][Quantity]")
{
    const Mass infinite = Kilograms(1.0) / 0.0;
    CHECK(std::isinf(infinite.Value()));

    const Mass undefined = Grams(0.0) / 0.0;
    CHECK(std::isnan(undefined.Value()));

    const Mass nan = Grams(std::numeric_limits<F64>::quiet_NaN());
    CHECK_FALSE(nan == nan);
    CHECK((nan <=> Grams(1.0)) == std::partial_ordering::unordered);
    CHECK_FALSE(nan < Grams(1.0));
    CHECK_FALSE(nan > Grams(1.0));

    CHECK(std::isinf((Grams(1.0) / Grams(0.0))));
}

TEST_CASE("Converting to a unit and back preserves the value", "[Units][Quantity]")
{
    for (const F64 value: {0.0, 1.0, -3.5, 1e-9, 123456.789, 6.02214076e23})
    {
        CHECK(Kilograms(value).To(Kilograms) == Catch::Approx(value));
        CHECK(Pounds(value).To(Pounds) == Catch::Approx(value));
        CHECK(Kilojoules(value).To(Kilojoules) == Catch::Approx(value));
        CHECK(UsMiles(value).To(UsMiles) == Catch::Approx(value));
    }
}
