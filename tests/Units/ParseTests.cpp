/// @file ParseTests.cpp
/// @brief Tests for Quantity::Parse: grammar, symbol matching, options and error reporting.

#include <Quanta/Units/Electro.hpp>
#include <Quanta/Units/Energy.hpp>
#include <Quanta/Units/Mass.hpp>
#include <Quanta/Units/Space.hpp>
#include <Quanta/Units/Thermal.hpp>
#include <Quanta/Units/Time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace Quanta;

TEST_CASE("Parse reads a number followed by a unit symbol", "[Units][Parse]")
{
    const auto mass = Mass::Parse("10.22 kg");
    REQUIRE(mass.has_value());
    CHECK(*mass == Kilograms(10.22));

    CHECK(Energy::Parse("1.5 kWh").value() == KilowattHours(1.5));
    CHECK(Temperature::Parse("100 °C").value() == Celsius(100.0));
    CHECK(ElectricalResistance::Parse("3 kΩ").value() == Kilohms(3.0));
    CHECK(Length::Parse("12 ft").value() == Feet(12.0));
}

TEST_CASE("Parse accepts signs, bare fractions and no separating space", "[Units][Parse]")
{
    CHECK(Mass::Parse("-3.5 kg").value() == Kilograms(-3.5));
    CHECK(Mass::Parse("+2 g").value() == Grams(2.0));
    CHECK(Mass::Parse(".5 kg").value() == Kilograms(0.5));
    CHECK(Mass::Parse("5kg").value() == Kilograms(5.0));
    CHECK(Mass::Parse("7   lb").value() == Pounds(7.0));
}

TEST_CASE("The longest matching symbol wins", "[Units][Parse]")
{
    CHECK(Mass::Parse("5 mg").value() == Milligrams(5.0));
    CHECK(Mass::Parse("5 g").value() == Grams(5.0));
    CHECK(Mass::Parse("5 mcg").value() == Micrograms(5.0));

    CHECK(Length::Parse("2 nmi").value() == NauticalMiles(2.0));
    CHECK(Length::Parse("2 mi").value() == UsMiles(2.0));
    CHECK(Length::Parse("2 mm").value() == Millimeters(2.0));
    CHECK(Length::Parse("2 m").value() == Meters(2.0));

    CHECK(Energy::Parse("4 MMBtu").value() == MMBtus(4.0));
    CHECK(Energy::Parse("4 MBtu").value() == MBtus(4.0));
    CHECK(Energy::Parse("4 Btu").value() == BritishThermalUnits(4.0));
}

TEST_CASE("Parse accepts aliases unless disabled", "[Units][Parse]")
{
    CHECK(Mass::Parse("2 tonnes").value() == Tonnes(2.0));
    CHECK(Time::Parse("5 us").value() == Microseconds(5.0));
    CHECK(Time::Parse("5 µs").value() == Microseconds(5.0));
    CHECK(Temperature::Parse("20 degC").value() == Celsius(20.0));

    ParseOptions strict;
    strict.allowAliases = false;

    const auto result = Mass::Parse("2 tonnes", strict);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ParseErrorCode::UnknownSymbol);

    CHECK(Mass::Parse("2 t", strict).value() == Tonnes(2.0));
}

TEST_CASE("Exponents are accepted unless disabled", "[Units][Parse]")
{
    CHECK(Mass::Parse("1e3 g").value() == Kilograms(1.0));
    CHECK(Mass::Parse("2.5E-3 kg").value() == Grams(2.5));
    CHECK(Mass::Parse("1e+2 g").value() == Grams(100.0));

    ParseOptions noExponent;
    noExponent.allowExponent = false;

    const auto result = Mass::Parse("1e3 g", noExponent);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ParseErrorCode::InvalidNumber);
}

TEST_CASE("Surrounding whitespace is only trimmed on request", "[Units][Parse]")
{
    CHECK_FALSE(Mass::Parse(" 5 kg ").has_value());

    ParseOptions lenient;
    lenient.trimWhitespace = true;
    CHECK(Mass::Parse(" 5 kg ", lenient).value() == Kilograms(5.0));
    CHECK(Mass::Parse("\t5 kg\n", lenient).value() == Kilograms(5.0));
}

TEST_CASE("An unsupported symbol is an error naming the input", "[Units][Parse]")
{
    const auto result = Mass::Parse("5 xyz");
    REQUIRE_FALSE(result.has_value());

    const ParseError& error = result.error();
    CHECK(error.code == ParseErrorCode::UnknownSymbol);
    CHECK(error.input == "5 xyz");
    CHECK(error.family == "Mass");
    CHECK(error.message.find("5 xyz") != std::string::npos);
    CHECK(error.message == "Unable to parse '5 xyz' as Mass: no unit symbol of the family matches");
}

TEST_CASE("Malformed numbers are reported as such", "[Units][Parse]")
{
    for (const char* text: {"abc kg", "1. kg", "kg", "1.2.3 kg", "- kg", "+-1 kg", "1e kg", "5 kg kg", "1e999 kg"})
    {
        INFO(text);
        const auto result = Mass::Parse(text);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ParseErrorCode::InvalidNumber);
        CHECK(result.error().input == text);
    }
}

TEST_CASE("Empty input is rejected", "[Units][Parse]")
{
    const auto result = Mass::Parse("");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ParseErrorCode::EmptyInput);

    ParseOptions lenient;
    lenient.trimWhitespace = true;
    const auto blank = Mass::Parse("   ", lenient);
    REQUIRE_FALSE(blank.has_value());
    CHECK(blank.error().code == ParseErrorCode::EmptyInput);
    CHECK(blank.error().input == "   ");
}
