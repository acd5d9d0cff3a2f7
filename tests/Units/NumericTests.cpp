/// @file NumericTests.cpp
/// @brief Tests for Quanta::QuantityNumeric and the generic Sum, Mean and Sort algorithms.

#include <Quanta/Numeric.hpp>
#include <Quanta/Units/Energy.hpp>
#include <Quanta/Units/Mass.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <compare>
#include <cstddef>
#include <limits>
#include <vector>

using namespace Quanta;

TEST_CASE("QuantityNumeric satisfies the adapter concept", "[Units][Numeric]")
{
    STATIC_REQUIRE(NumericAdapter<QuantityNumeric<MassFamily>>);
    STATIC_REQUIRE(NumericAdapter<QuantityNumeric<EnergyFamily>>);
}

TEST_CASE("Zero and One follow the reference unit", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Kilograms};

    CHECK(numeric.Zero().Value() == 0.0);
    CHECK(numeric.One() == Grams(1000.0));
    CHECK(numeric.Reference() == Kilograms);

    const QuantityNumeric<MassFamily> inGrams {Grams};
    CHECK(inGrams.One() == Grams(1.0));
    CHECK(inGrams.Zero() == numeric.Zero());
}

TEST_CASE("Adapter arithmetic matches quantity arithmetic", "[Units][Numeric]")
{
    constexpr QuantityNumeric<MassFamily> numeric {Kilograms};

    CHECK(numeric.Add(Kilograms(1.0), Grams(500.0)) == Grams(1500.0));
    CHECK(numeric.Subtract(Kilograms(1.0), Grams(500.0)) == Grams(500.0));
    CHECK(numeric.Multiply(Grams(250.0), 4.0) == Kilograms(1.0));
    CHECK(numeric.Divide(Kilograms(1.0), 4.0) == Grams(250.0));
    CHECK(numeric.Negate(Grams(3.0)) == Grams(-3.0));
    CHECK(numeric.Compare(Grams(1.0), Grams(2.0)) == std::partial_ordering::less);
    CHECK(numeric.Compare(Kilograms(1.0), Grams(1000.0)) == std::partial_ordering::equivalent);

    STATIC_REQUIRE(numeric.Add(Kilograms(1.0), Grams(500.0)).Value() == 1500.0);
}

TEST_CASE("Integer and double conversions use the reference unit", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Kilograms};

    CHECK(numeric.FromInteger(3) == Kilograms(3.0));
    CHECK(numeric.FromInteger(-2) == Grams(-2000.0));
    CHECK(numeric.ToDouble(Grams(2500.0)) == 2.5);
}

TEST_CASE("Sum adds values of mixed units", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Kilograms};

    const std::array values {Kilograms(1.0), Grams(500.0)};
    CHECK(Sum(numeric, values) == Kilograms(1.5));

    const std::vector<Mass> empty;
    CHECK(Sum(numeric, empty) == numeric.Zero());

    const QuantityNumeric<EnergyFamily> energy {WattHours};
    const std::vector<Energy>           readings {KilowattHours(1.0), WattHours(250.0), WattHours(250.0)};
    CHECK(Sum(energy, readings) == KilowattHours(1.5));
}

TEST_CASE("Mean is empty for an empty range", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Kilograms};

    const std::vector<Mass> empty;
    CHECK_FALSE(Mean(numeric, empty).has_value());

    const std::vector<Mass> values {Kilograms(1.0), Kilograms(2.0), Kilograms(3.0)};
    const auto              mean = Mean(numeric, values);
    REQUIRE(mean.has_value());
    CHECK(mean->To(Kilograms) == Catch::Approx(2.0));

    const std::array pair {Grams(1.0), Grams(2.0)};
    CHECK(Mean(numeric, pair) == Grams(1.5));
}

TEST_CASE("Sort orders values by canonical magnitude", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Kilograms};

    std::vector<Mass> values {Kilograms(3.0), Grams(500.0), Tonnes(1.0), Milligrams(10.0)};
    Sort(numeric, values);

    REQUIRE(values.size() == 4);
    CHECK(values[0] == Milligrams(10.0));
    CHECK(values[1] == Grams(500.0));
    CHECK(values[2] == Kilograms(3.0));
    CHECK(values[3] == Tonnes(1.0));
}

TEST_CASE("Mean divides the total once", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Grams};

    const std::array values {Grams(1.0), Grams(1.0), Grams(1.5)};
    const auto       mean = Mean(numeric, values);
    REQUIRE(mean.has_value());
    CHECK(mean->Value() == 3.5 / 3.0);
}

TEST_CASE("Sort orders finite values and moves NaN to the end", "[Units][Numeric]")
{
    const QuantityNumeric<MassFamily> numeric {Grams};
    const F64                         nan = std::numeric_limits<F64>::quiet_NaN();

    std::vector<Mass> values;
    UIntSize          nanCount = 0;
    for (int i = 0; i < 60; ++i)
    {
        if (i % 3 == 0)
        {
            values.push_back(Grams(nan));
            ++nanCount;
        }
        else
        {
            values.push_back(Grams(static_cast<F64>((i * 37) % 101 - 50)));
        }
    }
    REQUIRE(values.size() > 16);

    Sort(numeric, values);

    const UIntSize finiteCount = values.size() - nanCount;
    for (UIntSize i = 0; i < finiteCount; ++i)
    {
        INFO(i);
        CHECK_FALSE(std::isnan(values[i].Value()));
    }
    for (UIntSize i = finiteCount; i < values.size(); ++i)
    {
        INFO(i);
        CHECK(std::isnan(values[i].Value()));
    }
    CHECK(std::is_sorted(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(finiteCount)));
}
