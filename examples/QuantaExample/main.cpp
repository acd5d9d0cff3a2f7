#include <iostream>
#include <print>
#include <vector>

#include <Quanta/Quanta.hpp>
using namespace Quanta;

int main()
{
    Logging::SetLevel(spdlog::level::info);

    // Basic construction and output
    const Length      m  = Meters(5.0);
    const Length      km = Kilometers(1.2);
    const Time        s  = Seconds(10.0);
    const Time        ms = Milliseconds(500.0);
    const Temperature c  = Celsius(25.0);

    std::cout << "Meters: " << m << std::endl;
    std::cout << "Kilometers: " << km << std::endl;
    std::cout << "Seconds: " << s << std::endl;
    std::cout << "Milliseconds: " << ms.ToString(Milliseconds) << std::endl;
    std::cout << "Celsius: " << c.ToString(Celsius) << " = " << c.ToString(Kelvin) << std::endl;

    // Arithmetic
    const Length total = m + Kilometers(1.0);
    std::cout << "Total length (5 m + 1 km): " << total << std::endl;

    const Velocity speed = m / s;
    std::cout << "Speed: " << speed << " = " << speed.ToString(KilometersPerHour) << std::endl;

    // Derived quantities
    const Momentum p = Kilograms(1200.0) * KilometersPerHour(90.0);
    const Force    f = Kilograms(1200.0) * MetersPerSecondSquared(2.5);
    const Energy   w = f * Meters(100.0);
    std::println("Momentum: {}  Force: {}  Work: {:.3f}", p, f, w);
    std::println("Work in joules: {}", w.ToString(Joules));

    const Power draw = KilowattHours(3.0) / Hours(2.0);
    std::println("Average draw: {}  Runtime on 12 kWh: {}", draw, (KilowattHours(12.0) / draw).ToString(Hours));

    // Parsing
    for (const char* text: {"10.22 kg", "2 tonnes", "5 xyz"})
    {
        if (const auto parsed = Mass::Parse(text))
            std::println("Parsed '{}' as {}", text, *parsed);
        else
            std::println("{}", parsed.error().message);
    }

    // Aggregation
    const QuantityNumeric<EnergyFamily> numeric {KilowattHours};
    const std::vector<Energy>           readings {KilowattHours(1.2), WattHours(800.0), Joules(3.6e6)};
    std::println("Total: {}", Sum(numeric, readings));
    if (const auto mean = Mean(numeric, readings))
        std::println("Mean: {}", mean->ToString(KilowattHours));

    // Registry
    for (const auto& derivation: CatalogDerivations::Table())
    {
        if (derivation.result == QuantityTraits<EnergyFamily>::Name)
            std::println("{}", ToString(derivation));
    }

    return 0;
}
