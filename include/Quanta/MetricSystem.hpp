#pragma once
#include <Quanta/Primitives.hpp>

/// @brief SI prefix scale factors used when declaring unit multipliers.
namespace Quanta::MetricSystem
{
    inline constexpr F64 Pico  = 1e-12;
    inline constexpr F64 Nano  = 1e-9;
    inline constexpr F64 Micro = 1e-6;
    inline constexpr F64 Milli = 1e-3;
    inline constexpr F64 Centi = 1e-2;
    inline constexpr F64 Deci  = 1e-1;
    inline constexpr F64 Deca  = 1e1;
    inline constexpr F64 Hecto = 1e2;
    inline constexpr F64 Kilo  = 1e3;
    inline constexpr F64 Mega  = 1e6;
    inline constexpr F64 Giga  = 1e9;
    inline constexpr F64 Tera  = 1e12;
}// namespace Quanta::MetricSystem
