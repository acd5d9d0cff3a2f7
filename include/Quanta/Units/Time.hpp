#pragma once

#include <Quanta/MetricSystem.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct TimeFamily
    {
    };

    namespace detail
    {
        inline constexpr std::string_view MicrosecondAliases[] {"us"};
        inline constexpr std::string_view MinuteAliases[] {"mins"};
    }// namespace detail

    inline constexpr UnitOfMeasure<TimeFamily> Seconds {"s", 1.0, UnitRole::Canonical};
    inline constexpr UnitOfMeasure<TimeFamily> Nanoseconds {"ns", MetricSystem::Nano};
    inline constexpr UnitOfMeasure<TimeFamily> Microseconds {"µs", MetricSystem::Micro, UnitRole::Alternate, detail::MicrosecondAliases};
    inline constexpr UnitOfMeasure<TimeFamily> Milliseconds {"ms", MetricSystem::Milli};
    inline constexpr UnitOfMeasure<TimeFamily> Minutes {"min", 60.0, UnitRole::Alternate, detail::MinuteAliases};
    inline constexpr UnitOfMeasure<TimeFamily> Hours {"h", 3600.0};
    inline constexpr UnitOfMeasure<TimeFamily> Days {"d", 86400.0};// 24 * 3600

    template<>
    struct QuantityTraits<TimeFamily>
    {
        static constexpr std::string_view Name = "Time";

        static constexpr std::array Units {&Seconds, &Nanoseconds, &Microseconds, &Milliseconds, &Minutes, &Hours, &Days};
    };

    using Time = Quantity<TimeFamily>;

    static_assert(ValidateFamily<TimeFamily>().empty());
}// namespace Quanta
