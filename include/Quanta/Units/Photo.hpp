#pragma once

#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <array>
#include <string_view>

namespace Quanta
{
    struct LuminousIntensityFamily
    {
    };
    struct LuminousFluxFamily
    {
    };

    inline constexpr UnitOfMeasure<LuminousIntensityFamily> Candelas {"cd", 1.0, UnitRole::Canonical};

    template<>
    struct QuantityTraits<LuminousIntensityFamily>
    {
        static constexpr std::string_view Name = "LuminousIntensity";

        static constexpr std::array Units {&Candelas};
    };

    using LuminousIntensity = Quantity<LuminousIntensityFamily>;

    static_assert(ValidateFamily<LuminousIntensityFamily>().empty());

    inline constexpr UnitOfMeasure<LuminousFluxFamily> Lumens {"lm", 1.0, UnitRole::Canonical};

    template<>
    struct QuantityTraits<LuminousFluxFamily>
    {
        static constexpr std::string_view Name = "LuminousFlux";

        static constexpr std::array Units {&Lumens};
    };

    using LuminousFlux = Quantity<LuminousFluxFamily>;

    static_assert(ValidateFamily<LuminousFluxFamily>().empty());
}// namespace Quanta
