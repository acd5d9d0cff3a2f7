#pragma once

#include <Quanta/Config.hpp>
#include <Quanta/Defines.hpp>
#include <Quanta/Primitives.hpp>

#include <Quanta/Logging.hpp>
#include <Quanta/MetricSystem.hpp>

#include <Quanta/Derivation.hpp>
#include <Quanta/Numeric.hpp>
#include <Quanta/ParseError.hpp>
#include <Quanta/Quantity.hpp>
#include <Quanta/QuantityTraits.hpp>
#include <Quanta/Text.hpp>
#include <Quanta/TimeDerivative.hpp>
#include <Quanta/UnitOfMeasure.hpp>

#include <Quanta/Units/Electro.hpp>
#include <Quanta/Units/Energy.hpp>
#include <Quanta/Units/Mass.hpp>
#include <Quanta/Units/Motion.hpp>
#include <Quanta/Units/Photo.hpp>
#include <Quanta/Units/Relations.hpp>
#include <Quanta/Units/Space.hpp>
#include <Quanta/Units/Thermal.hpp>
#include <Quanta/Units/Time.hpp>
