#pragma once

/// Convenience umbrella header for the dtcalc library.

#include <dtcalc/core/calendar.hpp>
#include <dtcalc/core/clock.hpp>
#include <dtcalc/core/error.hpp>
#include <dtcalc/core/time.hpp>
#include <dtcalc/parser/parser.hpp>
#include <dtcalc/runtime/evaluator.hpp>
#include <dtcalc/runtime/format.hpp>
