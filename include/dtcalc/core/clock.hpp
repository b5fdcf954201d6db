#pragma once

#include <dtcalc/core/time.hpp>

#include <functional>

namespace dtcalc {

/// Source of the current local datetime (second precision, time always set).
///
/// Evaluation reads it once per expression so that `now` and `today` on both
/// sides agree.
using Clock = std::function<Instant()>;

/// Local wall clock.
[[nodiscard]] auto system_clock() -> Clock;

/// Clock that always returns `instant` (a missing time is taken as midnight).
[[nodiscard]] auto fixed_clock(Instant instant) -> Clock;

}  // namespace dtcalc
