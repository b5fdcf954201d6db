#pragma once

#include <dtcalc/core/time.hpp>

#include <string>

namespace dtcalc::runtime {

/// `YYYY-MM-DD`, or `YYYY-MM-DD HH:MM:SS` when a time of day is present.
[[nodiscard]] auto format_instant(const Instant& instant) -> std::string;

/// Non-zero components from years down to seconds, e.g. `1 year 6 months 10 days`.
/// An all-zero duration renders as `0 days`.
[[nodiscard]] auto format_duration(const Duration& duration) -> std::string;

[[nodiscard]] auto format_value(const Value& value) -> std::string;

}  // namespace dtcalc::runtime
