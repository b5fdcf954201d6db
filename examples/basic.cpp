#include <dtcalc/core/calendar.hpp>
#include <dtcalc/parser/parser.hpp>
#include <dtcalc/runtime/evaluator.hpp>
#include <dtcalc/runtime/format.hpp>

#include <fmt/core.h>

auto main() -> int {
    // Pin "now" so the output is reproducible.
    const auto clock = dtcalc::fixed_clock(dtcalc::Instant{
        .year = 2024,
        .month = 7,
        .day = 10,
        .time = dtcalc::TimeOfDay{.hour = 9, .minute = 30, .second = 0},
    });

    fmt::print("=== Expressions ===\n");
    for (const char* text : {"today + 300 days", "2024-07-10 - 2023-07-10", "11days + 2weeks3days",
                             "06/10/24 15:33 + 10d5h", "now - 90m", "2024-02-30 + 1d"}) {
        auto result = dtcalc::runtime::evaluate(text, clock);
        if (result) {
            fmt::print("{:<28} = {}\n", text, *result);
        } else {
            fmt::print("{:<28} ! {} [{}]\n", text, result.error().format(),
                       dtcalc::to_string(result.error().root_cause()));
        }
    }

    // Calendar arithmetic clamps to the end of the month.
    fmt::print("\n=== Month-end clamping ===\n");
    const dtcalc::Instant jan31{.year = 2024, .month = 1, .day = 31};
    auto feb = dtcalc::add(jan31, dtcalc::Duration{.months = 1});
    if (feb) {
        fmt::print("{} + 1 month = {}\n", dtcalc::runtime::format_instant(jan31),
                   dtcalc::runtime::format_instant(*feb));
    }

    auto duration = dtcalc::parser::parse_duration("1y6mo10d");
    if (duration) {
        fmt::print("\nparsed duration: {}\n", dtcalc::runtime::format_duration(*duration));
    }

    return 0;
}
