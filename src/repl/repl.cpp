#include <dtcalc/parser/lexer.hpp>
#include <dtcalc/repl/repl.hpp>
#include <dtcalc/runtime/evaluator.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>

#ifdef DTCALC_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace dtcalc::repl {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kLightBlue = "\033[94m";
constexpr std::string_view kRed = "\033[91m";

constexpr std::string_view kHelp =
    R"(Usage:
  dtcalc                        interactive prompt
  dtcalc "today + 3d"           evaluate the argument
  echo "today + 3d" | dtcalc    evaluate standard input

Expressions:
  <date> + <duration>    <date> - <duration>
  <date> - <date>        <duration> +/- <duration>
  one operator per expression; a sign stuck to a number is part of the
  duration, so 1d+2d-3d is 1d + (2d -3d)

Dates:
  2024-07-10   July/10/2024   Jul/10/24   07/10/2024   07/10/24
  optionally followed by 15:33, 15:33:20 or 3:33 PM
  today, now

Durations:
  1y6mo10d   2 weeks 3 days   3h 15m   units: y mo w d h m s

Commands:
  help   quit)";

auto is_quit_command(std::string_view line) -> bool {
    return line == "quit" || line == "exit" || line == ":q";
}

#ifdef DTCALC_HAS_READLINE
auto make_prompt(const ReplConfig& config) -> std::string {
    if (!config.color) {
        return config.prompt;
    }
    // readline needs non-printing sequences bracketed by \001 and \002.
    return fmt::format("\001{}\002{}\001{}\002", kLightBlue, config.prompt, kReset);
}

void load_history(const ReplConfig& config) {
    ::stifle_history(config.history_length);
    if (config.history_file.empty()) {
        return;
    }
    if (int rc = ::read_history(config.history_file.c_str()); rc != 0) {
        spdlog::debug("no history loaded from {}: {}", config.history_file, std::strerror(rc));
    }
}

void save_history(const ReplConfig& config) {
    if (config.history_file.empty()) {
        return;
    }
    if (int rc = ::write_history(config.history_file.c_str()); rc != 0) {
        spdlog::warn("failed to write history to {}: {}", config.history_file, std::strerror(rc));
    }
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!parser::trim(out).empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
auto make_prompt(const ReplConfig& config) -> std::string {
    if (!config.color) {
        return config.prompt;
    }
    return fmt::format("{}{}{}", kLightBlue, config.prompt, kReset);
}

void load_history(const ReplConfig& /*config*/) {}

void save_history(const ReplConfig& /*config*/) {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    std::fflush(stdout);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

}  // namespace

auto help_text() -> std::string_view {
    return kHelp;
}

auto resolve_history_file(std::string_view explicit_path) -> std::string {
    if (!explicit_path.empty()) {
        return std::string(explicit_path);
    }
    if (const char* env = std::getenv("DTCALC_HISTORY"); env != nullptr && *env != '\0') {
        return env;
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return (std::filesystem::path(home) / ".dtcalc_history").string();
    }
    return {};
}

auto render_result(std::string_view result, bool color) -> std::string {
    if (!color) {
        return fmt::format("= {}", result);
    }
    return fmt::format("{}= {}{}", kLightBlue, kReset, result);
}

auto render_error(const EvalError& error, bool color) -> std::string {
    if (!color) {
        return fmt::format("! Error: {}", error.format());
    }
    return fmt::format("{}! {}Error: {}", kRed, kReset, error.format());
}

auto process_line(std::string_view line, const ReplConfig& config, const Clock& clock)
    -> std::optional<std::string> {
    const auto input = parser::trim(line);
    if (input.empty()) {
        return std::string{};
    }
    if (is_quit_command(input)) {
        return std::nullopt;
    }
    if (input == "help") {
        return std::string(help_text());
    }
    auto result = runtime::evaluate(input, clock);
    if (!result) {
        spdlog::debug("{} ({})", result.error().format(), to_string(result.error().root_cause()));
        return render_error(result.error(), config.color);
    }
    return render_result(*result, config.color);
}

auto run_once(std::string_view expression, const Clock& clock, std::ostream& out,
              std::ostream& err) -> int {
    const auto input = parser::trim(expression);
    if (input.empty()) {
        return 0;
    }
    auto result = runtime::evaluate(input, clock);
    if (!result) {
        err << "Error: " << result.error().format() << '\n';
        return 1;
    }
    out << *result << '\n';
    return 0;
}

void run(const ReplConfig& config, const Clock& clock) {
    if (config.verbose) {
        spdlog::info("dtcalc prompt started (history={})",
                     config.history_file.empty() ? "<none>" : config.history_file);
    }

    load_history(config);
    const std::string prompt = make_prompt(config);

    std::string line;
    while (true) {
        if (!read_repl_line(prompt, line)) {
            fmt::print("\nBye!\n");
            break;
        }
        auto output = process_line(line, config, clock);
        if (!output) {
            break;
        }
        if (!output->empty()) {
            fmt::print("{}\n", *output);
        }
    }

    save_history(config);
    if (config.verbose) {
        spdlog::info("dtcalc prompt exiting");
    }
}

}  // namespace dtcalc::repl
