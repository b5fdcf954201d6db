#include <dtcalc/core/clock.hpp>
#include <dtcalc/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"dtcalc: date, time and duration calculator"};
    app.set_version_flag("--version", "dtcalc 0.1.0");
    app.footer(std::string(dtcalc::repl::help_text()));

    bool verbose = false;
    bool no_color = false;
    std::string history_file;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--no-color", no_color, "Disable colored output");
    app.add_option("--history-file", history_file,
                   "File used to persist interactive history. "
                   "Defaults to DTCALC_HISTORY, then ~/.dtcalc_history.");
    // Everything after the options is the expression; words such as "-" or
    // "-3d" must not be taken for flags.
    app.prefix_command();

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    const auto clock = dtcalc::system_clock();

    const std::vector<std::string> words = app.remaining();
    if (!words.empty()) {
        std::string expression;
        for (const auto& word : words) {
            if (!expression.empty()) {
                expression.push_back(' ');
            }
            expression += word;
        }
        return dtcalc::repl::run_once(expression, clock, std::cout, std::cerr);
    }

    if (::isatty(STDIN_FILENO) == 0) {
        std::string input(std::istreambuf_iterator<char>{std::cin}, {});
        return dtcalc::repl::run_once(input, clock, std::cout, std::cerr);
    }

    dtcalc::repl::ReplConfig config;
    config.verbose = verbose;
    config.color = !no_color && ::isatty(STDOUT_FILENO) != 0 && std::getenv("NO_COLOR") == nullptr;
    config.history_file = dtcalc::repl::resolve_history_file(history_file);

    dtcalc::repl::run(config, clock);

    return 0;
}
