#pragma once

#include <dtcalc/core/clock.hpp>
#include <dtcalc/core/error.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace dtcalc::repl {

/// Configuration for the interactive session and one-shot evaluation.
struct ReplConfig {
    bool verbose = false;
    /// Emit ANSI colors for the prompt and result/error markers.
    bool color = true;
    std::string prompt = "> ";
    /// History file for readline; empty disables persistence.
    std::string history_file;
    int history_length = 1000;
};

/// Usage text shown by `--help` style output and the `help` command.
[[nodiscard]] auto help_text() -> std::string_view;

/// Resolve the history file: explicit path, then $DTCALC_HISTORY, then
/// $HOME/.dtcalc_history.  Empty when none is available.
[[nodiscard]] auto resolve_history_file(std::string_view explicit_path) -> std::string;

/// `= <result>` line for the prompt (no trailing newline).
[[nodiscard]] auto render_result(std::string_view result, bool color) -> std::string;

/// `! Error: <message>` line for the prompt (no trailing newline).
[[nodiscard]] auto render_error(const EvalError& error, bool color) -> std::string;

/// Handle one line typed at the prompt.
///
/// Returns the text to print (possibly empty), or nullopt when the line asks
/// to leave the session.
[[nodiscard]] auto process_line(std::string_view line, const ReplConfig& config,
                                const Clock& clock) -> std::optional<std::string>;

/// Evaluate a single expression (argument or stdin mode).
///
/// Prints the result to `out` or `Error: <message>` to `err`; returns the
/// process exit code.
[[nodiscard]] auto run_once(std::string_view expression, const Clock& clock, std::ostream& out,
                            std::ostream& err) -> int;

/// Run the interactive loop until EOF or a quit command.
void run(const ReplConfig& config, const Clock& clock);

}  // namespace dtcalc::repl
