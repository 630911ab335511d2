#pragma once
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include "rpn2tex/log.hpp"

namespace rpn2tex::cli {

struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };

enum ExitCode : int {
    kExitOk = 0,
    kExitFailure = 1, // bad input or I/O failure
    kExitUsage = 2,
};

struct Options {
    std::string input;                 // file path, or "-" for stdin
    std::optional<std::string> output; // stdout when unset
    log::LogLevel log_level{log::LogLevel::Warn};
    int context_lines{1};
    bool help{false};
};

const char* usage();

/// Parse argv. The default log level comes from env_log_level (the
/// RPN2TEX_LOG_LEVEL variable) when it names a level.
/// Throws UsageError on unknown flags, missing values or missing input.
Options parse_args(int argc, const char* const* argv, const char* env_log_level = nullptr);

/// Read the whole input named by path ("-" reads in). Throws IoError.
std::string read_input(const std::string& path, std::istream& in);

/// Write latex to path with a trailing newline. Throws IoError.
void write_output(const std::string& path, const std::string& latex);

/// Full command: returns the process exit status.
int run(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace rpn2tex::cli
