#include "rpn2tex/cli.hpp"
#include "rpn2tex/diagnostic.hpp"
#include "rpn2tex/error.hpp"
#include "rpn2tex/latex.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string_view>

namespace rpn2tex::cli {

const char* usage() {
    return "Usage: rpn2tex <input> [options]\n"
           "\n"
           "Convert a Reverse Polish Notation expression to LaTeX inline math.\n"
           "\n"
           "Arguments:\n"
           "  <input>               Input file, or '-' to read stdin\n"
           "\n"
           "Options:\n"
           "  -o, --output <file>   Write LaTeX to <file> instead of stdout\n"
           "  --log-level <level>   trace, debug, info, warn, error or off\n"
           "                        (default: $RPN2TEX_LOG_LEVEL, else warn)\n"
           "  --context <n>         Source lines shown around errors (default: 1)\n"
           "  -h, --help            Show this message\n";
}

static int parse_context(std::string_view v) {
    if (v.empty()) throw UsageError("--context expects a non-negative integer");
    int n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') throw UsageError("--context expects a non-negative integer");
        n = n * 10 + (c - '0');
        if (n > 1000) throw UsageError("--context value too large");
    }
    return n;
}

Options parse_args(int argc, const char* const* argv, const char* env_log_level) {
    Options opts;
    if (env_log_level && log::is_level_name(env_log_level)) {
        opts.log_level = log::parse_level(env_log_level);
    }

    bool have_input = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-o" || arg == "--output") {
            opts.output = value();
        } else if (arg == "--log-level") {
            std::string v = value();
            if (!log::is_level_name(v)) throw UsageError("Unknown log level '" + v + "'");
            opts.log_level = log::parse_level(v);
        } else if (arg == "--context") {
            opts.context_lines = parse_context(value());
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option '" + arg + "'");
        } else if (have_input) {
            throw UsageError("Unexpected argument '" + arg + "'");
        } else {
            opts.input = arg;
            have_input = true;
        }
    }

    if (!have_input && !opts.help) throw UsageError("Missing input (file path or '-')");
    return opts;
}

std::string read_input(const std::string& path, std::istream& in) {
    if (path == "-") {
        std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        if (in.bad()) throw IoError("Failed to read stdin");
        return text;
    }

    // an ifstream opens a directory fine and only fails on the first read
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw IoError("Failed to read file '" + path + "': is a directory");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) throw IoError("Failed to read file '" + path + "'");
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) throw IoError("Failed to read file '" + path + "'");
    return ss.str();
}

void write_output(const std::string& path, const std::string& latex) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw IoError("Failed to write file '" + path + "'");
    file << latex << '\n';
    file.flush();
    if (!file) throw IoError("Failed to write file '" + path + "'");
}

int run(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
    Options opts;
    try {
        opts = parse_args(argc, argv, std::getenv("RPN2TEX_LOG_LEVEL"));
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n\n" << usage();
        return kExitUsage;
    }

    if (opts.help) {
        out << usage();
        return kExitOk;
    }

    log::set_level(opts.log_level);

    std::string text;
    try {
        text = read_input(opts.input, in);
    } catch (const IoError& e) {
        err << "Error: " << e.what() << '\n';
        return kExitFailure;
    }
    RPN2TEX_LOG_INFO("cli", "read " << text.size() << " bytes from "
                                    << (opts.input == "-" ? std::string("stdin") : opts.input));

    std::string latex;
    try {
        latex = convert(text);
    } catch (const SourceError& e) {
        ErrorFormatter formatter(text);
        err << formatter.format_error(e, opts.context_lines);
        return kExitFailure;
    }

    if (!opts.output) {
        out << latex;
        out.flush();
        return kExitOk;
    }

    try {
        write_output(*opts.output, latex);
    } catch (const IoError& e) {
        err << "Error: " << e.what() << '\n';
        return kExitFailure;
    }
    RPN2TEX_LOG_INFO("cli", "wrote " << latex.size() + 1 << " bytes");
    err << "Generated: " << *opts.output << '\n';
    return kExitOk;
}

} // namespace rpn2tex::cli
