#include "rpn2tex/diagnostic.hpp"
#include "rpn2tex/error.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace rpn2tex {

// Lines without their terminators; a trailing newline does not start a
// new (empty) line.
static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start < s.size()) {
        std::size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        std::string line = s.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        start = end + 1;
    }
    return out;
}

ErrorFormatter::ErrorFormatter(std::string source)
    : source_(std::move(source)), lines_(split_lines(source_)) {}

std::string ErrorFormatter::format_error(std::string_view message, int line, int column,
                                         int context_lines) const {
    std::ostringstream out;
    out << "Error: " << message << '\n';

    const int count = static_cast<int>(lines_.size());
    if (count == 0 || line < 1 || line > count) return out.str();

    context_lines = std::max(context_lines, 0);
    const int first = std::max(1, line - context_lines);
    const int last = std::min(count, line + context_lines);
    const std::size_t width = std::to_string(last).size();
    const std::string gutter(width, ' ');

    for (int n = first; n <= last; ++n) {
        std::string num = std::to_string(n);
        out << std::string(width - num.size(), ' ') << num << " | "
            << lines_[static_cast<std::size_t>(n - 1)] << '\n';
        if (n == line) {
            out << gutter << " | " << std::string(static_cast<std::size_t>(std::max(column - 1, 0)), ' ')
                << "^\n";
        }
    }
    return out.str();
}

std::string ErrorFormatter::format_error(const SourceError& e, int context_lines) const {
    return format_error(e.message(), e.line(), e.column(), context_lines);
}

} // namespace rpn2tex
