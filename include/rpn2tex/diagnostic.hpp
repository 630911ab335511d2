#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace rpn2tex {

class SourceError;

// Renders an error against the source it came from:
//
//   Error: Unexpected character '^'
//   1 | 2 3 ^
//     |     ^
class ErrorFormatter {
public:
    explicit ErrorFormatter(std::string source);

    /// Header line plus up to context_lines source lines on each side of
    /// line, with a caret row under column. Positions are 1-based. An
    /// empty source or a line past the end yields the header only.
    std::string format_error(std::string_view message, int line, int column,
                             int context_lines = 1) const;

    std::string format_error(const SourceError& e, int context_lines = 1) const;

    const std::vector<std::string>& lines() const { return lines_; }

private:
    std::string source_;
    std::vector<std::string> lines_;
};

} // namespace rpn2tex
