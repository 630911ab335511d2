#pragma once
#include <stdexcept>
#include <string>

namespace rpn2tex {

/// Base for errors that point at a position in the input text.
/// what() reads "Line <l>, column <c>: <message>".
class SourceError : public std::runtime_error {
public:
    SourceError(std::string message, int line, int column);

    const std::string& message() const noexcept { return message_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    std::string message_;
    int line_;
    int column_;
};

struct LexError : SourceError { using SourceError::SourceError; };
struct ParseError : SourceError { using SourceError::SourceError; };

struct IoError : std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace rpn2tex
