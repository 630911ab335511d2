#include "rpn2tex/error.hpp"

#include <utility>

namespace rpn2tex {

static std::string located(const std::string& message, int line, int column) {
    return "Line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
}

SourceError::SourceError(std::string message, int line, int column)
    : std::runtime_error(located(message, line, column)),
      message_(std::move(message)),
      line_(line),
      column_(column) {}

} // namespace rpn2tex
