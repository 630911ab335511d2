#pragma once
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>

// Module-tagged logging for the library and the CLI.
//
//   RPN2TEX_LOG_DEBUG("parser", "reduced " << op << " at " << line);
//
// The message expression is only evaluated when the level is enabled.
// Records go to a single sink (std::cerr unless replaced) as
// "[LEVEL] module: message".

namespace rpn2tex::log {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5,
};

const char* level_name(LogLevel level);

/// Case-insensitive. Unknown names map to Info.
LogLevel parse_level(std::string_view s);

/// True if s names a level parse_level understands.
bool is_level_name(std::string_view s);

void set_level(LogLevel level);
LogLevel level();

inline bool enabled(LogLevel l) {
    return l != LogLevel::Off && static_cast<int>(l) >= static_cast<int>(level());
}

/// Replace the output stream. Pass nullptr to restore std::cerr.
/// The stream must outlive all logging calls made while it is installed.
void set_sink(std::ostream* sink);

void write(LogLevel level, std::string_view module, const std::string& message);

} // namespace rpn2tex::log

#define RPN2TEX_LOG(lvl, module, expr)                                              \
    do {                                                                            \
        if (::rpn2tex::log::enabled(lvl)) {                                         \
            std::ostringstream rpn2tex_log_oss_;                                    \
            rpn2tex_log_oss_ << expr;                                               \
            ::rpn2tex::log::write(lvl, module, rpn2tex_log_oss_.str());             \
        }                                                                           \
    } while (0)

#define RPN2TEX_LOG_TRACE(module, expr) RPN2TEX_LOG(::rpn2tex::log::LogLevel::Trace, module, expr)
#define RPN2TEX_LOG_DEBUG(module, expr) RPN2TEX_LOG(::rpn2tex::log::LogLevel::Debug, module, expr)
#define RPN2TEX_LOG_INFO(module, expr)  RPN2TEX_LOG(::rpn2tex::log::LogLevel::Info, module, expr)
#define RPN2TEX_LOG_WARN(module, expr)  RPN2TEX_LOG(::rpn2tex::log::LogLevel::Warn, module, expr)
#define RPN2TEX_LOG_ERROR(module, expr) RPN2TEX_LOG(::rpn2tex::log::LogLevel::Error, module, expr)
