#include <mdkatex/core/errors.h>

namespace mdkatex::core {

namespace {

std::string format_parse_error(const std::string& origin, std::size_t line,
                               const std::string& reason) {
    std::string message = origin.empty() ? std::string("<macros>") : origin;
    message += ":" + std::to_string(line) + ": " + reason;
    return message;
}

}  // namespace

MacroParseError::MacroParseError(const std::string& origin, std::size_t line,
                                 const std::string& reason)
    : ConfigError(format_parse_error(origin, line, reason)),
      origin_(origin),
      line_(line),
      reason_(reason) {}

}  // namespace mdkatex::core
