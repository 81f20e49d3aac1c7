#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mdkatex::core {

// Invalid configuration or macro file. Fatal before any rendering starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Macro file syntax error, located by origin (usually the file path) and
// 1-based line number.
class MacroParseError : public ConfigError {
public:
    MacroParseError(const std::string& origin, std::size_t line, const std::string& reason);

    const std::string& origin() const { return origin_; }
    std::size_t line() const { return line_; }
    const std::string& reason() const { return reason_; }

private:
    std::string origin_;
    std::size_t line_ = 0;
    std::string reason_;
};

// A render failure surfaced under the strict policy, or an engine that could
// not be brought up.
class RenderError : public std::runtime_error {
public:
    RenderError(const std::string& message, std::size_t span_index, std::string source)
        : std::runtime_error(message), span_index_(span_index), source_(std::move(source)) {}

    std::size_t span_index() const { return span_index_; }
    const std::string& source() const { return source_; }

private:
    std::size_t span_index_ = 0;
    std::string source_;
};

// The math engine could not be brought up (bundle missing, script error).
// Fatal regardless of the failure policy.
class EngineInitError : public std::runtime_error {
public:
    explicit EngineInitError(const std::string& message)
        : std::runtime_error(message) {}
};

// Scanner/orchestrator pairing defect. Never caused by user input.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& message)
        : std::logic_error(message) {}
};

}  // namespace mdkatex::core
