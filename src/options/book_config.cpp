#include <mdkatex/options/book_config.h>

#include <mdkatex/core/errors.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace mdkatex::options {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[noreturn]] void malformed(const std::string& key, const std::string& value,
                            const char* expected) {
    throw core::ConfigError("invalid value '" + value + "' for '" + key +
                            "' (expected " + expected + ")");
}

}  // namespace

void BookConfig::set(std::string key, std::string value) {
    entries_[std::move(key)] = std::move(value);
}

std::optional<std::string> BookConfig::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> BookConfig::get_bool(const std::string& key) const {
    auto raw = get(key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string value = to_lower(trim(*raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    malformed(key, *raw, "a boolean");
}

std::optional<double> BookConfig::get_double(const std::string& key) const {
    auto raw = get(key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string value(trim(*raw));
    if (value.empty()) {
        malformed(key, *raw, "a number");
    }
    // strtod also understands "inf", "infinity" and "nan".
    char* end = nullptr;
    errno = 0;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || errno == ERANGE) {
        malformed(key, *raw, "a number");
    }
    return parsed;
}

std::optional<long long> BookConfig::get_int(const std::string& key) const {
    auto raw = get(key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string_view value = trim(*raw);
    long long parsed = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    if (!value.empty() && *begin == '+') {
        ++begin;
    }
    const std::from_chars_result result = std::from_chars(begin, end, parsed);
    if (value.empty() || result.ec != std::errc() || result.ptr != end) {
        malformed(key, *raw, "an integer");
    }
    return parsed;
}

std::optional<std::pair<std::string, std::string>> BookConfig::parse_assignment(std::string_view text) {
    const std::size_t equals = text.find('=');
    if (equals == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view key = trim(text.substr(0, equals));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::string(key), std::string(text.substr(equals + 1)));
}

}  // namespace mdkatex::options
