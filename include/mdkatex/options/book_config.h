#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mdkatex::options {

// Free-form key/value configuration of one book, as found under
// [preprocessor.katex]. Nested tables are flattened with dots, e.g.
// "block-delimiter.left". Typed getters throw core::ConfigError when a
// value is present but malformed.
class BookConfig {
public:
    using Map = std::map<std::string, std::string>;

    BookConfig() = default;
    BookConfig(std::initializer_list<Map::value_type> entries) : entries_(entries) {}

    void set(std::string key, std::string value);

    std::optional<std::string> get(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<long long> get_int(const std::string& key) const;

    const Map& entries() const { return entries_; }

    // Splits "key=value". Returns nullopt without '=' or with an empty key.
    static std::optional<std::pair<std::string, std::string>> parse_assignment(std::string_view text);

private:
    Map entries_;
};

}  // namespace mdkatex::options
