#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace mdkatex::macros {

// Name -> expansion template, e.g. "\\R" -> "\\mathbb{R}^{#1}".
// Built once per run and only read afterwards.
class MacroTable {
public:
    using Map = std::map<std::string, std::string>;
    using const_iterator = Map::const_iterator;

    MacroTable() = default;

    // Returns false if `name` is already defined.
    bool define(std::string name, std::string expansion);

    const std::string* find(std::string_view name) const;
    std::size_t size() const { return entries_.size(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Merge `other` into this table. Returns the first clashing name, or an
    // empty string when all names were new.
    std::string merge(const MacroTable& other);

private:
    Map entries_;
};

// Parse macro definitions. `origin` names the source in error messages.
// Throws core::MacroParseError.
MacroTable parse_macros(std::string_view text, const std::string& origin = {});

// Read and parse a UTF-8 macro file. Throws core::ConfigError if the file
// cannot be read and core::MacroParseError on syntax errors.
MacroTable load_macro_file(const std::filesystem::path& path);

// Whether `name` is a well-formed control sequence: a backslash followed by
// ASCII letters, or by exactly one non-letter character.
bool is_valid_macro_name(std::string_view name);

}  // namespace mdkatex::macros
