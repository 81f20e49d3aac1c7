#include <mdkatex/macros/macro_table.h>

#include <mdkatex/core/errors.h>

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace mdkatex::macros {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_letter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (is_space(text.front()) || text.front() == '\n')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (is_space(text.back()) || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == text.size()) {
            break;
        }
        start = end + 1;
    }
    return lines;
}

// Adds the brace balance of `text` to `depth`, skipping backslash escapes.
// Returns false as soon as a closing brace has no opening partner.
bool accumulate_braces(std::string_view text, int& depth) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth < 0) {
                return false;
            }
        }
    }
    return true;
}

// True for "{}" and "{ }": a group with nothing to expand to.
bool is_empty_group(std::string_view value) {
    return value.size() >= 2 && value.front() == '{' && value.back() == '}' &&
           trim(value.substr(1, value.size() - 2)).empty();
}

struct PendingEntry {
    std::size_t line = 0;
    std::string name;
    std::string value;
    int depth = 0;
};

class MacroParser {
public:
    explicit MacroParser(const std::string& origin) : origin_(origin) {}

    MacroTable parse(std::string_view text) {
        const auto lines = split_lines(text);
        for (std::size_t index = 0; index < lines.size(); ++index) {
            const std::size_t line_number = index + 1;
            if (pending_) {
                continue_entry(lines[index]);
            } else {
                start_entry(lines[index], line_number);
            }
        }
        if (pending_) {
            fail(pending_->line, "unbalanced braces in definition of '" + pending_->name +
                                 "': missing '}'");
        }
        return std::move(table_);
    }

private:
    [[noreturn]] void fail(std::size_t line, const std::string& reason) const {
        throw core::MacroParseError(origin_, line, reason);
    }

    void start_entry(std::string_view raw_line, std::size_t line_number) {
        const std::string_view line = trim(raw_line);
        if (line.empty() || line.front() == '%') {
            return;
        }
        if (line.front() != '\\') {
            fail(line_number, "macro name must start with '\\'");
        }

        // The character after the backslash always belongs to the name, so
        // "\\::{...}" defines "\\:".
        const std::size_t colon = line.find(':', 2);
        if (colon == std::string_view::npos) {
            fail(line_number, "expected ':' after the macro name");
        }

        PendingEntry entry;
        entry.line = line_number;
        entry.name = std::string(trim(line.substr(0, colon)));
        if (!is_valid_macro_name(entry.name)) {
            fail(line_number, "invalid macro name '" + entry.name + "'");
        }
        const std::size_t pos = colon + 1;

        const std::string_view rest = trim(line.substr(pos));
        entry.value = std::string(rest);
        if (!accumulate_braces(rest, entry.depth)) {
            fail(line_number, "unbalanced braces in definition of '" + entry.name +
                              "': unexpected '}'");
        }

        pending_ = std::move(entry);
        if (pending_->depth == 0) {
            finish_entry();
        }
    }

    void continue_entry(std::string_view line) {
        pending_->value.push_back('\n');
        pending_->value.append(line);
        if (!accumulate_braces(line, pending_->depth)) {
            fail(pending_->line, "unbalanced braces in definition of '" + pending_->name +
                                 "': unexpected '}'");
        }
        if (pending_->depth == 0) {
            finish_entry();
        }
    }

    void finish_entry() {
        PendingEntry entry = std::move(*pending_);
        pending_.reset();

        // The template is kept as written: enclosing braces are a TeX group.
        std::string expansion(trim(entry.value));
        if (expansion.empty() || is_empty_group(expansion)) {
            fail(entry.line, "empty expansion for macro '" + entry.name + "'");
        }
        if (!table_.define(entry.name, std::move(expansion))) {
            fail(entry.line, "duplicate definition of macro '" + entry.name + "'");
        }
    }

    const std::string& origin_;
    MacroTable table_;
    std::optional<PendingEntry> pending_;
};

}  // namespace

bool MacroTable::define(std::string name, std::string expansion) {
    return entries_.emplace(std::move(name), std::move(expansion)).second;
}

const std::string* MacroTable::find(std::string_view name) const {
    auto it = entries_.find(std::string(name));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string MacroTable::merge(const MacroTable& other) {
    std::string clash;
    for (const auto& [name, expansion] : other) {
        if (!define(name, expansion) && clash.empty()) {
            clash = name;
        }
    }
    return clash;
}

bool is_valid_macro_name(std::string_view name) {
    if (name.size() < 2 || name.front() != '\\') {
        return false;
    }
    if (!is_letter(name[1])) {
        return name.size() == 2;
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        if (!is_letter(name[i])) {
            return false;
        }
    }
    return true;
}

MacroTable parse_macros(std::string_view text, const std::string& origin) {
    MacroParser parser(origin);
    return parser.parse(text);
}

MacroTable load_macro_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw core::ConfigError("cannot open macro file '" + path.string() + "'");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw core::ConfigError("cannot read macro file '" + path.string() + "'");
    }
    return parse_macros(buffer.str(), path.string());
}

}  // namespace mdkatex::macros
