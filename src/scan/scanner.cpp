#include <mdkatex/scan/scanner.h>

#include <algorithm>
#include <optional>

namespace mdkatex::scan {

namespace {

enum class State {
    Literal,
    InlineCode,
    FencedCode,
    InlineMath,
    BlockMath,
    Escaped,
};

struct Fence {
    char marker = '`';
    std::size_t length = 0;
};

constexpr std::size_t kMinFenceLength = 3;
constexpr std::size_t kMaxFenceIndent = 3;

bool at_line_start(std::string_view text, std::size_t pos) {
    return pos == 0 || text[pos - 1] == '\n';
}

// Position just past the '\n' ending the line containing `pos`.
std::size_t next_line(std::string_view text, std::size_t pos) {
    const std::size_t newline = text.find('\n', pos);
    return newline == std::string_view::npos ? text.size() : newline + 1;
}

std::size_t count_run(std::string_view text, std::size_t pos, char c) {
    std::size_t end = pos;
    while (end < text.size() && text[end] == c) {
        ++end;
    }
    return end - pos;
}

std::size_t skip_indent(std::string_view text, std::size_t pos) {
    std::size_t indent = 0;
    while (pos < text.size() && text[pos] == ' ' && indent < kMaxFenceIndent) {
        ++pos;
        ++indent;
    }
    return pos;
}

std::optional<Fence> opening_fence(std::string_view text, std::size_t pos, bool tilde_fences) {
    pos = skip_indent(text, pos);
    if (pos >= text.size()) {
        return std::nullopt;
    }
    const char marker = text[pos];
    if (marker != '`' && !(tilde_fences && marker == '~')) {
        return std::nullopt;
    }
    const std::size_t run = count_run(text, pos, marker);
    if (run < kMinFenceLength) {
        return std::nullopt;
    }
    if (marker == '`') {
        // A backtick in the info string means this is inline code.
        const std::size_t info_begin = pos + run;
        const std::size_t info_end = next_line(text, info_begin);
        if (text.substr(info_begin, info_end - info_begin).find('`') != std::string_view::npos) {
            return std::nullopt;
        }
    }
    return Fence{marker, run};
}

bool is_closing_fence(std::string_view text, std::size_t line_begin, const Fence& fence) {
    std::size_t pos = skip_indent(text, line_begin);
    const std::size_t run = count_run(text, pos, fence.marker);
    if (run < fence.length) {
        return false;
    }
    pos += run;
    while (pos < text.size() && text[pos] != '\n') {
        const char c = text[pos];
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
        ++pos;
    }
    return true;
}

bool is_blank_line(std::string_view text, std::size_t line_begin) {
    for (std::size_t pos = line_begin; pos < text.size() && text[pos] != '\n'; ++pos) {
        const char c = text[pos];
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

// End of the backtick run of exactly `length` that closes an inline code
// span opened before `from`, or npos. Inline code ends with its paragraph:
// the search stops at a blank line or at a line opening a fenced block.
std::size_t find_code_close(std::string_view text, std::size_t from, std::size_t length,
                            bool tilde_fences) {
    std::size_t pos = from;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == '\n') {
            ++pos;
            if (is_blank_line(text, pos) || opening_fence(text, pos, tilde_fences)) {
                return std::string_view::npos;
            }
        } else if (c == '`') {
            const std::size_t run = count_run(text, pos, '`');
            if (run == length) {
                return pos + run;
            }
            pos += run;
        } else {
            ++pos;
        }
    }
    return std::string_view::npos;
}

// First occurrence of `right` at or after `from` that is not preceded by an
// odd number of backslashes inside the math content.
std::size_t find_math_close(std::string_view text, std::size_t content_begin,
                            const std::string& right) {
    std::size_t from = content_begin;
    while (true) {
        const std::size_t pos = text.find(right, from);
        if (pos == std::string_view::npos) {
            return pos;
        }
        std::size_t backslashes = 0;
        std::size_t check = pos;
        while (check > content_begin && text[check - 1] == '\\') {
            --check;
            ++backslashes;
        }
        if (backslashes % 2 == 0) {
            return pos;
        }
        from = pos + right.size();
    }
}

}  // namespace

const char* display_kind_name(DisplayKind kind) {
    switch (kind) {
        case DisplayKind::Inline: return "inline";
        case DisplayKind::Block:  return "block";
    }
    return "unknown";
}

Scanner::Scanner(ScanConfig config) : config_(std::move(config)) {
    match_order_ = {DisplayKind::Block, DisplayKind::Inline};
    std::stable_sort(match_order_.begin(), match_order_.end(),
                     [this](DisplayKind a, DisplayKind b) {
                         return delimiter(a).left.size() > delimiter(b).left.size();
                     });
}

const Delimiter& Scanner::delimiter(DisplayKind kind) const {
    return kind == DisplayKind::Block ? config_.block_delimiter : config_.inline_delimiter;
}

ScanResult Scanner::scan(std::string_view text) const {
    ScanResult result;
    const std::size_t n = text.size();

    State state = State::Literal;
    std::size_t pos = 0;
    std::size_t run_start = 0;

    Fence fence;
    std::size_t code_end = 0;
    const Delimiter* math = nullptr;
    DisplayKind math_kind = DisplayKind::Inline;
    std::size_t math_open = 0;

    auto flush_text = [&](std::size_t end) {
        if (end > run_start) {
            result.segments.push_back({SegmentKind::Text, {run_start, end}, 0});
        }
        run_start = end;
    };

    auto match_delimiter = [&](std::size_t at) -> std::optional<DisplayKind> {
        for (DisplayKind kind : match_order_) {
            const std::string& left = delimiter(kind).left;
            if (!left.empty() && text.compare(at, left.size(), left) == 0) {
                return kind;
            }
        }
        return std::nullopt;
    };

    auto is_escapable = [&](char c) {
        if (c == '\\') {
            return false;
        }
        for (DisplayKind kind : match_order_) {
            const std::string& left = delimiter(kind).left;
            if (!left.empty() && left.front() == c) {
                return true;
            }
        }
        return false;
    };

    // The tail from the opening delimiter stays in the current text run.
    auto report_unterminated = [&]() {
        ScanIssue issue;
        issue.offset = math_open;
        issue.line = line_at(text, math_open);
        issue.kind = math_kind;
        issue.message = std::string("unterminated ") + display_kind_name(math_kind) +
                        " math: no closing '" + math->right + "'";
        result.issues.push_back(std::move(issue));
    };

    while (pos < n) {
        switch (state) {
            case State::Literal: {
                if (at_line_start(text, pos)) {
                    if (auto opened = opening_fence(text, pos, config_.tilde_fences)) {
                        fence = *opened;
                        pos = next_line(text, pos);
                        state = State::FencedCode;
                        break;
                    }
                }
                if (auto kind = match_delimiter(pos)) {
                    flush_text(pos);
                    math_kind = *kind;
                    math = &delimiter(math_kind);
                    math_open = pos;
                    pos += math->left.size();
                    state = math_kind == DisplayKind::Block ? State::BlockMath
                                                            : State::InlineMath;
                    break;
                }
                const char c = text[pos];
                if (c == '\\') {
                    if (pos + 1 < n && is_escapable(text[pos + 1])) {
                        flush_text(pos);
                        pos += 1;
                        state = State::Escaped;
                    } else {
                        pos += (pos + 1 < n) ? 2 : 1;
                    }
                    break;
                }
                if (c == '`') {
                    const std::size_t run = count_run(text, pos, '`');
                    const std::size_t close =
                        find_code_close(text, pos + run, run, config_.tilde_fences);
                    pos += run;
                    if (close != std::string_view::npos) {
                        code_end = close;
                        state = State::InlineCode;
                    }
                    break;
                }
                ++pos;
                break;
            }

            case State::Escaped:
                // `pos` is on the escaped delimiter character.
                result.segments.push_back({SegmentKind::Escape, {pos - 1, pos + 1}, 0});
                ++pos;
                run_start = pos;
                state = State::Literal;
                break;

            case State::InlineCode:
                pos = code_end;
                state = State::Literal;
                break;

            case State::FencedCode: {
                const std::size_t line_begin = pos;
                pos = next_line(text, pos);
                if (is_closing_fence(text, line_begin, fence)) {
                    state = State::Literal;
                }
                break;
            }

            case State::InlineMath:
            case State::BlockMath: {
                const std::string& right = math->right;
                const std::size_t close = find_math_close(text, pos, right);
                if (close == std::string_view::npos) {
                    report_unterminated();
                    pos = n;
                    state = State::Literal;
                    break;
                }

                MathSpan span;
                span.kind = math_kind;
                span.outer = {math_open, close + right.size()};
                span.inner = {pos, close};
                span.source = std::string(text.substr(pos, close - pos));

                result.segments.push_back(
                    {SegmentKind::Math, span.outer, result.spans.size()});
                result.spans.push_back(std::move(span));

                pos = close + right.size();
                run_start = pos;
                state = State::Literal;
                break;
            }
        }
    }

    // An opening delimiter at the very end never reaches the math states.
    if (state == State::InlineMath || state == State::BlockMath) {
        report_unterminated();
    }

    flush_text(n);
    return result;
}

std::size_t line_at(std::string_view text, std::size_t offset) {
    offset = std::min(offset, text.size());
    return 1 + static_cast<std::size_t>(
        std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
}

}  // namespace mdkatex::scan
