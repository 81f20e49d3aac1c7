#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdkatex::scan {

// A pair of left/right math delimiters, e.g. "$$"/"$$" or "\\["/"\\]".
struct Delimiter {
    std::string left;
    std::string right;

    static Delimiter same(const std::string& delimiter) { return {delimiter, delimiter}; }

    bool operator==(const Delimiter& other) const {
        return left == other.left && right == other.right;
    }
};

enum class DisplayKind {
    Inline,
    Block,
};

const char* display_kind_name(DisplayKind kind);

// Half-open byte range [begin, end) into a chapter's original text.
struct ByteRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - begin; }
};

struct MathSpan {
    DisplayKind kind = DisplayKind::Inline;
    ByteRange outer;   // including delimiters
    ByteRange inner;   // source only
    std::string source;
};

enum class SegmentKind {
    Text,     // emitted verbatim
    Escape,   // backslash + delimiter char; emits the char alone
    Math,     // replaced by the rendering of spans[span_index]
};

struct Segment {
    SegmentKind kind = SegmentKind::Text;
    ByteRange range;
    std::size_t span_index = 0;
};

// An unterminated math delimiter. The tail from `offset` is left as text.
struct ScanIssue {
    std::size_t offset = 0;
    std::size_t line = 0;   // 1-based
    DisplayKind kind = DisplayKind::Inline;
    std::string message;
};

struct ScanResult {
    std::vector<Segment> segments;
    std::vector<MathSpan> spans;
    std::vector<ScanIssue> issues;
};

struct ScanConfig {
    Delimiter block_delimiter = Delimiter::same("$$");
    Delimiter inline_delimiter = Delimiter::same("$");
    // Recognise ~~~ fences in addition to ``` fences.
    bool tilde_fences = true;
};

// Finds math spans in Markdown text while skipping inline code, fenced code
// blocks and backslash-escaped delimiters. One Scanner can be shared between
// threads; scan() keeps all of its state on the stack.
class Scanner {
public:
    explicit Scanner(ScanConfig config = {});

    ScanResult scan(std::string_view text) const;

    const Delimiter& delimiter(DisplayKind kind) const;

private:
    ScanConfig config_;
    // Match order: longest left delimiter first, block first on equal length.
    std::vector<DisplayKind> match_order_;
};

// 1-based line number of byte `offset` in `text`.
std::size_t line_at(std::string_view text, std::size_t offset);

}  // namespace mdkatex::scan
