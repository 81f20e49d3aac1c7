#include <mdkatex/assemble/escape.h>

#include <mdkatex/assemble/reassembler.h>

namespace mdkatex::assemble {

void escape_math(std::string_view math, std::string& out) {
    for (char c : math) {
        switch (c) {
            case '_':  out += "\\_"; break;
            case '*':  out += "\\*"; break;
            case '\\': out += "\\\\"; break;
            default:   out += c; break;
        }
    }
}

std::string escape_math_with_delimiter(std::string_view math, const scan::Delimiter& delimiter) {
    std::string out;
    out.reserve(math.size() + delimiter.left.size() + delimiter.right.size() + 8);
    escape_math(delimiter.left, out);
    escape_math(math, out);
    escape_math(delimiter.right, out);
    return out;
}

std::string escape_chapter(std::string_view text, const scan::ScanResult& scan,
                           const scan::Delimiter& block_delimiter,
                           const scan::Delimiter& inline_delimiter) {
    validate(text, scan, scan.spans.size());

    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (const auto& segment : scan.segments) {
        switch (segment.kind) {
            case scan::SegmentKind::Text:
            case scan::SegmentKind::Escape:
                // Markdown resolves the escape itself further down the line.
                out.append(text.substr(segment.range.begin, segment.range.size()));
                break;
            case scan::SegmentKind::Math: {
                const auto& span = scan.spans[segment.span_index];
                out += escape_math_with_delimiter(
                    span.source,
                    span.kind == scan::DisplayKind::Block ? block_delimiter : inline_delimiter);
                break;
            }
        }
    }
    return out;
}

}  // namespace mdkatex::assemble
