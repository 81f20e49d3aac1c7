#include <mdkatex/assemble/reassembler.h>

#include <mdkatex/assemble/html_escape.h>
#include <mdkatex/core/errors.h>

#include <algorithm>

namespace mdkatex::assemble {

namespace {

std::string range_text(const scan::ByteRange& range) {
    return "[" + std::to_string(range.begin) + ", " + std::to_string(range.end) + ")";
}

}  // namespace

void validate(std::string_view text, const scan::ScanResult& scan, std::size_t outcome_count) {
    if (outcome_count != scan.spans.size()) {
        throw core::InternalError("outcome count " + std::to_string(outcome_count) +
                                  " does not match span count " +
                                  std::to_string(scan.spans.size()));
    }

    std::size_t cursor = 0;
    std::size_t math_segments = 0;
    for (const auto& segment : scan.segments) {
        const auto& range = segment.range;
        if (range.begin != cursor || range.end < range.begin || range.end > text.size()) {
            throw core::InternalError("segment " + range_text(range) +
                                      " does not continue at offset " + std::to_string(cursor) +
                                      " of a " + std::to_string(text.size()) + "-byte chapter");
        }
        if (segment.kind == scan::SegmentKind::Escape && range.size() != 2) {
            throw core::InternalError("escape segment " + range_text(range) +
                                      " is not two bytes long");
        }
        if (segment.kind == scan::SegmentKind::Math) {
            if (segment.span_index >= scan.spans.size()) {
                throw core::InternalError("math segment refers to missing span " +
                                          std::to_string(segment.span_index));
            }
            const auto& span = scan.spans[segment.span_index];
            if (span.outer.begin != range.begin || span.outer.end != range.end) {
                throw core::InternalError("span " + std::to_string(segment.span_index) +
                                          " range " + range_text(span.outer) +
                                          " differs from its segment " + range_text(range));
            }
            ++math_segments;
        }
        cursor = range.end;
    }
    if (cursor != text.size()) {
        throw core::InternalError("segments end at offset " + std::to_string(cursor) +
                                  " of a " + std::to_string(text.size()) + "-byte chapter");
    }
    if (math_segments != scan.spans.size()) {
        throw core::InternalError("found " + std::to_string(math_segments) +
                                  " math segments for " + std::to_string(scan.spans.size()) +
                                  " spans");
    }
}

Reassembler::Reassembler(AssembleOptions options) : options_(std::move(options)) {}

std::string Reassembler::fragment(const scan::MathSpan& span,
                                  const render::RenderOutcome& outcome) const {
    // A newline inside the markup would end a Markdown paragraph.
    std::string markup = outcome.markup;
    std::replace(markup.begin(), markup.end(), '\n', ' ');

    if (!options_.include_src) {
        return markup;
    }
    std::string out;
    out.reserve(markup.size() + span.source.size() + 48);
    out += "<data class=\"katex-src\" value=\"";
    out += escape_html_attribute(span.source);
    out += "\">";
    out += markup;
    out += "</data>";
    return out;
}

std::string Reassembler::fallback_marker(const scan::MathSpan& span,
                                         const render::RenderOutcome& outcome) const {
    const scan::Delimiter& delimiter = span.kind == scan::DisplayKind::Block
                                           ? options_.block_delimiter
                                           : options_.inline_delimiter;
    std::string original = delimiter.left + span.source + delimiter.right;
    if (options_.error_color.empty()) {
        return original;
    }

    std::string out = "<span class=\"katex-error\" title=\"";
    out += escape_html_attribute(outcome.message);
    out += "\" style=\"color:";
    out += escape_html_attribute(options_.error_color);
    out += "\">";
    out += escape_html_text(original);
    out += "</span>";
    return out;
}

std::string Reassembler::assemble(std::string_view text,
                                  const scan::ScanResult& scan,
                                  const std::vector<render::RenderOutcome>& outcomes) const {
    validate(text, scan, outcomes.size());

    std::string out;
    out.reserve(text.size());
    for (const auto& segment : scan.segments) {
        switch (segment.kind) {
            case scan::SegmentKind::Text:
                out.append(text.substr(segment.range.begin, segment.range.size()));
                break;
            case scan::SegmentKind::Escape:
                out.push_back(text[segment.range.end - 1]);
                break;
            case scan::SegmentKind::Math: {
                const auto& span = scan.spans[segment.span_index];
                const auto& outcome = outcomes[segment.span_index];
                out += outcome.ok ? fragment(span, outcome) : fallback_marker(span, outcome);
                break;
            }
        }
    }
    return out;
}

}  // namespace mdkatex::assemble
