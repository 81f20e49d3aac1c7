#pragma once

#include <mdkatex/render/render_outcome.h>
#include <mdkatex/scan/scanner.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdkatex::assemble {

struct AssembleOptions {
    // Wrap rendered math in <data class="katex-src" value="...">.
    bool include_src = false;
    // Colour of fallback markers. Empty: restore the source verbatim.
    std::string error_color;
    // Used to restore the original delimiters around failed equations.
    scan::Delimiter block_delimiter = scan::Delimiter::same("$$");
    scan::Delimiter inline_delimiter = scan::Delimiter::same("$");
};

// Builds a chapter's output from its original text, its scan and one
// outcome per span. The original text is only read, never modified.
class Reassembler {
public:
    explicit Reassembler(AssembleOptions options = {});

    // Throws core::InternalError if the scan and outcomes do not describe
    // `text` (see validate()).
    std::string assemble(std::string_view text,
                         const scan::ScanResult& scan,
                         const std::vector<render::RenderOutcome>& outcomes) const;

    // Markup replacing one successfully rendered span.
    std::string fragment(const scan::MathSpan& span, const render::RenderOutcome& outcome) const;

    // Marker replacing one span whose rendering failed.
    std::string fallback_marker(const scan::MathSpan& span, const render::RenderOutcome& outcome) const;

private:
    AssembleOptions options_;
};

// Checks that the segments tile [0, text.size()) in order, that every math
// segment points at an existing span with the same range, and that there is
// exactly one outcome per span. Throws core::InternalError.
void validate(std::string_view text, const scan::ScanResult& scan, std::size_t outcome_count);

}  // namespace mdkatex::assemble
