#include <mdkatex/scan/scanner.h>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace mdkatex::scan;

namespace {

// Segments must tile the whole text in order.
void expect_full_coverage(std::string_view text, const ScanResult& result) {
    std::size_t cursor = 0;
    for (const auto& segment : result.segments) {
        EXPECT_EQ(segment.range.begin, cursor);
        EXPECT_GT(segment.range.end, segment.range.begin);
        cursor = segment.range.end;
    }
    EXPECT_EQ(cursor, text.size());
}

// The chapter with every math span removed and escapes resolved.
std::string literal_text(std::string_view text, const ScanResult& result) {
    std::string out;
    for (const auto& segment : result.segments) {
        if (segment.kind == SegmentKind::Text) {
            out.append(text.substr(segment.range.begin, segment.range.size()));
        } else if (segment.kind == SegmentKind::Escape) {
            out.push_back(text[segment.range.end - 1]);
        }
    }
    return out;
}

ScanConfig custom_delimiters() {
    ScanConfig config;
    config.block_delimiter = {"\\[", "\\]"};
    config.inline_delimiter = {"\\(", "\\)"};
    return config;
}

}  // namespace

// ============================================================================
// Basic spans
// ============================================================================
TEST(ScannerTest, InlineAndBlockSpans) {
    const std::string text = "Let $x$ be\n$$\\sum_i x_i$$\ndone";
    Scanner scanner;
    auto result = scanner.scan(text);

    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_EQ(result.spans[0].kind, DisplayKind::Inline);
    EXPECT_EQ(result.spans[0].source, "x");
    EXPECT_EQ(result.spans[0].outer.begin, 4u);
    EXPECT_EQ(result.spans[0].outer.end, 7u);
    EXPECT_EQ(result.spans[0].inner.begin, 5u);
    EXPECT_EQ(result.spans[1].kind, DisplayKind::Block);
    EXPECT_EQ(result.spans[1].source, "\\sum_i x_i");
    EXPECT_TRUE(result.issues.empty());
    expect_full_coverage(text, result);
    EXPECT_EQ(literal_text(text, result), "Let  be\n\ndone");
}

TEST(ScannerTest, DoubleDollarIsOneBlockSpan) {
    Scanner scanner;
    auto result = scanner.scan("$$x$$");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].kind, DisplayKind::Block);
    EXPECT_EQ(result.spans[0].source, "x");
    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_EQ(result.segments[0].kind, SegmentKind::Math);
}

TEST(ScannerTest, MultilineBlock) {
    const std::string text = "$$\na = b\n\\\\\nc = d\n$$\n";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "\na = b\n\\\\\nc = d\n");
    expect_full_coverage(text, result);
}

TEST(ScannerTest, MathFreeTextIsOneTextSegment) {
    const std::string text = "# Title\n\nNo math here, only 5 dollars.\n";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_EQ(result.segments[0].kind, SegmentKind::Text);
    EXPECT_EQ(literal_text(text, result), text);
}

TEST(ScannerTest, EmptyText) {
    Scanner scanner;
    auto result = scanner.scan("");
    EXPECT_TRUE(result.segments.empty());
    EXPECT_TRUE(result.spans.empty());
}

TEST(ScannerTest, SegmentIndicesFollowSpanOrder) {
    const std::string text = "$a$ $b$ $$c$$ $d$";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 4u);
    std::size_t expected = 0;
    for (const auto& segment : result.segments) {
        if (segment.kind == SegmentKind::Math) {
            EXPECT_EQ(segment.span_index, expected);
            ++expected;
        }
    }
    EXPECT_EQ(expected, 4u);
    expect_full_coverage(text, result);
}

// ============================================================================
// Escapes
// ============================================================================
TEST(ScannerTest, EscapedDollarIsLiteral) {
    const std::string text = "a \\$ b";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    ASSERT_EQ(result.segments.size(), 3u);
    EXPECT_EQ(result.segments[1].kind, SegmentKind::Escape);
    EXPECT_EQ(result.segments[1].range.begin, 2u);
    EXPECT_EQ(result.segments[1].range.end, 4u);
    EXPECT_EQ(literal_text(text, result), "a $ b");
}

TEST(ScannerTest, EscapedDollarsAroundText) {
    const std::string text = "costs \\$5 and \\$6";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(literal_text(text, result), "costs $5 and $6");
}

TEST(ScannerTest, OtherBackslashesPassThrough) {
    const std::string text = "a \\\\ b \\` c \\n";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_EQ(literal_text(text, result), text);
}

TEST(ScannerTest, EscapedDelimiterInsideMathIsSkipped) {
    Scanner scanner;
    auto result = scanner.scan("$a \\$ b$ c");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "a \\$ b");
}

TEST(ScannerTest, DoubleBackslashBeforeCloseDoesNotEscape) {
    Scanner scanner;
    auto result = scanner.scan("$a\\\\$ b");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "a\\\\");
}

// ============================================================================
// Code suppression
// ============================================================================
TEST(ScannerTest, InlineCodeSuppressesMath) {
    const std::string text = "use `$x$` or ``a $b$ ` c`` then $y$";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "y");
    expect_full_coverage(text, result);
}

TEST(ScannerTest, UnmatchedBacktickIsLiteral) {
    Scanner scanner;
    auto result = scanner.scan("a ` b $x$");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "x");
}

TEST(ScannerTest, StrayBacktickDoesNotPairAcrossFence) {
    const std::string text =
        "Use a ` backtick here.\n\n```sh\necho `date` costs $5 and $6\n```\n";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    EXPECT_TRUE(result.issues.empty());
    expect_full_coverage(text, result);
}

TEST(ScannerTest, StrayBacktickDoesNotPairWithFenceLine) {
    Scanner scanner;
    auto result = scanner.scan("a ` b\n```\n$x$\n```\n");
    EXPECT_TRUE(result.spans.empty());
}

TEST(ScannerTest, InlineCodeEndsAtBlankLine) {
    Scanner scanner;
    auto result = scanner.scan("a ` b\n\n$x$ and ` c");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "x");
}

TEST(ScannerTest, InlineCodeMaySpanLinesWithinParagraph) {
    Scanner scanner;
    auto result = scanner.scan("`a\n$x$ b` $y$");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "y");
}

TEST(ScannerTest, FencedCodeSuppressesMath) {
    const std::string text = "before $a$\n```latex\n$b$ and $$c$$\n```\nafter $d$\n";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_EQ(result.spans[0].source, "a");
    EXPECT_EQ(result.spans[1].source, "d");
    expect_full_coverage(text, result);
}

TEST(ScannerTest, TildeFenceNeedsMatchingMarker) {
    const std::string text = "~~~~\n$a$\n```\n$b$\n~~~~\n$c$";
    Scanner scanner;
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "c");
}

TEST(ScannerTest, TildeFencesCanBeDisabled) {
    ScanConfig config;
    config.tilde_fences = false;
    Scanner scanner(config);
    auto result = scanner.scan("~~~\n$a$\n~~~\n");
    ASSERT_EQ(result.spans.size(), 1u);
}

TEST(ScannerTest, ShorterFenceDoesNotClose) {
    Scanner scanner;
    auto result = scanner.scan("````\n```\n$a$\n````\n$b$");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].source, "b");
}

TEST(ScannerTest, IndentedFenceUpToThreeSpaces) {
    Scanner scanner;
    EXPECT_TRUE(scanner.scan("   ```\n$a$\n   ```\n").spans.empty());
    // Four spaces is an indented code line, not a fence.
    EXPECT_EQ(scanner.scan("    ```\n$a$\n").spans.size(), 1u);
}

TEST(ScannerTest, UnclosedFenceRunsToEnd) {
    Scanner scanner;
    auto result = scanner.scan("```\n$a$\n");
    EXPECT_TRUE(result.spans.empty());
    EXPECT_TRUE(result.issues.empty());
}

// ============================================================================
// Unterminated math
// ============================================================================
TEST(ScannerTest, UnterminatedInlineMathStaysText) {
    const std::string text = "one\ntwo $x + y\nthree";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].line, 2u);
    EXPECT_EQ(result.issues[0].offset, 8u);
    EXPECT_EQ(result.issues[0].kind, DisplayKind::Inline);
    EXPECT_EQ(literal_text(text, result), text);
    expect_full_coverage(text, result);
}

TEST(ScannerTest, OpeningDelimiterAtEnd) {
    const std::string text = "price: $$";
    Scanner scanner;
    auto result = scanner.scan(text);
    EXPECT_TRUE(result.spans.empty());
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, DisplayKind::Block);
    EXPECT_EQ(literal_text(text, result), text);
}

TEST(ScannerTest, SpansBeforeUnterminatedAreKept) {
    Scanner scanner;
    auto result = scanner.scan("$a$ then $b");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.issues.size(), 1u);
}

// ============================================================================
// Custom delimiters
// ============================================================================
TEST(ScannerTest, BracketDelimiters) {
    const std::string text = "inline \\(a^2\\) and \\[b\\] but $c$ stays";
    Scanner scanner(custom_delimiters());
    auto result = scanner.scan(text);
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_EQ(result.spans[0].kind, DisplayKind::Inline);
    EXPECT_EQ(result.spans[0].source, "a^2");
    EXPECT_EQ(result.spans[1].kind, DisplayKind::Block);
    EXPECT_EQ(result.spans[1].source, "b");
    expect_full_coverage(text, result);
}

TEST(ScannerTest, LongerLeftDelimiterWins) {
    ScanConfig config;
    config.block_delimiter = Delimiter::same("@");
    config.inline_delimiter = Delimiter::same("@@");
    Scanner scanner(config);
    auto result = scanner.scan("@@x@@ @y@");
    ASSERT_EQ(result.spans.size(), 2u);
    EXPECT_EQ(result.spans[0].kind, DisplayKind::Inline);
    EXPECT_EQ(result.spans[0].source, "x");
    EXPECT_EQ(result.spans[1].kind, DisplayKind::Block);
    EXPECT_EQ(result.spans[1].source, "y");
}

TEST(ScannerTest, BlockWinsOnEqualLength) {
    ScanConfig config;
    config.block_delimiter = Delimiter::same("%");
    config.inline_delimiter = Delimiter::same("%");
    Scanner scanner(config);
    auto result = scanner.scan("%x%");
    ASSERT_EQ(result.spans.size(), 1u);
    EXPECT_EQ(result.spans[0].kind, DisplayKind::Block);
}

TEST(ScannerTest, DelimiterAccessor) {
    Scanner scanner(custom_delimiters());
    EXPECT_EQ(scanner.delimiter(DisplayKind::Block).left, "\\[");
    EXPECT_EQ(scanner.delimiter(DisplayKind::Inline).right, "\\)");
}

TEST(ScannerTest, LineAt) {
    const std::string text = "a\nb\nc";
    EXPECT_EQ(line_at(text, 0), 1u);
    EXPECT_EQ(line_at(text, 2), 2u);
    EXPECT_EQ(line_at(text, 4), 3u);
    EXPECT_EQ(line_at(text, 100), 3u);
}
