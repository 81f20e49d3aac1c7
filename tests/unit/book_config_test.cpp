#include <mdkatex/options/book_config.h>

#include <mdkatex/core/errors.h>

#include <gtest/gtest.h>

#include <cmath>

using mdkatex::core::ConfigError;
using mdkatex::options::BookConfig;

TEST(BookConfigTest, GetReturnsRawValue) {
    BookConfig config{{"error-color", "#ff0000"}};
    EXPECT_EQ(config.get("error-color").value(), "#ff0000");
    EXPECT_FALSE(config.get("missing").has_value());

    config.set("error-color", "blue");
    EXPECT_EQ(config.get("error-color").value(), "blue");
    EXPECT_EQ(config.entries().size(), 1u);
}

TEST(BookConfigTest, BooleanSpellings) {
    BookConfig config{{"a", "true"}, {"b", "Off"}, {"c", " yes "}, {"d", "0"}};
    EXPECT_TRUE(config.get_bool("a").value());
    EXPECT_FALSE(config.get_bool("b").value());
    EXPECT_TRUE(config.get_bool("c").value());
    EXPECT_FALSE(config.get_bool("d").value());
    EXPECT_FALSE(config.get_bool("missing").has_value());
}

TEST(BookConfigTest, MalformedBooleanThrows) {
    BookConfig config{{"leqno", "maybe"}};
    EXPECT_THROW(config.get_bool("leqno"), ConfigError);
}

TEST(BookConfigTest, Doubles) {
    BookConfig config{{"a", "0.04"}, {"b", "inf"}, {"c", "-1"}, {"d", "nan"}};
    EXPECT_DOUBLE_EQ(config.get_double("a").value(), 0.04);
    EXPECT_TRUE(std::isinf(config.get_double("b").value()));
    EXPECT_DOUBLE_EQ(config.get_double("c").value(), -1.0);
    EXPECT_TRUE(std::isnan(config.get_double("d").value()));
}

TEST(BookConfigTest, MalformedDoubleThrows) {
    BookConfig config{{"a", "1.5em"}, {"b", ""}};
    EXPECT_THROW(config.get_double("a"), ConfigError);
    EXPECT_THROW(config.get_double("b"), ConfigError);
}

TEST(BookConfigTest, Integers) {
    BookConfig config{{"a", "1000"}, {"b", "+4"}, {"c", "-2"}, {"d", "3.5"}, {"e", "x"}};
    EXPECT_EQ(config.get_int("a").value(), 1000);
    EXPECT_EQ(config.get_int("b").value(), 4);
    EXPECT_EQ(config.get_int("c").value(), -2);
    EXPECT_THROW(config.get_int("d"), ConfigError);
    EXPECT_THROW(config.get_int("e"), ConfigError);
}

TEST(BookConfigTest, ParseAssignment) {
    auto assignment = BookConfig::parse_assignment("block-delimiter.left=\\[");
    ASSERT_TRUE(assignment.has_value());
    EXPECT_EQ(assignment->first, "block-delimiter.left");
    EXPECT_EQ(assignment->second, "\\[");

    auto with_equals = BookConfig::parse_assignment("error-color=a=b");
    ASSERT_TRUE(with_equals.has_value());
    EXPECT_EQ(with_equals->second, "a=b");

    auto empty_value = BookConfig::parse_assignment("error-color=");
    ASSERT_TRUE(empty_value.has_value());
    EXPECT_EQ(empty_value->second, "");

    EXPECT_FALSE(BookConfig::parse_assignment("no-css").has_value());
    EXPECT_FALSE(BookConfig::parse_assignment("=true").has_value());
}
