#include <mdkatex/book/book.h>

#include <mdkatex/core/errors.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

using mdkatex::book::chapter_output_paths;
using mdkatex::core::ConfigError;

TEST(ChapterOutputPathsTest, KeepsFileNameUnderOutDir) {
    const auto targets = chapter_output_paths("out", {"src/intro.md", "src/part/two.md"});
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].string(), (std::filesystem::path("out") / "intro.md").string());
    EXPECT_EQ(targets[1].string(), (std::filesystem::path("out") / "two.md").string());
}

TEST(ChapterOutputPathsTest, SameFileNameInTwoDirectoriesIsRejected) {
    try {
        chapter_output_paths("out", {"a/ch.md", "b/intro.md", "c/ch.md"});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("a/ch.md"), std::string::npos);
        EXPECT_NE(message.find("c/ch.md"), std::string::npos);
    }
}

TEST(ChapterOutputPathsTest, RepeatedInputIsRejected) {
    EXPECT_THROW(chapter_output_paths("out", {"ch.md", "ch.md"}), ConfigError);
}

TEST(ChapterOutputPathsTest, InputWithoutFileName) {
    EXPECT_THROW(chapter_output_paths("out", {"chapters/"}), ConfigError);
}

TEST(ChapterOutputPathsTest, NoInputs) {
    EXPECT_TRUE(chapter_output_paths("out", {}).empty());
}
