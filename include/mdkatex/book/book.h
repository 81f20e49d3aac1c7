#pragma once

#include <mdkatex/options/book_config.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mdkatex::book {

struct Chapter {
    std::string id;        // e.g. the chapter's source path
    std::string content;   // raw Markdown in, transformed Markdown out
    std::map<std::string, std::string> metadata;
};

// The host's batch: every chapter of a book plus its preprocessor table.
struct Book {
    std::vector<Chapter> chapters;
    options::BookConfig config;
    // Directory that relative paths in `config` are resolved against.
    std::filesystem::path root = ".";
};

// Where each input chapter is written under `out_dir`: the input's file
// name. Throws core::ConfigError if two inputs would land on the same file.
std::vector<std::filesystem::path> chapter_output_paths(
    const std::filesystem::path& out_dir, const std::vector<std::filesystem::path>& inputs);

}  // namespace mdkatex::book
