#include <mdkatex/book/preprocessor.h>
#include <mdkatex/core/config.h>
#include <mdkatex/core/diagnostics.h>
#include <mdkatex/core/errors.h>
#include <mdkatex/options/book_config.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "mdkatex";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName << " supports <renderer>\n"
         << "       " << kProgramName
         << " [--root DIR] [--set KEY=VALUE]... [--out-dir DIR] CHAPTER...\n";
}

bool is_help_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-h" || text == "--help";
}

bool is_version_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

// Accepts both "--flag VALUE" and "--flag=VALUE". Advances `index` past a
// separate value.
bool take_flag_value(int argc, char** argv, int& index, std::string_view flag,
                     std::string& value) {
  const std::string_view argument(argv[index]);
  if (argument == flag) {
    if (index + 1 >= argc) {
      return false;
    }
    value = argv[++index];
    return true;
  }
  value = std::string(argument.substr(flag.size() + 1));
  return true;
}

bool read_file(const std::filesystem::path& path, std::string& content) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  content = buffer.str();
  return true;
}

bool write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return static_cast<bool>(out);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << mdkatex::core::config::kVersionString << "\n";
    return 0;
  }

  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  if (std::string_view(argv[1]) == "supports") {
    if (argc != 3) {
      print_usage(std::cerr);
      return 1;
    }
    return mdkatex::book::Preprocessor::supports_renderer(argv[2]) ? 0 : 1;
  }

  mdkatex::book::Book book;
  std::filesystem::path out_dir;
  std::vector<std::filesystem::path> inputs;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    std::string value;

    if (argument == "--root" || starts_with(argument, "--root=")) {
      if (!take_flag_value(argc, argv, index, "--root", value) || value.empty()) {
        std::cerr << "Invalid --root: expected a directory\n";
        print_usage(std::cerr);
        return 1;
      }
      book.root = value;
      continue;
    }

    if (argument == "--out-dir" || starts_with(argument, "--out-dir=")) {
      if (!take_flag_value(argc, argv, index, "--out-dir", value) || value.empty()) {
        std::cerr << "Invalid --out-dir: expected a directory\n";
        print_usage(std::cerr);
        return 1;
      }
      out_dir = value;
      continue;
    }

    if (argument == "--set" || starts_with(argument, "--set=")) {
      if (!take_flag_value(argc, argv, index, "--set", value)) {
        std::cerr << "Invalid --set: expected KEY=VALUE\n";
        print_usage(std::cerr);
        return 1;
      }
      const auto assignment = mdkatex::options::BookConfig::parse_assignment(value);
      if (!assignment) {
        std::cerr << "Invalid --set: '" << value << "' (expected KEY=VALUE)\n";
        print_usage(std::cerr);
        return 1;
      }
      book.config.set(assignment->first, assignment->second);
      continue;
    }

    if (starts_with(argument, "-") && argument != "-") {
      std::cerr << "Unknown option: " << argument << "\n";
      print_usage(std::cerr);
      return 1;
    }

    inputs.emplace_back(argv[index]);
  }

  if (inputs.empty()) {
    print_usage(std::cerr);
    return 1;
  }
  if (out_dir.empty() && inputs.size() > 1) {
    std::cerr << "Several chapters need --out-dir\n";
    return 1;
  }

  std::vector<std::filesystem::path> targets;
  if (!out_dir.empty()) {
    try {
      targets = mdkatex::book::chapter_output_paths(out_dir, inputs);
    } catch (const mdkatex::core::ConfigError& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
  }

  for (const auto& input : inputs) {
    mdkatex::book::Chapter chapter;
    chapter.id = input.string();
    if (!read_file(input, chapter.content)) {
      std::cerr << "Cannot read chapter: " << input.string() << "\n";
      return 1;
    }
    book.chapters.push_back(std::move(chapter));
  }

  mdkatex::book::Preprocessor preprocessor;
  preprocessor.add_observer([](const mdkatex::core::DiagnosticEvent& event) {
    if (event.severity != mdkatex::core::Severity::Info) {
      std::cerr << mdkatex::core::format_diagnostic(event) << "\n";
    }
  });

  const mdkatex::book::RunResult result = preprocessor.run(book);
  if (!result.ok) {
    std::cerr << result.message << "\n";
    return 1;
  }

  if (out_dir.empty()) {
    std::cout << book.chapters.front().content;
    std::cerr << result.message << "\n";
    return 0;
  }

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Cannot create " << out_dir.string() << ": " << ec.message() << "\n";
    return 1;
  }
  for (std::size_t i = 0; i < book.chapters.size(); ++i) {
    if (!write_file(targets[i], book.chapters[i].content)) {
      std::cerr << "Cannot write chapter: " << targets[i].string() << "\n";
      return 1;
    }
  }

  std::cout << result.message << "\n";
  return 0;
}
