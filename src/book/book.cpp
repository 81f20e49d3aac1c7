#include <mdkatex/book/book.h>

#include <mdkatex/core/errors.h>

#include <map>

namespace mdkatex::book {

std::vector<std::filesystem::path> chapter_output_paths(
    const std::filesystem::path& out_dir, const std::vector<std::filesystem::path>& inputs) {
    std::vector<std::filesystem::path> targets;
    targets.reserve(inputs.size());
    // File name -> first input claiming it.
    std::map<std::filesystem::path, const std::filesystem::path*> claimed;
    for (const auto& input : inputs) {
        const std::filesystem::path name = input.filename();
        if (name.empty()) {
            throw core::ConfigError("chapter '" + input.string() + "' has no file name");
        }
        const auto [it, fresh] = claimed.emplace(name, &input);
        if (!fresh) {
            throw core::ConfigError("chapters '" + it->second->string() + "' and '" +
                                    input.string() + "' would both be written to '" +
                                    (out_dir / name).string() + "'");
        }
        targets.push_back(out_dir / name);
    }
    return targets;
}

}  // namespace mdkatex::book
