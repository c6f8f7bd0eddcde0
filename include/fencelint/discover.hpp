#pragma once

#include <fencelint/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace fencelint {

struct DiscoverOptions {
    std::vector<std::string> extensions = {".md"};
    // A path is skipped when any of its segments equals one of these
    std::vector<std::string> exclude = {"slides"};
};

// True if some segment of `path` equals an exclude marker.
bool is_excluded(const std::filesystem::path& path,
                 const std::vector<std::string>& exclude);

bool has_extension(const std::filesystem::path& path,
                   const std::vector<std::string>& extensions);

// Documents under `root`, sorted. When `root` is a regular file it is
// returned alone if its extension is accepted. A root that itself contains an
// excluded segment yields nothing.
Result<std::vector<std::string>> find_documents(const std::filesystem::path& root,
                                                const DiscoverOptions& options);

// find_documents over several roots, in argument order. A document reached
// from more than one root is listed once, at its first occurrence.
Result<std::vector<std::string>> find_all_documents(const std::vector<std::string>& roots,
                                                    const DiscoverOptions& options);

} // namespace fencelint
