#include <fencelint/discover.hpp>
#include <fencelint/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace fencelint {

namespace fs = std::filesystem;

bool is_excluded(const fs::path& path, const std::vector<std::string>& exclude) {
    for (const auto& part : path) {
        auto seg = part.string();
        if (std::find(exclude.begin(), exclude.end(), seg) != exclude.end()) {
            return true;
        }
    }
    return false;
}

bool has_extension(const fs::path& path, const std::vector<std::string>& extensions) {
    auto ext = path.extension().string();
    if (ext.empty()) return false;
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

Result<std::vector<std::string>> find_documents(const fs::path& root,
                                                const DiscoverOptions& options) {
    std::error_code ec;
    if (fs::exists(root, ec) && is_excluded(root.lexically_normal(), options.exclude)) {
        log::debug("%s: excluded, ignoring", root.string().c_str());
        return Result<std::vector<std::string>>::ok({});
    }

    if (fs::is_regular_file(root, ec)) {
        std::vector<std::string> single;
        if (has_extension(root, options.extensions)) {
            single.push_back(root.string());
        } else {
            log::debug("%s: extension not accepted, ignoring", root.string().c_str());
        }
        return Result<std::vector<std::string>>::ok(std::move(single));
    }

    if (!fs::is_directory(root, ec)) {
        return FencelintError{FencelintError::IO,
            "path does not exist: " + root.string(),
            "pass a directory or a documentation file"};
    }

    std::vector<std::string> results;
    auto it = fs::recursive_directory_iterator(root, ec);
    if (ec) {
        return FencelintError{FencelintError::IO,
            "cannot read directory " + root.string() + ": " + ec.message()};
    }

    std::error_code iter_ec;
    for (; it != fs::recursive_directory_iterator(); it.increment(iter_ec)) {
        if (iter_ec) break;
        const auto& entry = *it;

        // Get path relative to root
        auto rel = fs::relative(entry.path(), root, ec);
        if (ec) continue;

        if (is_excluded(rel, options.exclude)) {
            if (entry.is_directory(ec)) {
                log::trace("skipping excluded directory %s", entry.path().string().c_str());
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(ec)) continue;
        if (!has_extension(entry.path(), options.extensions)) continue;

        results.push_back(entry.path().string());
    }
    if (iter_ec) {
        return FencelintError{FencelintError::IO,
            "error iterating " + root.string() + ": " + iter_ec.message()};
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

Result<std::vector<std::string>> find_all_documents(const std::vector<std::string>& roots,
                                                    const DiscoverOptions& options) {
    std::vector<std::string> docs;
    std::unordered_set<std::string> seen;
    for (const auto& root : roots) {
        auto found = find_documents(root, options);
        FENCELINT_TRY(found);
        for (auto& doc : found.value()) {
            std::error_code ec;
            auto key = fs::weakly_canonical(doc, ec);
            if (ec) key = fs::path(doc).lexically_normal();
            if (!seen.insert(key.string()).second) {
                log::debug("%s: already listed, skipping", doc.c_str());
                continue;
            }
            docs.push_back(std::move(doc));
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(docs));
}

} // namespace fencelint
