#pragma once

#include <fencelint/result.hpp>
#include <string>

namespace fencelint {

// A uniquely named file in the system temp directory, removed when the
// owning object is destroyed. Names come from mkstemps, so concurrent
// invocations never share a staging file.
class TempFile {
public:
    // Create `<tmp>/fencelint-<stem>-XXXXXX<extension>` holding `contents`.
    static Result<TempFile> create(const std::string& stem,
                                   const std::string& extension,
                                   const std::string& contents);

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    ~TempFile();

    const std::string& path() const { return path_; }

private:
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    void remove();

    std::string path_;
};

} // namespace fencelint
