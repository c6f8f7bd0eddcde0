#include <fencelint/tempfile.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

#include <unistd.h>

namespace fencelint {

namespace fs = std::filesystem;

// Keep the stem readable in analyzer output but safe as a file name.
static std::string sanitize_stem(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());
    for (char c : stem) {
        unsigned char uc = static_cast<unsigned char>(c);
        out.push_back(std::isalnum(uc) || c == '-' || c == '_' ? c : '_');
    }
    if (out.empty()) out = "buffer";
    return out;
}

Result<TempFile> TempFile::create(const std::string& stem,
                                  const std::string& extension,
                                  const std::string& contents) {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) dir = "/tmp";

    std::string pattern = (dir / ("fencelint-" + sanitize_stem(stem) + "-XXXXXX")).string();
    pattern += extension;

    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(extension.size()));
    if (fd < 0) {
        return FencelintError{FencelintError::IO,
            "cannot create staging file " + pattern + ": " + strerror(errno)};
    }

    TempFile file(std::string(buf.data()));

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string reason = strerror(errno);
            close(fd);
            return FencelintError{FencelintError::IO,
                "cannot write staging file " + file.path() + ": " + reason};
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        return FencelintError{FencelintError::IO,
            "cannot close staging file " + file.path() + ": " + strerror(errno)};
    }

    return Result<TempFile>::ok(std::move(file));
}

TempFile::TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile() {
    remove();
}

void TempFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    path_.clear();
}

} // namespace fencelint
