#pragma once

#include <fencelint/result.hpp>
#include <string>
#include <vector>

namespace fencelint {

// A documentation file held in memory, addressed by 1-based line number.
struct Document {
    std::string path;
    std::vector<std::string> lines;   // without separators
    std::string separator = "\n";     // "\n" or "\r\n", taken from the first line break
    bool trailing_separator = false;  // text ends with a separator

    // Split `text` into lines. A trailing separator does not start a new
    // line, so "a\nb\n" and "a\nb" both have two lines and "" has none.
    static Document from_text(std::string path, const std::string& text);

    static Result<Document> load(const std::string& path);

    size_t line_count() const { return lines.size(); }

    // 1-based; n must be in [1, line_count()]
    const std::string& line(size_t n) const { return lines[n - 1]; }

    // Inverse of from_text
    std::string text() const;
};

// Join lines with `separator`, appending a final one when `trailing` is set.
std::string join_lines(const std::vector<std::string>& lines,
                       const std::string& separator, bool trailing);

} // namespace fencelint
