#pragma once

#include <fencelint/core/document.hpp>
#include <fencelint/core/language.hpp>
#include <fencelint/core/scanner.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fencelint {

// Source text handed to the analyzer. Line n of the buffer corresponds to
// line n of the document it was built from.
struct SyntheticBuffer {
    std::vector<std::string> lines;
    std::string separator = "\n";
    bool trailing_separator = false;
    size_t code_lines = 0;   // lines passed through verbatim

    size_t line_count() const { return lines.size(); }
    std::string text() const { return join_lines(lines, separator, trailing_separator); }
};

// Comment out one line for `lang`. Empty lines become the bare prefix.
std::string comment_line(const Language& lang, const std::string& text);

// Build the buffer for `lang`, or nullopt when no non-exempt block of that
// language has any lines (nothing to lint).
std::optional<SyntheticBuffer> reconstruct(const Document& doc,
                                           const ScanResult& scanned,
                                           const Language& lang);

} // namespace fencelint
