#pragma once

#include <fencelint/core/document.hpp>
#include <fencelint/core/language.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fencelint {

enum class Severity { Error, Warning, Style, Info };

const char* severity_name(Severity s);

// One analyzer finding in synthetic buffer coordinates
struct Diagnostic {
    size_t line = 0;
    size_t column = 0;
    std::string code;      // e.g. "E225" or "unusedVariable"; may be empty
    std::string message;
    Severity severity = Severity::Error;
};

// A finding attached to the document it came from. Line 0 marks a
// document-level diagnostic (analyzer failure, unreadable file).
struct MappedDiagnostic {
    std::string path;
    size_t line = 0;
    size_t column = 0;
    std::string code;
    std::string message;
    Severity severity = Severity::Error;
    std::string source_line;   // document.line(line), empty when line == 0

    bool is_document_level() const { return line == 0; }

    // "path:line:col: CODE message", or "path: message" at document level
    std::string format() const;
};

// Extraction rule: one analyzer output line -> a diagnostic, or nullopt
// when the line is not a diagnostic.
using ExtractFn = std::optional<Diagnostic> (*)(const std::string& line);

std::optional<Diagnostic> extract_flake8(const std::string& line);
std::optional<Diagnostic> extract_cppcheck(const std::string& line);

// Rule table lookup
ExtractFn extractor_for(AnalyzerFamily family);

// Apply `extract` to every line of `raw`; unparseable lines are dropped.
std::vector<Diagnostic> parse_diagnostics(const std::string& raw, ExtractFn extract);

// Attach diagnostics to `doc`. Buffer and document lines coincide, so only
// the path and source text are filled in. Diagnostics outside the document's
// line range are dropped. The result is ordered by line, then column.
std::vector<MappedDiagnostic> map_diagnostics(const std::vector<Diagnostic>& diags,
                                              const Document& doc);

// A diagnostic about `path` as a whole
MappedDiagnostic document_diagnostic(const std::string& path, std::string message);

} // namespace fencelint
