#include <fencelint/core/diagnostic.hpp>
#include <fencelint/log.hpp>

#include <algorithm>
#include <regex>
#include <sstream>

namespace fencelint {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
        case Severity::Style:   return "style";
        case Severity::Info:    return "info";
    }
    return "unknown";
}

std::string MappedDiagnostic::format() const {
    std::string out = path;
    if (is_document_level()) {
        out += ": ";
        out += message;
        return out;
    }
    out += ":" + std::to_string(line) + ":" + std::to_string(column) + ": ";
    if (!code.empty()) {
        out += code;
        out += ' ';
    }
    out += message;
    return out;
}

// ---------------------------------------------------------------------------
// Extraction rules
// ---------------------------------------------------------------------------

static size_t to_size(const std::string& digits) {
    try {
        return static_cast<size_t>(std::stoul(digits));
    } catch (const std::exception&) {
        return 0;
    }
}

static Severity flake8_severity(const std::string& code) {
    switch (code.empty() ? '\0' : code[0]) {
        case 'E':
        case 'F': return Severity::Error;
        case 'W': return Severity::Warning;
        default:  return Severity::Style;
    }
}

std::optional<Diagnostic> extract_flake8(const std::string& line) {
    // stdin:4:2: E225 missing whitespace around operator
    static const std::regex pattern{
        R"(^(.+?):(\d+):(\d+): ([A-Z]+[0-9]+) (.*?)\r?$)"};
    std::smatch m;
    if (!std::regex_match(line, m, pattern)) return std::nullopt;

    Diagnostic d;
    d.line = to_size(m[2].str());
    d.column = to_size(m[3].str());
    d.code = m[4].str();
    d.message = m[5].str();
    d.severity = flake8_severity(d.code);
    return d;
}

static Severity cppcheck_severity(const std::string& word) {
    if (word == "error") return Severity::Error;
    if (word == "warning") return Severity::Warning;
    if (word == "information") return Severity::Info;
    return Severity::Style;  // style, performance, portability
}

std::optional<Diagnostic> extract_cppcheck(const std::string& line) {
    // /tmp/fencelint-x.cpp:3:9: style: Variable 'x' is assigned a value that is never used. [unreadVariable]
    static const std::regex pattern{
        R"(^(.+?):(\d+):(\d+): (error|warning|style|performance|portability|information): (.*?)(?: \[([A-Za-z0-9_]+)\])?\r?$)"};
    std::smatch m;
    if (!std::regex_match(line, m, pattern)) return std::nullopt;

    Diagnostic d;
    d.line = to_size(m[2].str());
    d.column = to_size(m[3].str());
    d.severity = cppcheck_severity(m[4].str());
    d.message = m[5].str();
    d.code = m[6].matched ? m[6].str() : "";
    return d;
}

ExtractFn extractor_for(AnalyzerFamily family) {
    switch (family) {
        case AnalyzerFamily::Flake8:   return &extract_flake8;
        case AnalyzerFamily::Cppcheck: return &extract_cppcheck;
    }
    return &extract_flake8;
}

// ---------------------------------------------------------------------------
// Parsing and mapping
// ---------------------------------------------------------------------------

std::vector<Diagnostic> parse_diagnostics(const std::string& raw, ExtractFn extract) {
    std::vector<Diagnostic> diags;
    std::istringstream stream(raw);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) continue;
        if (auto d = extract(line)) {
            diags.push_back(std::move(*d));
        }
    }
    return diags;
}

std::vector<MappedDiagnostic> map_diagnostics(const std::vector<Diagnostic>& diags,
                                              const Document& doc) {
    std::vector<MappedDiagnostic> mapped;
    mapped.reserve(diags.size());

    for (const auto& d : diags) {
        if (d.line == 0 || d.line > doc.line_count()) {
            log::debug("%s: dropping diagnostic outside the document (line %zu): %s",
                       doc.path.c_str(), d.line, d.message.c_str());
            continue;
        }
        MappedDiagnostic md;
        md.path = doc.path;
        md.line = d.line;
        md.column = d.column;
        md.code = d.code;
        md.message = d.message;
        md.severity = d.severity;
        md.source_line = doc.line(d.line);
        mapped.push_back(std::move(md));
    }

    std::stable_sort(mapped.begin(), mapped.end(),
                     [](const MappedDiagnostic& a, const MappedDiagnostic& b) {
                         if (a.line != b.line) return a.line < b.line;
                         return a.column < b.column;
                     });
    return mapped;
}

MappedDiagnostic document_diagnostic(const std::string& path, std::string message) {
    MappedDiagnostic md;
    md.path = path;
    md.message = std::move(message);
    md.severity = Severity::Error;
    return md;
}

} // namespace fencelint
