#pragma once

#include <fencelint/result.hpp>
#include <string>
#include <vector>

namespace fencelint {

// Analyzer families whose output formats the diagnostic mapper understands
enum class AnalyzerFamily {
    Flake8,    // path:line:col: CODE message on stdout
    Cppcheck   // path:line:col: severity: message [id] on stderr
};

const char* analyzer_family_name(AnalyzerFamily family);

enum class LanguageId { Python, Cpp };

// Capability table entry for a content language
struct Language {
    LanguageId id;
    std::string name;               // canonical name used on the command line
    std::vector<std::string> tags;  // fence tags accepted for this language
    std::string comment_prefix;     // line comment marker
    std::string extension;          // staging file extension, with dot
    AnalyzerFamily analyzer;
    // Backslash-newline is spliced before comments are stripped, so a
    // commented line must not end in '\'
    bool splices_backslash_newline = false;

    bool matches_tag(const std::string& tag) const;
};

// All supported languages, in display order
const std::vector<Language>& languages();

// Look up by canonical name or any accepted tag (case-insensitive).
Result<const Language*> find_language(const std::string& name);

// Comma-separated canonical names, for hints and --help
std::string language_names();

} // namespace fencelint
