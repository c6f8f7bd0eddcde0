#include <fencelint/core/language.hpp>
#include <algorithm>
#include <cctype>

namespace fencelint {

const char* analyzer_family_name(AnalyzerFamily family) {
    switch (family) {
        case AnalyzerFamily::Flake8:   return "flake8";
        case AnalyzerFamily::Cppcheck: return "cppcheck";
    }
    return "unknown";
}

static std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool Language::matches_tag(const std::string& tag) const {
    if (tag.empty()) return false;
    auto lowered = to_lower(tag);
    return std::find(tags.begin(), tags.end(), lowered) != tags.end();
}

const std::vector<Language>& languages() {
    static const std::vector<Language> table = {
        {LanguageId::Python, "python", {"python", "py", "python3"},
         "#", ".py", AnalyzerFamily::Flake8, false},
        {LanguageId::Cpp, "cpp", {"cpp", "c++", "cxx", "cc", "c"},
         "//", ".cpp", AnalyzerFamily::Cppcheck, true},
    };
    return table;
}

Result<const Language*> find_language(const std::string& name) {
    for (const auto& lang : languages()) {
        if (lang.matches_tag(name)) {
            return Result<const Language*>::ok(&lang);
        }
    }
    return FencelintError{FencelintError::Config,
        "unsupported language '" + name + "'",
        "supported languages: " + language_names()};
}

std::string language_names() {
    std::string out;
    for (const auto& lang : languages()) {
        if (!out.empty()) out += ", ";
        out += lang.name;
    }
    return out;
}

} // namespace fencelint
