#include <fencelint/core/document.hpp>
#include <fstream>
#include <sstream>

namespace fencelint {

Document Document::from_text(std::string path, const std::string& text) {
    Document doc;
    doc.path = std::move(path);

    auto first_nl = text.find('\n');
    if (first_nl != std::string::npos && first_nl > 0 && text[first_nl - 1] == '\r') {
        doc.separator = "\r\n";
    }

    size_t start = 0;
    while (start < text.size()) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            doc.lines.push_back(text.substr(start));
            break;
        }
        size_t end = nl;
        if (doc.separator == "\r\n" && end > start && text[end - 1] == '\r') --end;
        doc.lines.push_back(text.substr(start, end - start));
        start = nl + 1;
    }

    doc.trailing_separator = !text.empty() && text.back() == '\n';
    return doc;
}

Result<Document> Document::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return FencelintError{FencelintError::IO,
            "cannot open document: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return FencelintError{FencelintError::IO,
            "error reading document: " + path};
    }
    return Result<Document>::ok(Document::from_text(path, ss.str()));
}

std::string Document::text() const {
    return join_lines(lines, separator, trailing_separator);
}

std::string join_lines(const std::vector<std::string>& lines,
                       const std::string& separator, bool trailing) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += separator;
        out += lines[i];
    }
    if (trailing && !lines.empty()) out += separator;
    return out;
}

} // namespace fencelint
