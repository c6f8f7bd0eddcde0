#include <fencelint/core/reconstructor.hpp>

namespace fencelint {

std::string comment_line(const Language& lang, const std::string& text) {
    size_t end = text.size();
    while (end > 0) {
        char c = text[end - 1];
        bool strip = c == ' ' || c == '\t' || c == '\r' ||
                     (lang.splices_backslash_newline && c == '\\');
        if (!strip) break;
        --end;
    }
    if (end == 0) return lang.comment_prefix;
    return lang.comment_prefix + " " + text.substr(0, end);
}

std::optional<SyntheticBuffer> reconstruct(const Document& doc,
                                           const ScanResult& scanned,
                                           const Language& lang) {
    SyntheticBuffer buf;
    buf.separator = doc.separator;
    buf.trailing_separator = doc.trailing_separator;
    buf.lines.reserve(doc.line_count());

    for (const auto& seg : scanned.segments) {
        switch (seg.kind) {
        case SegmentKind::Prose:
            for (const auto& line : seg.lines) {
                buf.lines.push_back(comment_line(lang, line));
            }
            break;
        case SegmentKind::Fence:
            for (size_t i = 0; i < seg.line_count(); ++i) {
                buf.lines.push_back(lang.comment_prefix);
            }
            break;
        case SegmentKind::Code: {
            bool linted = !seg.exempt && lang.matches_tag(seg.language);
            for (const auto& line : seg.code) {
                buf.lines.push_back(linted ? line : comment_line(lang, line));
            }
            if (linted) buf.code_lines += seg.code.size();
            break;
        }
        }
    }

    if (buf.code_lines == 0) return std::nullopt;
    return buf;
}

} // namespace fencelint
