#include <fencelint/core/scanner.hpp>
#include <algorithm>
#include <cctype>

namespace fencelint {

// ---------------------------------------------------------------------------
// Fence lines
// ---------------------------------------------------------------------------

static bool is_blank(const std::string& s, size_t from) {
    for (size_t i = from; i < s.size(); ++i) {
        if (s[i] != ' ' && s[i] != '\t' && s[i] != '\r') return false;
    }
    return true;
}

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r') {
            if (!cur.empty()) words.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

std::optional<FenceInfo> parse_fence(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos) return std::nullopt;

    char marker = line[pos];
    if (marker != '`' && marker != '~') return std::nullopt;

    size_t run_end = pos;
    while (run_end < line.size() && line[run_end] == marker) ++run_end;
    if (run_end - pos < 3) return std::nullopt;

    std::string info = line.substr(run_end);
    // A backtick info string may not contain backticks (that is inline code)
    if (marker == '`' && info.find('`') != std::string::npos) return std::nullopt;

    FenceInfo fence;
    fence.indent = line.substr(0, pos);
    fence.marker = marker;
    fence.run = run_end - pos;
    fence.has_info = !is_blank(line, run_end);

    auto words = split_words(info);
    if (!words.empty()) {
        if (words[0] == kExemptKeyword) {
            fence.exempt = true;
        } else {
            fence.language = words[0];
        }
        for (size_t i = 1; i < words.size(); ++i) {
            if (words[i] == kExemptKeyword) fence.exempt = true;
        }
    }
    return fence;
}

bool closes_fence(const FenceInfo& open, const std::string& line) {
    auto fence = parse_fence(line);
    if (!fence) return false;
    return fence->marker == open.marker &&
           fence->indent.size() == open.indent.size() &&
           !fence->has_info;
}

// ---------------------------------------------------------------------------
// Scanner
// ---------------------------------------------------------------------------

namespace {

enum class State { Outside, Inside };

struct Scanner {
    const std::vector<std::string>& lines;
    ScanResult result;
    Segment current;

    explicit Scanner(const std::vector<std::string>& l) : lines(l) {}

    void flush() {
        if (!current.lines.empty()) {
            result.segments.push_back(std::move(current));
        }
        current = Segment{};
    }

    void start(SegmentKind kind, size_t line_no) {
        flush();
        current.kind = kind;
        current.first_line = line_no;
    }

    void append_prose(size_t line_no) {
        if (current.kind != SegmentKind::Prose || current.lines.empty()) {
            start(SegmentKind::Prose, line_no);
        }
        current.lines.push_back(lines[line_no - 1]);
    }

    void emit_fence(size_t line_no) {
        start(SegmentKind::Fence, line_no);
        current.lines.push_back(lines[line_no - 1]);
        flush();
    }

    // Code segments are pushed even when empty so callers see the block
    void emit_code(const FenceInfo& fence, size_t first, size_t last) {
        flush();
        Segment seg;
        seg.kind = SegmentKind::Code;
        seg.first_line = first;
        seg.language = fence.language;
        seg.exempt = fence.exempt;
        for (size_t n = first; n <= last; ++n) {
            const auto& raw = lines[n - 1];
            seg.lines.push_back(raw);
            if (!fence.indent.empty() &&
                raw.compare(0, fence.indent.size(), fence.indent) == 0) {
                seg.code.push_back(raw.substr(fence.indent.size()));
            } else {
                seg.code.push_back(raw);
            }
        }
        result.segments.push_back(std::move(seg));
    }

    ScanResult run() {
        State state = State::Outside;
        FenceInfo open;
        size_t open_line = 0;

        for (size_t n = 1; n <= lines.size(); ++n) {
            const auto& line = lines[n - 1];
            if (state == State::Outside) {
                auto fence = parse_fence(line);
                if (fence) {
                    open = *fence;
                    open_line = n;
                    state = State::Inside;
                } else {
                    append_prose(n);
                }
                continue;
            }

            if (closes_fence(open, line)) {
                emit_fence(open_line);
                emit_code(open, open_line + 1, n - 1);
                emit_fence(n);
                state = State::Outside;
            }
        }

        if (state == State::Inside) {
            result.issues.push_back(FenceIssue{open_line, "unterminated code fence"});
            for (size_t n = open_line; n <= lines.size(); ++n) {
                append_prose(n);
            }
        }

        flush();
        return std::move(result);
    }
};

} // namespace

ScanResult scan(const std::vector<std::string>& lines) {
    Scanner scanner(lines);
    return scanner.run();
}

} // namespace fencelint
