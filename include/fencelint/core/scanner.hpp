#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fencelint {

enum class SegmentKind {
    Prose,  // text outside any fence
    Fence,  // an opening or closing delimiter line
    Code    // content between a matched pair of fences
};

// A contiguous run of document lines. Concatenating the `lines` of every
// segment in order reproduces the document.
struct Segment {
    SegmentKind kind = SegmentKind::Prose;
    size_t first_line = 1;            // 1-based document line of lines[0]
    std::vector<std::string> lines;   // raw document text
    std::vector<std::string> code;    // Code: lines with the fence indentation removed
    std::string language;             // Code: lower-cased tag, may be empty
    bool exempt = false;              // Code: tagged nolint

    size_t line_count() const { return lines.size(); }
};

// A parsed fence delimiter line
struct FenceInfo {
    std::string indent;    // leading whitespace, verbatim
    char marker = '`';     // '`' or '~'
    size_t run = 0;        // number of marker characters (>= 3)
    std::string language;  // first info word, lower-cased
    bool exempt = false;   // info string carries "nolint"
    bool has_info = false; // anything but whitespace after the run
};

// Something the scanner tolerated but a stricter caller may want to report
struct FenceIssue {
    size_t line;           // 1-based
    std::string message;
};

struct ScanResult {
    std::vector<Segment> segments;
    std::vector<FenceIssue> issues;
};

// Keyword in a fence info string that exempts the block from linting
constexpr const char* kExemptKeyword = "nolint";

// Parse `line` as a fence delimiter, or nullopt if it is not one.
std::optional<FenceInfo> parse_fence(const std::string& line);

// True if `line` closes a block opened by `open`: same marker, same
// indentation width, a run at least as long, and no info string.
bool closes_fence(const FenceInfo& open, const std::string& line);

// Split document lines into prose, fence and code segments. A fence left
// open at the end of the document turns back into prose from its opening
// line on and is recorded in `issues`.
ScanResult scan(const std::vector<std::string>& lines);

} // namespace fencelint
