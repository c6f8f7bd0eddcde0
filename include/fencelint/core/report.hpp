#pragma once

#include <fencelint/core/diagnostic.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace fencelint {

enum class OutcomeStatus {
    Clean,    // linted, no findings
    Failed,   // at least one mapped diagnostic
    Skipped   // no applicable content
};

const char* outcome_status_name(OutcomeStatus s);

struct DocumentOutcome {
    std::string path;
    OutcomeStatus status = OutcomeStatus::Clean;
    std::vector<MappedDiagnostic> diagnostics;
};

struct RunSummary {
    size_t checked = 0;
    size_t clean = 0;
    size_t failed = 0;
    size_t skipped = 0;
    size_t diagnostics = 0;

    bool has_failures() const { return failed > 0; }
};

// Receives outcomes as documents finish. Calls are serialized by the runner.
class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual void document_finished(const DocumentOutcome& outcome) = 0;
    virtual void run_finished(const RunSummary& summary) { (void)summary; }
};

// Plain text report:
//   path:line:col: CODE message
//       offending source line
class TextReporter : public ReportSink {
public:
    explicit TextReporter(std::ostream& out, bool show_passing = false)
        : out_(out), show_passing_(show_passing) {}

    void document_finished(const DocumentOutcome& outcome) override;
    void run_finished(const RunSummary& summary) override;

private:
    std::ostream& out_;
    bool show_passing_;
};

} // namespace fencelint
