#include <fencelint/core/report.hpp>
#include <fencelint/log.hpp>

namespace fencelint {

const char* outcome_status_name(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::Clean:   return "clean";
        case OutcomeStatus::Failed:  return "failed";
        case OutcomeStatus::Skipped: return "skipped";
    }
    return "unknown";
}

void TextReporter::document_finished(const DocumentOutcome& outcome) {
    switch (outcome.status) {
    case OutcomeStatus::Skipped:
        return;
    case OutcomeStatus::Clean:
        if (show_passing_) out_ << outcome.path << ": ok\n";
        return;
    case OutcomeStatus::Failed:
        break;
    }

    for (const auto& d : outcome.diagnostics) {
        out_ << d.format() << "\n";
        if (!d.is_document_level()) {
            out_ << "    " << d.source_line << "\n";
        }
    }
    out_.flush();
}

void TextReporter::run_finished(const RunSummary& summary) {
    log::info("checked %zu document(s): %zu clean, %zu failed, %zu skipped, %zu diagnostic(s)",
              summary.checked, summary.clean, summary.failed, summary.skipped,
              summary.diagnostics);
}

} // namespace fencelint
