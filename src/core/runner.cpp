#include <fencelint/core/runner.hpp>
#include <fencelint/core/reconstructor.hpp>
#include <fencelint/core/scanner.hpp>
#include <fencelint/log.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace fencelint {

static std::string trim_trailing(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

Runner::Runner(const Language& language, Analyzer& analyzer, ReportSink& sink,
               RunOptions options)
    : language_(language), analyzer_(analyzer), sink_(sink), options_(options) {
    if (options_.jobs == 0) options_.jobs = 1;
}

DocumentOutcome Runner::check(const Document& doc) {
    DocumentOutcome outcome;
    outcome.path = doc.path;

    auto scanned = scan(doc.lines);
    for (const auto& issue : scanned.issues) {
        log::warn("%s:%zu: %s, treating the rest of the document as prose",
                  doc.path.c_str(), issue.line, issue.message.c_str());
        if (options_.strict_fences) {
            MappedDiagnostic md;
            md.path = doc.path;
            md.line = issue.line;
            md.column = 1;
            md.message = issue.message;
            md.source_line = doc.line(issue.line);
            outcome.diagnostics.push_back(std::move(md));
        }
    }

    auto buffer = reconstruct(doc, scanned, language_);
    if (!buffer) {
        log::debug("%s: no %s code to lint", doc.path.c_str(), language_.name.c_str());
        outcome.status = outcome.diagnostics.empty()
            ? OutcomeStatus::Skipped : OutcomeStatus::Failed;
        log::debug("%s: %s", doc.path.c_str(), outcome_status_name(outcome.status));
        return outcome;
    }

    log::trace("%s: %zu of %zu lines are %s code", doc.path.c_str(),
               buffer->code_lines, buffer->line_count(), language_.name.c_str());

    auto result = analyzer_.lint(LintRequest{language_, *buffer, doc.path});
    if (result.is_err()) {
        outcome.diagnostics.push_back(document_diagnostic(doc.path, result.error().message));
    } else {
        const auto& output = result.value();
        auto extra = trim_trailing(output.errors);
        if (!extra.empty()) {
            log::debug("%s: %s also wrote: %s", doc.path.c_str(),
                       analyzer_.name().c_str(), extra.c_str());
        }
        auto diags = parse_diagnostics(output.diagnostics,
                                       extractor_for(analyzer_.family()));
        auto mapped = map_diagnostics(diags, doc);
        outcome.diagnostics.insert(outcome.diagnostics.end(),
                                   std::make_move_iterator(mapped.begin()),
                                   std::make_move_iterator(mapped.end()));
    }

    std::stable_sort(outcome.diagnostics.begin(), outcome.diagnostics.end(),
                     [](const MappedDiagnostic& a, const MappedDiagnostic& b) {
                         if (a.line != b.line) return a.line < b.line;
                         return a.column < b.column;
                     });

    for (const auto& d : outcome.diagnostics) {
        if (d.is_document_level()) continue;
        log::debug("%s:%zu:%zu: %s %s", d.path.c_str(), d.line, d.column,
                   severity_name(d.severity), d.code.c_str());
    }

    outcome.status = outcome.diagnostics.empty()
        ? OutcomeStatus::Clean : OutcomeStatus::Failed;
    log::debug("%s: %s", doc.path.c_str(), outcome_status_name(outcome.status));
    return outcome;
}

RunSummary Runner::run(const std::vector<std::string>& paths) {
    return run_each(paths, [&](size_t i) {
        auto doc = Document::load(paths[i]);
        if (doc.is_err()) {
            DocumentOutcome outcome;
            outcome.path = paths[i];
            outcome.status = OutcomeStatus::Failed;
            outcome.diagnostics.push_back(document_diagnostic(paths[i], doc.error().message));
            return outcome;
        }
        return check(doc.value());
    });
}

RunSummary Runner::run_documents(const std::vector<Document>& docs) {
    std::vector<std::string> paths;
    paths.reserve(docs.size());
    for (const auto& doc : docs) paths.push_back(doc.path);
    return run_each(paths, [&](size_t i) { return check(docs[i]); });
}

RunSummary Runner::run_each(const std::vector<std::string>& paths,
                            const std::function<DocumentOutcome(size_t)>& process) {
    const size_t count = paths.size();
    RunSummary summary;
    std::mutex report_mutex;
    std::atomic<size_t> next{0};

    auto deliver = [&](const DocumentOutcome& outcome) {
        std::lock_guard<std::mutex> lock(report_mutex);
        ++summary.checked;
        switch (outcome.status) {
            case OutcomeStatus::Clean:   ++summary.clean; break;
            case OutcomeStatus::Failed:  ++summary.failed; break;
            case OutcomeStatus::Skipped: ++summary.skipped; break;
        }
        summary.diagnostics += outcome.diagnostics.size();
        sink_.document_finished(outcome);
    };

    auto worker = [&] {
        for (size_t i = next++; i < count; i = next++) {
            DocumentOutcome outcome;
            try {
                outcome = process(i);
            } catch (const std::exception& e) {
                // Keep the pool alive; the document still counts as failed
                log::error("%s: internal error: %s", paths[i].c_str(), e.what());
                outcome = DocumentOutcome{};
                outcome.path = paths[i];
                outcome.status = OutcomeStatus::Failed;
                outcome.diagnostics.push_back(
                    document_diagnostic(paths[i], std::string("internal error: ") + e.what()));
            }
            deliver(outcome);
        }
    };

    size_t threads = std::min(options_.jobs, count);
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
        for (auto& th : pool) th.join();
    }

    sink_.run_finished(summary);
    return summary;
}

} // namespace fencelint
