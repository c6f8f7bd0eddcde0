#pragma once

#include <fencelint/core/analyzer.hpp>
#include <fencelint/core/document.hpp>
#include <fencelint/core/language.hpp>
#include <fencelint/core/report.hpp>
#include <functional>
#include <string>
#include <vector>

namespace fencelint {

struct RunOptions {
    size_t jobs = 1;             // worker threads, one document at a time each
    bool strict_fences = false;  // unterminated fences fail the document
};

// Drives scan -> reconstruct -> analyze -> map for each document and
// aggregates the outcome. Documents are independent; with jobs > 1 they are
// processed concurrently and reported in completion order.
class Runner {
public:
    Runner(const Language& language, Analyzer& analyzer, ReportSink& sink,
           RunOptions options = {});

    // Process one document. Does not report.
    DocumentOutcome check(const Document& doc);

    // Load and process each path. An unreadable path is a failed document.
    RunSummary run(const std::vector<std::string>& paths);

    // Process documents already in memory.
    RunSummary run_documents(const std::vector<Document>& docs);

private:
    RunSummary run_each(const std::vector<std::string>& paths,
                        const std::function<DocumentOutcome(size_t)>& process);

    const Language& language_;
    Analyzer& analyzer_;
    ReportSink& sink_;
    RunOptions options_;
};

} // namespace fencelint
