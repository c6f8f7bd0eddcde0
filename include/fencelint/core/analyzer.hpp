#pragma once

#include <fencelint/core/language.hpp>
#include <fencelint/core/reconstructor.hpp>
#include <fencelint/result.hpp>
#include <string>
#include <vector>

namespace fencelint {

struct LintRequest {
    const Language& language;
    const SyntheticBuffer& buffer;
    std::string display_name;   // document path, for analyzers that echo a file name
};

struct AnalyzerOutput {
    int exit_code = 0;
    std::string diagnostics;    // the stream the family writes findings to
    std::string errors;         // the other stream, for failure messages
};

// The external static analyzer. Implementations must be safe to call from
// several worker threads at once.
class Analyzer {
public:
    virtual ~Analyzer() = default;

    // Which extraction rule applies to the output
    virtual AnalyzerFamily family() const = 0;

    // Human-readable name for messages
    virtual std::string name() const = 0;

    // Run on one buffer. Errors mean the analyzer could not produce a
    // verdict (not found, crashed, timed out); findings are not errors.
    virtual Result<AnalyzerOutput> lint(const LintRequest& request) = 0;
};

// Capability table entry for an analyzer family
struct AnalyzerSpec {
    AnalyzerFamily family;
    std::vector<std::string> default_command;
    bool reads_stdin;               // accepts the buffer on stdin
    bool diagnostics_on_stderr;
    std::vector<int> ok_exit_codes; // anything else is a tool failure
    std::string config_flag;        // prefix joined with the config path
};

const AnalyzerSpec& analyzer_spec(AnalyzerFamily family);

struct AnalyzerSettings {
    std::vector<std::string> command;     // replaces the family default when set
    std::string config_path;              // analyzer's own configuration file
    std::vector<std::string> extra_args;
    int timeout_seconds = 60;
};

// Runs the family's command line, piping the buffer to stdin when the
// family supports it and staging it in a unique temp file otherwise.
class CommandAnalyzer : public Analyzer {
public:
    CommandAnalyzer(AnalyzerFamily family, AnalyzerSettings settings);

    AnalyzerFamily family() const override { return spec_.family; }
    std::string name() const override;
    Result<AnalyzerOutput> lint(const LintRequest& request) override;

    // argv for one invocation; `input_path` is empty when reading stdin
    std::vector<std::string> build_command(const std::string& input_path,
                                           const std::string& display_name) const;

private:
    const AnalyzerSpec& spec_;
    AnalyzerSettings settings_;
};

} // namespace fencelint
