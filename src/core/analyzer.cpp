#include <fencelint/core/analyzer.hpp>
#include <fencelint/log.hpp>
#include <fencelint/process.hpp>
#include <fencelint/tempfile.hpp>

#include <algorithm>
#include <filesystem>
#include <optional>

namespace fencelint {

const AnalyzerSpec& analyzer_spec(AnalyzerFamily family) {
    static const AnalyzerSpec flake8 = {
        AnalyzerFamily::Flake8,
        {"flake8"},
        true,
        false,
        {0, 1},
        "--config=",
    };
    static const AnalyzerSpec cppcheck = {
        AnalyzerFamily::Cppcheck,
        {"cppcheck", "--quiet",
         "--enable=warning,style,performance,portability",
         "--suppress=missingIncludeSystem",
         "--template={file}:{line}:{column}: {severity}: {message} [{id}]"},
        false,
        true,
        {0},
        "--suppressions-list=",
    };
    switch (family) {
        case AnalyzerFamily::Flake8:   return flake8;
        case AnalyzerFamily::Cppcheck: return cppcheck;
    }
    return flake8;
}

CommandAnalyzer::CommandAnalyzer(AnalyzerFamily family, AnalyzerSettings settings)
    : spec_(analyzer_spec(family)), settings_(std::move(settings)) {}

std::string CommandAnalyzer::name() const {
    if (!settings_.command.empty()) return settings_.command.front();
    return spec_.default_command.front();
}

std::vector<std::string> CommandAnalyzer::build_command(const std::string& input_path,
                                                        const std::string& display_name) const {
    std::vector<std::string> args = settings_.command.empty()
        ? spec_.default_command : settings_.command;

    if (!settings_.config_path.empty()) {
        args.push_back(spec_.config_flag + settings_.config_path);
    }
    args.insert(args.end(), settings_.extra_args.begin(), settings_.extra_args.end());

    if (input_path.empty()) {
        args.push_back("--stdin-display-name=" + display_name);
        args.push_back("-");
    } else {
        args.push_back(input_path);
    }
    return args;
}

static std::string first_line(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_first_of("\r\n", start);
    return s.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

Result<AnalyzerOutput> CommandAnalyzer::lint(const LintRequest& request) {
    std::string text = request.buffer.text();

    std::optional<TempFile> staged;
    std::optional<std::string> input;
    std::string input_path;

    if (spec_.reads_stdin) {
        input = std::move(text);
    } else {
        auto stem = std::filesystem::path(request.display_name).stem().string();
        auto file = TempFile::create(stem, request.language.extension, text);
        if (file.is_err()) return std::move(file).error();
        staged.emplace(std::move(file).value());
        input_path = staged->path();
    }

    auto args = build_command(input_path, request.display_name);
    log::debug("%s: running %s", request.display_name.c_str(), format_command(args).c_str());

    auto run = run_command(args, "", settings_.timeout_seconds, input);
    if (run.is_err()) {
        auto err = std::move(run).error();
        if (err.code == FencelintError::Timeout) {
            return FencelintError{FencelintError::Timeout,
                "analyzer '" + name() + "' timed out after " +
                std::to_string(settings_.timeout_seconds) + "s"};
        }
        return FencelintError{FencelintError::Tool,
            "analyzer '" + name() + "' could not be started: " + err.message};
    }

    auto& cmd = run.value();
    if (cmd.exit_code == kExecFailedExitCode) {
        return FencelintError{FencelintError::NotFound,
            "analyzer '" + name() + "' not found",
            "install " + name() + " or set [analyzer] command"};
    }

    const auto& ok = spec_.ok_exit_codes;
    if (cmd.exit_code < 0 || std::find(ok.begin(), ok.end(), cmd.exit_code) == ok.end()) {
        std::string detail = first_line(cmd.stderr_str);
        if (detail.empty()) detail = first_line(cmd.stdout_str);
        std::string msg = "analyzer '" + name() + "' failed (exit " +
                          std::to_string(cmd.exit_code) + ")";
        if (!detail.empty()) msg += ": " + detail;
        return FencelintError{FencelintError::Tool, msg};
    }

    AnalyzerOutput out;
    out.exit_code = cmd.exit_code;
    if (spec_.diagnostics_on_stderr) {
        out.diagnostics = std::move(cmd.stderr_str);
        out.errors = std::move(cmd.stdout_str);
    } else {
        out.diagnostics = std::move(cmd.stdout_str);
        out.errors = std::move(cmd.stderr_str);
    }
    return Result<AnalyzerOutput>::ok(std::move(out));
}

} // namespace fencelint
