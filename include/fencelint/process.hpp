#pragma once

#include <fencelint/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fencelint {

// Result of running an external command
struct CommandResult {
    int exit_code;          // -1 when the child was terminated by a signal
    std::string stdout_str;
    std::string stderr_str;
};

// Exit status execvp failures are reported with.
constexpr int kExecFailedExitCode = 127;

// Run an external command, capturing stdout and stderr.
// When `input` is set it is written to the child's stdin, otherwise stdin is
// /dev/null. Returns IO error on pipe/fork failure and Timeout when the child
// is still running after `timeout_seconds` (the child is killed).
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::optional<std::string>& input = std::nullopt);

// Render argv for log messages, quoting arguments that contain spaces.
std::string format_command(const std::vector<std::string>& args);

} // namespace fencelint
