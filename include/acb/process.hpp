#pragma once

#include <acb/result.hpp>
#include <string>
#include <vector>

namespace acb {

struct CommandResult {
    int exit_code;            // -1 when the child was killed by a signal
    std::string stdout_str;
    std::string stderr_str;
};

// Runs `args[0]` (looked up in PATH) with the remaining arguments in
// `working_dir`, capturing stdout and stderr. A non-zero exit code is not
// an error here; fork/exec failures and timeouts are.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Single-line rendering of an argv for log messages
std::string command_line(const std::vector<std::string>& args);

} // namespace acb
