#pragma once

#include <grg/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace grg {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

struct CommandSpec {
    std::vector<std::string> args;
    std::string working_dir;
    // Set in the child's environment on top of the inherited one
    std::vector<std::pair<std::string, std::string>> env;
    int timeout_seconds = 0;  // 0 = wait until the child exits
};

// Run an external command, capturing stdout and stderr. stdin is /dev/null.
// Returns error on fork/exec setup failure or timeout; a non-zero exit is
// reported through CommandResult::exit_code.
Result<CommandResult> run_command(const CommandSpec& spec);

// Seam between the resolution logic and real process execution
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual Result<CommandResult> run(const CommandSpec& spec) = 0;
};

class SystemProcessRunner : public ProcessRunner {
public:
    Result<CommandResult> run(const CommandSpec& spec) override;
};

// Locate an executable the way a shell does. A name containing '/' is
// checked as given; otherwise each entry of path_env (':'-separated) is tried.
Result<std::string> find_executable(const std::string& name,
                                    const std::string& path_env);

// Same, using the PATH of the current process
Result<std::string> find_executable(const std::string& name);

// Space-joined argv, for log lines
std::string join_command(const std::vector<std::string>& args);

} // namespace grg
