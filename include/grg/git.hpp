#pragma once

#include <grg/process.hpp>
#include <grg/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace grg {

// Strip leading/trailing whitespace (git output ends with a newline)
std::string trim(const std::string& s);

// Thin wrapper around the git CLI. Every call goes through the
// ProcessRunner; commands are logged at debug level and the captured
// output of a failing command is echoed at debug level.
class GitCli {
public:
    GitCli(ProcessRunner& runner, std::string executable);

    // `git --version`, trimmed
    Result<std::string> version();

    // `git clone --depth=1 --bare <url> <dest_name>` run inside parent_dir
    Result<CommandResult> clone_shallow_bare(const std::string& url,
                                             const std::string& parent_dir,
                                             const std::string& dest_name);

    // `git describe --tags --abbrev=0`
    Result<CommandResult> describe_tags(const std::string& repo_dir);

    // `git log -1 --date=format-local:%Y%m%d%H%M%S --format=%cd` with TZ=UTC0
    Result<CommandResult> commit_timestamp(const std::string& repo_dir);

    // `git rev-parse --short=12 HEAD`
    Result<CommandResult> short_hash(const std::string& repo_dir);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    ProcessRunner& runner_;
    std::string executable_;
    int timeout_seconds_ = 0;

    Result<CommandResult> run(const std::vector<std::string>& args,
                              const std::string& working_dir,
                              std::vector<std::pair<std::string, std::string>> env = {});
};

} // namespace grg
