#include <grg/git.hpp>
#include <grg/log.hpp>

#include <sstream>

namespace grg {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

static void echo_failure(const CommandResult& cmd) {
    if (!log::enabled(log::Debug)) return;

    log::debug("error executing (exit code %d):", cmd.exit_code);
    for (const std::string* stream : {&cmd.stdout_str, &cmd.stderr_str}) {
        std::istringstream lines(*stream);
        std::string line;
        while (std::getline(lines, line)) {
            log::debug("        %s", line.c_str());
        }
    }
}

GitCli::GitCli(ProcessRunner& runner, std::string executable)
    : runner_(runner), executable_(std::move(executable)) {}

Result<CommandResult> GitCli::run(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  std::vector<std::pair<std::string, std::string>> env) {
    CommandSpec spec;
    spec.args.reserve(args.size() + 1);
    spec.args.push_back(executable_);
    spec.args.insert(spec.args.end(), args.begin(), args.end());
    spec.working_dir = working_dir;
    spec.env = std::move(env);
    spec.timeout_seconds = timeout_seconds_;

    log::debug("executing: %s", join_command(spec.args).c_str());
    auto r = runner_.run(spec);
    if (r.is_err()) {
        log::debug("error executing: %s", r.error().message.c_str());
        return r;
    }

    if (r.value().exit_code != 0) {
        echo_failure(r.value());
    }
    return r;
}

Result<std::string> GitCli::version() {
    auto r = run({"--version"}, "");
    if (r.is_err()) return std::move(r).error();

    if (r.value().exit_code != 0) {
        return GrgError{GrgError::NotFound,
            executable_ + " --version failed: " + trim(r.value().stderr_str),
            "install git"};
    }
    return Result<std::string>::ok(trim(r.value().stdout_str));
}

Result<CommandResult> GitCli::clone_shallow_bare(const std::string& url,
                                                 const std::string& parent_dir,
                                                 const std::string& dest_name) {
    // Never block on a credential prompt
    return run({"clone", "--depth=1", "--bare", url, dest_name}, parent_dir,
               {{"GIT_TERMINAL_PROMPT", "0"}});
}

Result<CommandResult> GitCli::describe_tags(const std::string& repo_dir) {
    return run({"describe", "--tags", "--abbrev=0"}, repo_dir);
}

Result<CommandResult> GitCli::commit_timestamp(const std::string& repo_dir) {
    return run({"log", "-1", "--date=format-local:%Y%m%d%H%M%S", "--format=%cd"},
               repo_dir, {{"TZ", "UTC0"}});
}

Result<CommandResult> GitCli::short_hash(const std::string& repo_dir) {
    return run({"rev-parse", "--short=12", "HEAD"}, repo_dir);
}

} // namespace grg
