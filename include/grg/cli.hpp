#pragma once

#include <grg/process.hpp>
#include <grg/result.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace grg {

constexpr const char* kProgramVersion = "1.0.0";

enum ExitCode {
    ExitOk = 0,
    ExitFailures = 1,      // one or more identifiers failed
    ExitUsage = 2,         // bad arguments or no identifiers
    ExitEnvironment = 3    // git missing, unreadable config
};

struct CliOptions {
    bool verbose = false;
    bool help = false;
    bool show_version = false;
    std::string config_path;
    std::vector<std::string> repos;
};

Result<CliOptions> parse_args(int argc, const char* const* argv);

std::string usage_text();

// Load config, locate git, resolve every identifier and write the report
// to `out`. Returns the process exit code.
int run_cli(const CliOptions& opts, std::ostream& out, ProcessRunner& runner);

} // namespace grg
