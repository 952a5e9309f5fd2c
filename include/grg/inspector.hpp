#pragma once

#include <grg/git.hpp>
#include <grg/workspace.hpp>
#include <optional>
#include <string>

namespace grg {

struct CommitInfo {
    std::string short_hash;   // 12 lowercase hex chars
    std::string timestamp;    // YYYYMMDDHHMMSS, UTC
};

// Queries a fetched snapshot. Both queries are best-effort: a failing git
// command means "not available", never an error.
class Inspector {
public:
    explicit Inspector(GitCli& git);

    // Nearest tag reachable from HEAD, if any
    std::optional<std::string> latest_tag(const TempWorkspace& workspace);

    // Tip commit's UTC timestamp and short hash; absent unless both
    // queries succeed and produce well-formed output
    std::optional<CommitInfo> latest_commit(const TempWorkspace& workspace);

private:
    GitCli& git_;
};

} // namespace grg
