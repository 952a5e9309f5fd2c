#pragma once

#include <grg/git.hpp>
#include <grg/repo_id.hpp>
#include <grg/result.hpp>
#include <grg/workspace.hpp>
#include <string>
#include <vector>

namespace grg {

// Outcome of a single clone attempt
struct FetchResult {
    bool ok = false;
    Transport transport = Transport::Ssh;
    std::string target;          // clone URL that was tried
    CommandResult diagnostics;   // exit_code -1 when git could not be run
};

// Default attempt order: ssh first, https as the fallback
std::vector<Transport> default_transports();

class Fetcher {
public:
    Fetcher(GitCli& git,
            std::vector<Transport> transports = default_transports(),
            std::string temp_root = "");

    // Shallow bare clone of `id` into <workspace>/repo over one transport.
    // A non-zero git exit is the only failure signal.
    FetchResult fetch(const RepoId& id, const TempWorkspace& workspace,
                      Transport transport);

    // Try each transport in order, each in a freshly acquired workspace.
    // Returns the workspace holding the first successful snapshot.
    Result<TempWorkspace> fetch_any(const RepoId& id);

private:
    GitCli& git_;
    std::vector<Transport> transports_;
    std::string temp_root_;
};

} // namespace grg
