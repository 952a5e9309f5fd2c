#pragma once

#include <grg/result.hpp>
#include <string>
#include <vector>

namespace grg {

enum class Transport { Ssh, Https };

const char* transport_name(Transport t);
Result<Transport> parse_transport(const std::string& name);

// Repository identifier: host/owner/name[/...]
struct RepoId {
    std::string original;   // as given on the command line
    std::string host;       // e.g., "github.com"
    std::string path;       // owner/name, at most two segments

    // Split at the first '/' into host and path; any path segments beyond
    // the first two are dropped.
    static Result<RepoId> parse(const std::string& s);

    // git@<host>:<path> or https://<host>/<path>
    std::string clone_target(Transport t) const;
};

} // namespace grg
