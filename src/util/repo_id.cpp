#include <grg/repo_id.hpp>

namespace grg {

const char* transport_name(Transport t) {
    switch (t) {
        case Transport::Ssh:   return "ssh";
        case Transport::Https: return "https";
    }
    return "unknown";
}

Result<Transport> parse_transport(const std::string& name) {
    if (name == "ssh") return Result<Transport>::ok(Transport::Ssh);
    if (name == "https") return Result<Transport>::ok(Transport::Https);
    return GrgError{GrgError::Config,
        "unknown transport '" + name + "'",
        "valid transports are \"ssh\" and \"https\""};
}

Result<RepoId> RepoId::parse(const std::string& s) {
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        return GrgError{GrgError::InvalidArg,
            "invalid repository identifier, expected host/owner/name"};
    }

    RepoId id;
    id.original = s;
    id.host = s.substr(0, slash);
    id.path = s.substr(slash + 1);

    if (id.host.empty() || id.path.empty()) {
        return GrgError{GrgError::InvalidArg,
            "invalid repository identifier, expected host/owner/name"};
    }

    // Keep owner/name only
    auto first = id.path.find('/');
    if (first != std::string::npos) {
        auto second = id.path.find('/', first + 1);
        if (second != std::string::npos) {
            id.path.resize(second);
        }
    }

    return Result<RepoId>::ok(std::move(id));
}

std::string RepoId::clone_target(Transport t) const {
    switch (t) {
        case Transport::Ssh:   return "git@" + host + ":" + path;
        case Transport::Https: return "https://" + host + "/" + path;
    }
    return "";
}

} // namespace grg
