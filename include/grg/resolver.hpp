#pragma once

#include <grg/fetcher.hpp>
#include <grg/inspector.hpp>
#include <grg/result.hpp>
#include <grg/version.hpp>
#include <grg/workspace.hpp>
#include <string>

namespace grg {

// Pick the version for a fetched snapshot:
//   1. latest tag, when it starts with "v" (passed through verbatim)
//   2. otherwise a pseudo-version from the tip commit
//   3. otherwise a Metadata error
Result<ResolvedVersion> resolve_version(Inspector& inspector,
                                        const TempWorkspace& workspace);

// "require <identifier> <version>"
std::string format_require(const std::string& identifier,
                           const std::string& version);

// Full per-identifier pipeline: parse, fetch, inspect, format.
class RequireResolver {
public:
    RequireResolver(Fetcher& fetcher, Inspector& inspector);

    // Returns the require line, or the error that stopped resolution.
    // The snapshot workspace is removed before returning.
    Result<std::string> resolve(const std::string& identifier);

private:
    Fetcher& fetcher_;
    Inspector& inspector_;
};

} // namespace grg
