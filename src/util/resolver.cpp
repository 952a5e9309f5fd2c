#include <grg/resolver.hpp>
#include <grg/log.hpp>

namespace grg {

Result<ResolvedVersion> resolve_version(Inspector& inspector,
                                        const TempWorkspace& workspace) {
    auto tag = inspector.latest_tag(workspace);
    if (tag && is_usable_tag(*tag)) {
        return Result<ResolvedVersion>::ok(ResolvedVersion{*tag, false});
    }
    if (tag) {
        log::debug("ignoring tag '%s': not v-prefixed", tag->c_str());
    }

    auto commit = inspector.latest_commit(workspace);
    if (commit) {
        return Result<ResolvedVersion>::ok(ResolvedVersion{
            make_pseudo_version(commit->timestamp, commit->short_hash), true});
    }

    return GrgError{GrgError::Metadata,
        "failed obtaining information from cloned repository"};
}

std::string format_require(const std::string& identifier,
                           const std::string& version) {
    return "require " + identifier + " " + version;
}

RequireResolver::RequireResolver(Fetcher& fetcher, Inspector& inspector)
    : fetcher_(fetcher), inspector_(inspector) {}

Result<std::string> RequireResolver::resolve(const std::string& identifier) {
    auto id = RepoId::parse(identifier);
    if (id.is_err()) return std::move(id).error();

    log::debug("resolving %s (%s/%s)", identifier.c_str(),
               id.value().host.c_str(), id.value().path.c_str());

    auto ws = fetcher_.fetch_any(id.value());
    if (ws.is_err()) return std::move(ws).error();

    auto version = resolve_version(inspector_, ws.value());
    if (version.is_err()) return std::move(version).error();

    log::debug("%s -> %s%s", identifier.c_str(), version.value().text.c_str(),
               version.value().is_pseudo ? " (pseudo-version)" : "");
    return Result<std::string>::ok(format_require(identifier, version.value().text));
}

} // namespace grg
