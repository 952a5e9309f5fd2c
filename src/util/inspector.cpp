#include <grg/inspector.hpp>
#include <grg/log.hpp>
#include <grg/version.hpp>

namespace grg {

Inspector::Inspector(GitCli& git)
    : git_(git) {}

// Trimmed stdout of a successful command, nullopt otherwise
static std::optional<std::string> output_of(const Result<CommandResult>& r) {
    if (r.is_err() || r.value().exit_code != 0) return std::nullopt;
    return trim(r.value().stdout_str);
}

std::optional<std::string> Inspector::latest_tag(const TempWorkspace& workspace) {
    auto tag = output_of(git_.describe_tags(workspace.repo_dir().string()));
    if (!tag || tag->empty()) {
        log::debug("no tag found");
        return std::nullopt;
    }
    return tag;
}

std::optional<CommitInfo> Inspector::latest_commit(const TempWorkspace& workspace) {
    const std::string repo = workspace.repo_dir().string();

    auto ts = output_of(git_.commit_timestamp(repo));
    if (!ts) return std::nullopt;
    if (!is_commit_timestamp(*ts)) {
        log::debug("unexpected commit timestamp '%s'", ts->c_str());
        return std::nullopt;
    }

    auto hash = output_of(git_.short_hash(repo));
    if (!hash) return std::nullopt;
    // --short=12 is a minimum; git lengthens it when ambiguous
    if (hash->size() > 12) hash->resize(12);
    if (!is_short_hash(*hash)) {
        log::debug("unexpected short hash '%s'", hash->c_str());
        return std::nullopt;
    }

    return CommitInfo{std::move(*hash), std::move(*ts)};
}

} // namespace grg
