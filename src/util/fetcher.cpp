#include <grg/fetcher.hpp>
#include <grg/log.hpp>

namespace grg {

std::vector<Transport> default_transports() {
    return {Transport::Ssh, Transport::Https};
}

Fetcher::Fetcher(GitCli& git, std::vector<Transport> transports,
                 std::string temp_root)
    : git_(git), transports_(std::move(transports)),
      temp_root_(std::move(temp_root)) {}

FetchResult Fetcher::fetch(const RepoId& id, const TempWorkspace& workspace,
                           Transport transport) {
    FetchResult result;
    result.transport = transport;
    result.target = id.clone_target(transport);

    auto r = git_.clone_shallow_bare(result.target, workspace.root().string(),
                                     workspace.repo_dir().filename().string());
    if (r.is_err()) {
        result.diagnostics = CommandResult{-1, "", r.error().message};
        return result;
    }

    result.diagnostics = std::move(r).value();
    result.ok = result.diagnostics.exit_code == 0;
    return result;
}

Result<TempWorkspace> Fetcher::fetch_any(const RepoId& id) {
    for (Transport t : transports_) {
        auto ws = TempWorkspace::acquire(temp_root_);
        if (ws.is_err()) return std::move(ws).error();

        FetchResult fr = fetch(id, ws.value(), t);
        if (fr.ok) {
            log::debug("fetched %s via %s", fr.target.c_str(), transport_name(t));
            return ws;
        }

        // ws goes out of scope here, so the next attempt starts clean
        log::debug("error cloning %s via %s (exit code %d)",
                   fr.target.c_str(), transport_name(t), fr.diagnostics.exit_code);
    }

    return GrgError{GrgError::Fetch,
        "could not fetch via either transport; verify access to the repository."};
}

} // namespace grg
