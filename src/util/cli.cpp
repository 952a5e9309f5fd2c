#include <grg/cli.hpp>
#include <grg/batch.hpp>
#include <grg/config.hpp>
#include <grg/fetcher.hpp>
#include <grg/git.hpp>
#include <grg/inspector.hpp>
#include <grg/log.hpp>
#include <grg/resolver.hpp>

#include <filesystem>
#include <optional>

#include <unistd.h>

namespace fs = std::filesystem;

namespace grg {

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

Result<CliOptions> parse_args(int argc, const char* const* argv) {
    CliOptions opts;
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (positional_only || arg.empty() || arg[0] != '-' || arg == "-") {
            opts.repos.push_back(arg);
            continue;
        }

        if (arg == "--") {
            positional_only = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return GrgError{GrgError::InvalidArg,
                    "option '" + arg + "' requires a file argument"};
            }
            opts.config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            opts.config_path = arg.substr(9);
        } else {
            return GrgError{GrgError::InvalidArg,
                "unknown option '" + arg + "'",
                "run 'grg --help' for usage"};
        }
    }

    return Result<CliOptions>::ok(std::move(opts));
}

std::string usage_text() {
    return
        "NAME:\n"
        "   grg - Obtains a require statement based on a git repository\n"
        "\n"
        "USAGE:\n"
        "   grg [options] repo-url [repo-url [repo-url [...]]]\n"
        "\n"
        "OPTIONS:\n"
        "   -v, --verbose          Prints out every command and result\n"
        "   -c, --config <file>    Read configuration from <file>\n"
        "   -h, --help             Show this help\n"
        "       --version          Print the version\n";
}

// ---------------------------------------------------------------------------
// Driver
// ---------------------------------------------------------------------------

static Result<Config> load_config(const CliOptions& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    std::optional<Config> file;
    if (!opts.config_path.empty()) {
        auto f = Config::load(opts.config_path);
        if (f.is_err()) return std::move(f).error();
        file = std::move(f).value();
    }

    Config cfg = Config::effective(global, file);
    if (opts.verbose) {
        cfg.log_level = log::Debug;
        cfg.log_level_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

static void apply_log_settings(const Config& cfg) {
    log::set_level(cfg.log_level);
    switch (cfg.color) {
        case ColorMode::Always: log::set_color_enabled(true); break;
        case ColorMode::Never:  log::set_color_enabled(false); break;
        case ColorMode::Auto:   log::set_color_enabled(isatty(fileno(stderr)) != 0); break;
    }
}

int run_cli(const CliOptions& opts, std::ostream& out, ProcessRunner& runner) {
    if (opts.help) {
        out << usage_text();
        return ExitOk;
    }
    if (opts.show_version) {
        out << "grg version " << kProgramVersion << "\n";
        return ExitOk;
    }
    if (opts.repos.empty()) {
        out << usage_text();
        return ExitUsage;
    }

    auto cfg = load_config(opts);
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return ExitEnvironment;
    }
    apply_log_settings(cfg.value());

    auto git_path = find_executable(cfg.value().git_executable);
    if (git_path.is_err()) {
        log::error("%s", git_path.error().message.c_str());
        return ExitEnvironment;
    }

    GitCli git(runner, git_path.value());
    git.set_timeout(cfg.value().git_timeout);

    auto git_version = git.version();
    if (git_version.is_err()) {
        log::error("%s", git_version.error().format().c_str());
        return ExitEnvironment;
    }
    log::debug("using %s (%s)", git_path.value().c_str(), git_version.value().c_str());

    Fetcher fetcher(git, cfg.value().transports, cfg.value().temp_dir);
    Inspector inspector(git);
    RequireResolver resolver(fetcher, inspector);

    auto outcomes = resolve_all(opts.repos, [&](const std::string& id) {
        return resolver.resolve(id);
    });
    render_report(outcomes, out);
    out.flush();

    if (has_failures(outcomes)) {
        log::error("one or more repositories could not be processed");
        return ExitFailures;
    }
    return ExitOk;
}

} // namespace grg
