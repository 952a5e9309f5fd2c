#include <catch2/catch.hpp>
#include <grg/cli.hpp>
#include <grg/log.hpp>

#include "fake_runner.hpp"
#include "temp_dir.hpp"

#include <cstdlib>
#include <sstream>

using namespace grg;
namespace fs = std::filesystem;

static Result<CliOptions> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "grg");
    return parse_args(static_cast<int>(args.size()), args.data());
}

// ===== parse_args() =====

TEST_CASE("positional identifiers in order", "[cli]") {
    auto r = parse({"github.com/a/b", "gitlab.com/c/d"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().repos == std::vector<std::string>{"github.com/a/b", "gitlab.com/c/d"});
    REQUIRE_FALSE(r.value().verbose);
}

TEST_CASE("flags", "[cli]") {
    auto r = parse({"-v", "github.com/a/b", "--config", "/etc/grg.toml"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().verbose);
    REQUIRE(r.value().config_path == "/etc/grg.toml");
    REQUIRE(r.value().repos == std::vector<std::string>{"github.com/a/b"});

    REQUIRE(parse({"--verbose"}).value().verbose);
    REQUIRE(parse({"--config=x.toml"}).value().config_path == "x.toml");
    REQUIRE(parse({"-c", "y.toml"}).value().config_path == "y.toml");
    REQUIRE(parse({"-h"}).value().help);
    REQUIRE(parse({"--help"}).value().help);
    REQUIRE(parse({"--version"}).value().show_version);
}

TEST_CASE("double dash ends option parsing", "[cli]") {
    auto r = parse({"--", "-v"});
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().verbose);
    REQUIRE(r.value().repos == std::vector<std::string>{"-v"});
}

TEST_CASE("bad arguments", "[cli]") {
    auto unknown = parse({"--frobnicate"});
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == GrgError::InvalidArg);

    auto missing = parse({"--config"});
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == GrgError::InvalidArg);
}

// ===== run_cli() =====

struct CliFixture {
    TempDir td{"grg_cli_test_"};
    FakeProcessRunner runner;
    std::ostringstream out;
    std::string saved_home;
    bool had_home = false;

    CliFixture() {
        // Keep the developer's ~/.grg/config.toml out of the way
        if (const char* home = std::getenv("HOME")) {
            saved_home = home;
            had_home = true;
        }
        setenv("HOME", td.path.c_str(), 1);
        fs::create_directories(td.path / "tmp");
    }

    ~CliFixture() {
        if (had_home) setenv("HOME", saved_home.c_str(), 1);
        else unsetenv("HOME");
        log::set_level(log::Info);
        log::set_color_enabled(false);
    }

    // Config that points git at an existing executable; the runner is fake
    std::string write_config() {
        td.write_file("grg.toml",
            "[git]\nexecutable = \"/bin/sh\"\n"
            "[workspace]\ntemp-dir = \"" + (td.path / "tmp").string() + "\"\n"
            "[log]\ncolor = \"never\"\n");
        return (td.path / "grg.toml").string();
    }

    int run(const CliOptions& opts) {
        return run_cli(opts, out, runner);
    }
};

TEST_CASE_METHOD(CliFixture, "help and version exit 0", "[cli]") {
    CliOptions help;
    help.help = true;
    REQUIRE(run(help) == ExitOk);
    REQUIRE(out.str().find("USAGE:") != std::string::npos);

    out.str("");
    CliOptions version;
    version.show_version = true;
    REQUIRE(run(version) == ExitOk);
    REQUIRE(out.str() == std::string("grg version ") + kProgramVersion + "\n");
    REQUIRE(runner.calls.empty());
}

TEST_CASE_METHOD(CliFixture, "no identifiers shows usage", "[cli]") {
    CliOptions opts;
    REQUIRE(run(opts) == ExitUsage);
    REQUIRE(out.str() == usage_text());
    REQUIRE(runner.calls.empty());
}

TEST_CASE_METHOD(CliFixture, "unreadable config is an environment error", "[cli]") {
    CliOptions opts;
    opts.repos = {"github.com/acme/widget"};
    opts.config_path = (td.path / "missing.toml").string();
    REQUIRE(run(opts) == ExitEnvironment);
    REQUIRE(out.str().empty());
}

TEST_CASE_METHOD(CliFixture, "missing git is an environment error", "[cli]") {
    CliOptions opts;
    opts.repos = {"github.com/acme/widget"};
    td.write_file("grg.toml", "[git]\nexecutable = \"/nonexistent/bin/git\"\n");
    opts.config_path = (td.path / "grg.toml").string();

    REQUIRE(run(opts) == ExitEnvironment);
    REQUIRE(out.str().empty());
    REQUIRE(runner.calls.empty());
}

TEST_CASE_METHOD(CliFixture, "all identifiers resolve", "[cli]") {
    runner.reply("describe", 0, "v1.0.0\n");

    CliOptions opts;
    opts.repos = {"github.com/acme/widget"};
    opts.config_path = write_config();

    REQUIRE(run(opts) == ExitOk);
    REQUIRE(out.str() == "\nrequire github.com/acme/widget v1.0.0\n");
    REQUIRE(runner.calls_to("--version").size() == 1);
    REQUIRE(runner.calls[0].args[0] == "/bin/sh");
}

TEST_CASE_METHOD(CliFixture, "one failure makes the whole run fail", "[cli]") {
    // First identifier: both clones fail. Second: ssh clone succeeds.
    runner.reply("clone", 128);
    runner.reply("clone", 128);
    runner.reply("clone", 0);
    runner.reply("describe", 128);
    runner.reply("log", 0, "20240102030405\n");
    runner.reply("rev-parse", 0, "0123456789ab\n");

    CliOptions opts;
    opts.repos = {"github.com/acme/private", "github.com/acme/widget"};
    opts.config_path = write_config();

    REQUIRE(run(opts) == ExitFailures);
    REQUIRE(out.str() ==
            "\n"
            "The following errors were found:\n"
            "  github.com/acme/private: could not fetch via either transport; verify access to the repository.\n"
            "\n"
            "require github.com/acme/widget v0.0.0-20240102030405-0123456789ab\n");

    // Every workspace was removed
    REQUIRE(fs::is_empty(td.path / "tmp"));
}

TEST_CASE_METHOD(CliFixture, "config timeout and transports reach git", "[cli]") {
    runner.reply("describe", 0, "v3.1.4\n");

    CliOptions opts;
    opts.repos = {"github.com/acme/widget"};
    td.write_file("grg.toml",
        "[git]\nexecutable = \"/bin/sh\"\ntimeout = 42\n"
        "[fetch]\ntransports = [\"https\"]\n"
        "[log]\ncolor = \"never\"\n");
    opts.config_path = (td.path / "grg.toml").string();

    REQUIRE(run(opts) == ExitOk);
    auto clones = runner.calls_to("clone");
    REQUIRE(clones.size() == 1);
    REQUIRE(clones[0].args.at(4) == "https://github.com/acme/widget");
    REQUIRE(clones[0].timeout_seconds == 42);
}

TEST_CASE_METHOD(CliFixture, "verbose lowers the log level", "[cli]") {
    CliOptions opts;
    opts.repos = {"github.com/acme/widget"};
    opts.config_path = write_config();
    opts.verbose = true;
    runner.reply("describe", 0, "v1.0.0\n");

    REQUIRE(run(opts) == ExitOk);
    REQUIRE(log::get_level() == log::Debug);
}
