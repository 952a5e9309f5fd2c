#pragma once

#include <grg/log.hpp>
#include <grg/repo_id.hpp>
#include <grg/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace grg {

enum class ColorMode { Auto, Always, Never };

// Layered configuration: global file, then --config file, then CLI flags.
// Later layers override only the fields they set.
struct Config {
    std::string git_executable = "git";
    int git_timeout = 0;                      // seconds, 0 = none
    std::vector<Transport> transports{Transport::Ssh, Transport::Https};
    std::string temp_dir;                     // "" = system temp dir
    log::Level log_level = log::Info;
    ColorMode color = ColorMode::Auto;

    // Track which fields were explicitly set (for merge)
    bool git_executable_set = false;
    bool git_timeout_set = false;
    bool transports_set = false;
    bool temp_dir_set = false;
    bool log_level_set = false;
    bool color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> explicit file
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& file);
};

// Discover the global config file path: ~/.grg/config.toml
std::string global_config_path();

} // namespace grg
