#include <grg/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <cstdlib>

namespace grg {

static Result<ColorMode> parse_color(const std::string& s) {
    if (s == "auto") return Result<ColorMode>::ok(ColorMode::Auto);
    if (s == "always") return Result<ColorMode>::ok(ColorMode::Always);
    if (s == "never") return Result<ColorMode>::ok(ColorMode::Never);
    return GrgError{GrgError::Config,
        "invalid [log] color '" + s + "'",
        "use \"auto\", \"always\" or \"never\""};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GrgError{GrgError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [git] section
    if (auto git = doc["git"].as_table()) {
        if (auto v = (*git)["executable"].value<std::string>()) {
            if (v->empty()) {
                return GrgError{GrgError::Config, "[git] executable must not be empty"};
            }
            cfg.git_executable = *v;
            cfg.git_executable_set = true;
        }
        if (auto v = (*git)["timeout"].value<int64_t>()) {
            if (*v < 0 || *v > 86400) {
                return GrgError{GrgError::Config,
                    "[git] timeout must be between 0 and 86400 seconds"};
            }
            cfg.git_timeout = static_cast<int>(*v);
            cfg.git_timeout_set = true;
        }
    }

    // [fetch] section
    if (auto fetch = doc["fetch"].as_table()) {
        if (auto arr = (*fetch)["transports"].as_array()) {
            std::vector<Transport> transports;
            for (const auto& el : *arr) {
                auto name = el.value<std::string>();
                if (!name) {
                    return GrgError{GrgError::Config,
                        "[fetch] transports must be a list of strings"};
                }
                auto t = parse_transport(*name);
                if (t.is_err()) return std::move(t).error();
                for (Transport seen : transports) {
                    if (seen == t.value()) {
                        return GrgError{GrgError::Config,
                            "duplicate transport '" + *name + "' in [fetch] transports"};
                    }
                }
                transports.push_back(t.value());
            }
            if (transports.empty()) {
                return GrgError{GrgError::Config,
                    "[fetch] transports must not be empty"};
            }
            cfg.transports = std::move(transports);
            cfg.transports_set = true;
        }
    }

    // [workspace] section
    if (auto ws = doc["workspace"].as_table()) {
        if (auto v = (*ws)["temp-dir"].value<std::string>()) {
            cfg.temp_dir = *v;
            cfg.temp_dir_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return GrgError{GrgError::Config,
                    "invalid [log] level '" + *v + "'",
                    "use trace, debug, info, warn or error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<std::string>()) {
            auto c = parse_color(*v);
            if (c.is_err()) return std::move(c).error();
            cfg.color = c.value();
            cfg.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return GrgError{GrgError::IO,
            "cannot open config file: " + path, "expected a regular file"};
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return GrgError{GrgError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.git_executable_set) {
        git_executable = other.git_executable;
        git_executable_set = true;
    }
    if (other.git_timeout_set) {
        git_timeout = other.git_timeout;
        git_timeout_set = true;
    }
    if (other.transports_set) {
        transports = other.transports;
        transports_set = true;
    }
    if (other.temp_dir_set) {
        temp_dir = other.temp_dir;
        temp_dir_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (file.has_value()) result.merge(file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.grg/config.toml";
}

} // namespace grg
