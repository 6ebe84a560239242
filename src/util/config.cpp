#include <semver/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace semver {

const char* parse_mode_name(ParseMode m) {
    switch (m) {
    case ParseMode::Strict:  return "strict";
    case ParseMode::Lenient: return "lenient";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SemverError{SemverError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [parse] section
    if (auto p = doc["parse"].as_table()) {
        if (auto v = (*p)["mode"].value<std::string>()) {
            if (*v == "strict") {
                cfg.mode = ParseMode::Strict;
            } else if (*v == "lenient") {
                cfg.mode = ParseMode::Lenient;
            } else {
                return SemverError{SemverError::Config,
                    "unknown parse mode '" + *v + "'",
                    "expected \"strict\" or \"lenient\""};
            }
            cfg.mode_set = true;
        }
    }

    // [log] section
    if (auto l = doc["log"].as_table()) {
        if (auto v = (*l)["level"].value<std::string>()) {
            auto lvl = log::level_from_name(*v);
            if (!lvl) {
                return SemverError{SemverError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*l)["color"].value<bool>()) {
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SemverError{SemverError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.file = path;
        return err;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.mode_set) {
        mode = other.mode;
        mode_set = true;
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
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.semver/config.toml";
}

} // namespace semver
