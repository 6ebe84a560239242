#pragma once

#include <semver/log.hpp>
#include <semver/parser.hpp>
#include <semver/result.hpp>
#include <optional>
#include <string>

namespace semver {

// Layered configuration: global ~/.semver/config.toml, then a local file.
// Later layers override only the fields they explicitly set.
//
//   [parse]
//   mode = "lenient"        # or "strict"
//
//   [log]
//   level = "debug"
//   color = false
struct Config {
    ParseMode mode = ParseMode::Strict;
    log::Level log_level = log::Info;
    bool color = false;

    bool mode_set = false;
    bool log_level_set = false;
    bool color_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Pushes the [log] settings that were set into the log module.
    void apply_logging() const;
};

const char* parse_mode_name(ParseMode m);

// ~/.semver/config.toml, or "" when no home directory is known.
std::string global_config_path();

} // namespace semver
