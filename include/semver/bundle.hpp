#pragma once

#include <semver/result.hpp>
#include <semver/version.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace semver {

// Key under [bundle] holding the application's version string.
inline constexpr const char* kBundleVersionKey = "version";

// Host application metadata, read from a TOML file:
//
//   [bundle]
//   name = "my-app"
//   version = "1.4.0-beta.2"
struct Bundle {
    std::string path;   // file the metadata was loaded from, if any
    std::unordered_map<std::string, std::string> info;

    static Result<Bundle> parse(const std::string& toml_str);
    static Result<Bundle> load(const std::string& path);

    std::optional<std::string> info_value(const std::string& key) const;

    // Strictly parsed bundle version; nullopt when the key is missing or
    // its value is not a valid version.
    std::optional<Version> version() const;
};

} // namespace semver
