#include <semver/bundle.hpp>
#include <semver/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace semver {

Result<Bundle> Bundle::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SemverError{SemverError::Parse,
            std::string("bundle TOML parse error: ") + e.what()};
    }

    auto tbl = doc["bundle"].as_table();
    if (!tbl) {
        return SemverError{SemverError::NotFound,
            "missing [bundle] section",
            "bundle metadata lives under a [bundle] table"};
    }

    Bundle b;
    for (const auto& [key, val] : *tbl) {
        if (auto s = val.value<std::string>()) {
            b.info[std::string(key)] = std::string(*s);
        } else {
            log::debug("bundle: skipping non-string key '%s'", std::string(key).c_str());
        }
    }
    return Result<Bundle>::ok(std::move(b));
}

Result<Bundle> Bundle::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SemverError{SemverError::IO,
            "cannot open bundle metadata: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Bundle::parse(ss.str());
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.file = path;
        return err;
    }
    r.value().path = path;
    return r;
}

std::optional<std::string> Bundle::info_value(const std::string& key) const {
    auto it = info.find(key);
    if (it == info.end()) return std::nullopt;
    return it->second;
}

std::optional<Version> Bundle::version() const {
    auto raw = info_value(kBundleVersionKey);
    if (!raw) return std::nullopt;

    auto r = Version::parse(*raw, ParseMode::Strict);
    if (r.is_err()) {
        log::debug("bundle%s%s: %s",
                   path.empty() ? "" : " ", path.c_str(),
                   r.error().to_error(*raw).message.c_str());
        return std::nullopt;
    }
    return std::move(r).value();
}

} // namespace semver
