// semver_check.cpp
//
// Parses each version string given on the command line and prints either
// its components or a diagnostic pointing at the offending character.
//
//     ./semver-check 1.2.3-rc.1+001            # fields
//     ./semver-check 1.2                       # strict: delimiter error
//     ./semver-check --lenient 1.2             # lenient: 1.2.0
//     ./semver-check --bundle app.toml         # version from bundle metadata
//
// Exit status: 0 if everything parsed, 1 if any version failed, 2 on
// usage or configuration errors.

#include <semver/bundle.hpp>
#include <semver/config.hpp>
#include <semver/log.hpp>
#include <semver/version.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace semver;

struct Options {
    std::optional<ParseMode> mode;   // from --strict / --lenient
    std::string config_path;
    std::string bundle_path;
    std::vector<std::string> versions;
};

static const char* kUsage =
    "usage: semver-check [--strict | --lenient] [--config FILE] "
    "[--bundle FILE] <version>...";

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strict") {
            opts.mode = ParseMode::Strict;
        } else if (arg == "--lenient") {
            opts.mode = ParseMode::Lenient;
        } else if (arg == "--config" || arg == "--bundle") {
            if (i + 1 >= argc) {
                return SemverError{SemverError::InvalidArg,
                    "missing value for " + arg, kUsage};
            }
            if (arg == "--config") {
                opts.config_path = argv[++i];
            } else {
                opts.bundle_path = argv[++i];
            }
        } else if (arg == "-h" || arg == "--help") {
            return SemverError{SemverError::InvalidArg, "help requested", kUsage};
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return SemverError{SemverError::InvalidArg,
                "unknown option " + arg, kUsage};
        } else {
            opts.versions.push_back(arg);
        }
    }

    if (opts.versions.empty() && opts.bundle_path.empty()) {
        return SemverError{SemverError::InvalidArg,
            "no version specified", kUsage};
    }
    return Result<Options>::ok(std::move(opts));
}

// Global config is optional; an explicit --config must exist.
Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = Config::load(global_path);
        SEMVER_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!opts.config_path.empty()) {
        auto l = Config::load(opts.config_path);
        SEMVER_TRY(l);
        local = std::move(l).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

static std::string join(const std::vector<std::string>& items) {
    std::string s;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) s += ", ";
        s += items[i];
    }
    return s;
}

static void print_version(const Version& v) {
    std::cout << v.to_string() << "\n"
              << "  major:      " << v.major << "\n"
              << "  minor:      " << v.minor << "\n"
              << "  patch:      " << v.patch << "\n"
              << "  prerelease: [" << join(v.prerelease_identifiers) << "]\n"
              << "  build:      [" << join(v.build_metadata_identifiers) << "]\n";
}

static bool check(const std::string& text, ParseMode mode) {
    auto r = Version::parse(text, mode);
    if (r.is_err()) {
        const auto& f = r.error();
        std::cout << text << ": " << consistency_kind_name(f.reason.kind) << "\n";
        std::cerr << f.format(text) << "\n";
        return false;
    }
    print_version(r.value());
    return true;
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    cfg.value().apply_logging();

    ParseMode mode = opts.value().mode.value_or(cfg.value().mode);
    log::debug("parse mode: %s", parse_mode_name(mode));

    bool all_ok = true;

    if (!opts.value().bundle_path.empty()) {
        auto bundle = Bundle::load(opts.value().bundle_path);
        if (bundle.is_err()) {
            std::cerr << bundle.error().format() << "\n";
            return 2;
        }
        if (auto v = bundle.value().version()) {
            print_version(*v);
        } else {
            log::error("bundle %s has no valid version", opts.value().bundle_path.c_str());
            all_ok = false;
        }
    }

    for (const auto& text : opts.value().versions) {
        if (!check(text, mode)) all_ok = false;
    }

    return all_ok ? 0 : 1;
}
