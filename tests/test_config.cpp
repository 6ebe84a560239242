#include <catch2/catch.hpp>
#include <semver/config.hpp>
#include <cstdlib>

using namespace semver;

static std::string fixture_dir() {
    const char* src = std::getenv("SEMVER_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

TEST_CASE("empty config uses defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().mode == ParseMode::Strict);
    REQUIRE_FALSE(r.value().mode_set);
    REQUIRE_FALSE(r.value().log_level_set);
    REQUIRE_FALSE(r.value().color_set);
}

TEST_CASE("parse [parse] and [log] sections", "[config]") {
    auto r = Config::parse(R"(
[parse]
mode = "lenient"

[log]
level = "warn"
color = true
)");
    REQUIRE(r.is_ok());
    auto& cfg = r.value();
    REQUIRE(cfg.mode == ParseMode::Lenient);
    REQUIRE(cfg.mode_set);
    REQUIRE(cfg.log_level == log::Warn);
    REQUIRE(cfg.color);
    REQUIRE(cfg.color_set);
}

TEST_CASE("unknown parse mode is a config error", "[config]") {
    auto r = Config::parse("[parse]\nmode = \"relaxed\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::Config);
    REQUIRE(r.error().message.find("relaxed") != std::string::npos);
}

TEST_CASE("unknown log level is a config error", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::Config);
}

TEST_CASE("invalid TOML is a parse error", "[config]") {
    auto r = Config::parse("[parse\nmode = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::Parse);
}

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto global = Config::parse("[parse]\nmode = \"lenient\"\n[log]\nlevel = \"error\"\n").value();
    auto local = Config::parse("[log]\nlevel = \"trace\"\n").value();

    auto eff = Config::effective(global, local);
    REQUIRE(eff.mode == ParseMode::Lenient);
    REQUIRE(eff.log_level == log::Trace);
    REQUIRE_FALSE(eff.color_set);
}

TEST_CASE("effective with no layers is the default", "[config]") {
    auto eff = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(eff.mode == ParseMode::Strict);
    REQUIRE(eff.log_level == log::Info);
}

TEST_CASE("load config from fixture", "[config]") {
    auto r = Config::load(fixture_dir() + "/config.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().mode == ParseMode::Lenient);
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().color_set);
    REQUIRE_FALSE(r.value().color);
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load(fixture_dir() + "/no_such_config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::IO);
}

TEST_CASE("apply_logging sets the log threshold", "[config]") {
    auto cfg = Config::parse("[log]\nlevel = \"error\"\ncolor = false\n").value();
    cfg.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("parse mode names", "[config]") {
    REQUIRE(std::string(parse_mode_name(ParseMode::Strict)) == "strict");
    REQUIRE(std::string(parse_mode_name(ParseMode::Lenient)) == "lenient");
}

TEST_CASE("global config path under home", "[config]") {
    auto path = global_config_path();
    if (std::getenv("HOME")) {
        REQUIRE(path.find("/.semver/config.toml") != std::string::npos);
    }
}
