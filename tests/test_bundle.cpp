#include <catch2/catch.hpp>
#include <semver/bundle.hpp>
#include <cstdlib>

using namespace semver;

static std::string fixture_dir() {
    const char* src = std::getenv("SEMVER_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

TEST_CASE("parse bundle info dictionary", "[bundle]") {
    auto r = Bundle::parse(R"(
[bundle]
name = "tool"
version = "3.1.4"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().info_value("name") == std::string("tool"));
    REQUIRE_FALSE(r.value().info_value("missing").has_value());
}

TEST_CASE("bundle version parses strictly", "[bundle]") {
    auto b = Bundle::parse("[bundle]\nversion = \"3.1.4-rc.2\"\n").value();
    auto v = b.version();
    REQUIRE(v.has_value());
    REQUIRE(*v == Version(3, 1, 4, {"rc", "2"}));
}

TEST_CASE("malformed bundle version is absent", "[bundle]") {
    // Lenient parsing would accept "3.1"; bundle lookup must not.
    auto b = Bundle::parse("[bundle]\nversion = \"3.1\"\n").value();
    REQUIRE_FALSE(b.version().has_value());
}

TEST_CASE("missing version key is absent", "[bundle]") {
    auto b = Bundle::parse("[bundle]\nname = \"x\"\n").value();
    REQUIRE_FALSE(b.version().has_value());
}

TEST_CASE("non-string bundle values are skipped", "[bundle]") {
    auto r = Bundle::parse("[bundle]\nversion = 3\nbuild = true\nname = \"n\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().info.size() == 1);
    REQUIRE_FALSE(r.value().version().has_value());
}

TEST_CASE("missing [bundle] section", "[bundle]") {
    auto r = Bundle::parse("[package]\nversion = \"1.0.0\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::NotFound);
}

TEST_CASE("invalid bundle TOML", "[bundle]") {
    auto r = Bundle::parse("[bundle\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::Parse);
}

TEST_CASE("load bundle from fixture", "[bundle]") {
    auto r = Bundle::load(fixture_dir() + "/bundle.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().path.find("bundle.toml") != std::string::npos);
    auto v = r.value().version();
    REQUIRE(v.has_value());
    REQUIRE(v->to_string() == "2.4.1-beta.3+build.77");
}

TEST_CASE("load bundle with a bad version", "[bundle]") {
    auto r = Bundle::load(fixture_dir() + "/bundle_bad_version.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().info_value("name") == std::string("broken-app"));
    REQUIRE_FALSE(r.value().version().has_value());
}

TEST_CASE("load missing bundle file", "[bundle]") {
    auto r = Bundle::load(fixture_dir() + "/nope.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SemverError::IO);
}
