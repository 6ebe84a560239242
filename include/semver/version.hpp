#pragma once

#include <semver/parser.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

// Full version: major.minor.patch[-prerelease][+build]
struct Version {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease_identifiers;    // e.g. {"rc", "1"}
    std::vector<std::string> build_metadata_identifiers; // e.g. {"001"}

    Version() = default;
    explicit Version(std::uint64_t major_, std::uint64_t minor_ = 0, std::uint64_t patch_ = 0,
                     std::vector<std::string> prerelease = {},
                     std::vector<std::string> build_metadata = {});

    // Absent numbers become 0, absent identifier lists become empty.
    static Version from_parse_result(const ParseResult& r);

    // Strict: any failure is returned as is.
    // Lenient: a failure that still produced a major is turned into a
    // version with the missing fields defaulted ("1.2" -> 1.2.0).
    static Result<Version, ParseFailure> parse(std::string_view s,
                                               ParseMode mode = ParseMode::Strict);

    // Major-only version; negative input clamps to 0.
    static Version from_integer(std::int64_t major);

    // Lenient parse that never fails: unrecoverable input yields 0.0.0
    // and a warning on the log.
    static Version from_literal(std::string_view s);

    std::string to_string() const;
    bool is_prerelease() const { return !prerelease_identifiers.empty(); }

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
};

} // namespace semver
