#include <semver/version.hpp>
#include <semver/log.hpp>
#include <utility>

namespace semver {

Version::Version(std::uint64_t major_, std::uint64_t minor_, std::uint64_t patch_,
                 std::vector<std::string> prerelease,
                 std::vector<std::string> build_metadata)
    : major(major_), minor(minor_), patch(patch_),
      prerelease_identifiers(std::move(prerelease)),
      build_metadata_identifiers(std::move(build_metadata)) {}

Version Version::from_parse_result(const ParseResult& r) {
    Version v;
    v.major = r.major.value_or(0);
    v.minor = r.minor.value_or(0);
    v.patch = r.patch.value_or(0);
    if (r.prerelease_identifiers) v.prerelease_identifiers = *r.prerelease_identifiers;
    if (r.build_metadata_identifiers) v.build_metadata_identifiers = *r.build_metadata_identifiers;
    return v;
}

Result<Version, ParseFailure> Version::parse(std::string_view s, ParseMode mode) {
    auto r = semver::parse(s);
    if (r.is_ok()) {
        return Result<Version, ParseFailure>::ok(from_parse_result(r.value()));
    }

    if (mode == ParseMode::Lenient) {
        if (auto partial = recover(r.error())) {
            log::debug("lenient parse of '%.*s' stopped at %s (position %zu), using partial result",
                       static_cast<int>(s.size()), s.data(),
                       component_name(r.error().component), r.error().location);
            return Result<Version, ParseFailure>::ok(from_parse_result(*partial));
        }
    }

    return std::move(r).error();
}

Version Version::from_integer(std::int64_t major) {
    return Version(major > 0 ? static_cast<std::uint64_t>(major) : 0);
}

Version Version::from_literal(std::string_view s) {
    auto r = parse(s, ParseMode::Lenient);
    if (r.is_err()) {
        log::warn("%s", r.error().to_error(s).message.c_str());
        return Version(0);
    }
    return std::move(r).value();
}

static void append_identifiers(std::string& s, char prefix,
                               const std::vector<std::string>& identifiers) {
    if (identifiers.empty()) return;
    s += prefix;
    for (size_t i = 0; i < identifiers.size(); ++i) {
        if (i > 0) s += '.';
        s += identifiers[i];
    }
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    append_identifiers(s, '-', prerelease_identifiers);
    append_identifiers(s, '+', build_metadata_identifiers);
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease_identifiers == o.prerelease_identifiers &&
           build_metadata_identifiers == o.build_metadata_identifiers;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

} // namespace semver
