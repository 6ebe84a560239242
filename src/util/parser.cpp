#include <semver/parser.hpp>
#include <cctype>
#include <charconv>
#include <system_error>

namespace semver {

static constexpr char kDefaultDelimiter = '.';
static constexpr char kPrereleaseDelimiter = '-';
static constexpr char kBuildMetadataDelimiter = '+';

// ---------------------------------------------------------------------------
// Names and equality
// ---------------------------------------------------------------------------

const char* component_name(Component c) {
    switch (c) {
    case Component::Major:                    return "major";
    case Component::Minor:                    return "minor";
    case Component::Patch:                    return "patch";
    case Component::PrereleaseIdentifiers:    return "prereleaseIdentifiers";
    case Component::BuildMetadataIdentifiers: return "buildMetadataIdentifiers";
    }
    return "unknown";
}

const char* consistency_kind_name(ConsistencyError::Kind k) {
    switch (k) {
    case ConsistencyError::NonNumericValue:      return "nonNumericValue";
    case ConsistencyError::DelimiterExpected:    return "delimiterExpected";
    case ConsistencyError::MalformedIdentifiers: return "malformedIdentifiers";
    case ConsistencyError::EndOfStringExpected:  return "endOfStringExpected";
    }
    return "unknown";
}

bool ParseResult::operator==(const ParseResult& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease_identifiers == o.prerelease_identifiers &&
           build_metadata_identifiers == o.build_metadata_identifiers;
}

bool ParseResult::operator!=(const ParseResult& o) const { return !(*this == o); }

bool ConsistencyError::operator==(const ConsistencyError& o) const {
    return kind == o.kind && identifiers == o.identifiers;
}

bool ConsistencyError::operator!=(const ConsistencyError& o) const { return !(*this == o); }

std::string ConsistencyError::describe() const {
    switch (kind) {
    case NonNumericValue:
        return "expected digits";
    case DelimiterExpected:
        return std::string("expected '") + kDefaultDelimiter + "'";
    case MalformedIdentifiers: {
        std::string s = "expected identifier [0-9A-Za-z-]";
        if (!identifiers.empty()) {
            s += " after '";
            for (size_t i = 0; i < identifiers.size(); ++i) {
                if (i > 0) s += kDefaultDelimiter;
                s += identifiers[i];
            }
            s += kDefaultDelimiter;
            s += "'";
        }
        return s;
    }
    case EndOfStringExpected:
        return "expected end of string";
    }
    return "unknown error";
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

static std::string summary(const ParseFailure& f) {
    std::string s = f.reason.describe();
    s += f.reason.kind == ConsistencyError::EndOfStringExpected ? " after " : " for ";
    s += component_name(f.component);
    s += " at position " + std::to_string(f.location);
    return s;
}

std::string ParseFailure::format(std::string_view input) const {
    std::string out = summary(*this);

    out += "\n  ";
    out.append(input.data(), input.size());
    out += "\n  ";
    size_t caret = location < input.size() ? location : input.size();
    out.append(caret, ' ');
    out += '^';
    return out;
}

SemverError ParseFailure::to_error(std::string_view input) const {
    std::string msg = "invalid version '";
    msg.append(input.data(), input.size());
    msg += "': ";
    msg += summary(*this);
    return SemverError{SemverError::Version, std::move(msg),
        "expected format: major.minor.patch[-prerelease][+build]"};
}

// ---------------------------------------------------------------------------
// Scanner
// ---------------------------------------------------------------------------

namespace {

bool is_numeric(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_identifier(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

struct VersionScanner {
    std::string_view input;
    size_t pos = 0;
    Component component = Component::Major;
    ParseResult result;

    explicit VersionScanner(std::string_view in) : input(in) {}

    bool at_end() const { return pos >= input.size(); }

    // Consumes the maximal run of characters matching pred.
    template<typename Pred>
    std::string_view scan_characters(Pred pred) {
        size_t start = pos;
        while (!at_end() && pred(input[pos])) ++pos;
        return input.substr(start, pos - start);
    }

    bool scan_optional_delimiter(char delimiter) {
        if (at_end() || input[pos] != delimiter) return false;
        ++pos;
        return true;
    }

    ParseFailure fail(ConsistencyError reason) const {
        return ParseFailure{pos, component, std::move(reason), result};
    }

    Result<std::uint64_t, ConsistencyError> scan_numeric() {
        std::string_view digits = scan_characters(is_numeric);
        if (digits.empty()) {
            return ConsistencyError{ConsistencyError::NonNumericValue, {}};
        }
        // A run that overflows uint64_t is not a number we can represent.
        std::uint64_t value = 0;
        const char* last = digits.data() + digits.size();
        auto [end, ec] = std::from_chars(digits.data(), last, value);
        if (ec != std::errc() || end != last) {
            return ConsistencyError{ConsistencyError::NonNumericValue, {}};
        }
        return Result<std::uint64_t, ConsistencyError>::ok(value);
    }

    // On failure the error carries the identifiers scanned so far.
    Result<std::vector<std::string>, ConsistencyError> scan_identifiers() {
        std::vector<std::string> identifiers;
        do {
            std::string_view ident = scan_characters(is_identifier);
            if (ident.empty()) {
                return ConsistencyError{ConsistencyError::MalformedIdentifiers,
                                        std::move(identifiers)};
            }
            identifiers.emplace_back(ident);
        } while (scan_optional_delimiter(kDefaultDelimiter));
        return Result<std::vector<std::string>, ConsistencyError>::ok(std::move(identifiers));
    }

    std::optional<ParseFailure> numeric_component(Component c, std::optional<std::uint64_t>& field) {
        component = c;
        auto r = scan_numeric();
        if (r.is_err()) return fail(std::move(r).error());
        field = r.value();
        return std::nullopt;
    }

    std::optional<ParseFailure> required_delimiter() {
        if (scan_optional_delimiter(kDefaultDelimiter)) return std::nullopt;
        return fail(ConsistencyError{ConsistencyError::DelimiterExpected, {}});
    }

    std::optional<ParseFailure> identifiers_component(
            Component c, std::optional<std::vector<std::string>>& field) {
        component = c;
        auto r = scan_identifiers();
        if (r.is_err()) {
            // Keep the partial list on the result as well as in the cause.
            field = r.error().identifiers;
            return fail(std::move(r).error());
        }
        field = std::move(r).value();
        return std::nullopt;
    }

    Result<ParseResult, ParseFailure> run() {
        if (auto f = numeric_component(Component::Major, result.major)) return std::move(*f);
        if (auto f = required_delimiter()) return std::move(*f);

        if (auto f = numeric_component(Component::Minor, result.minor)) return std::move(*f);
        if (auto f = required_delimiter()) return std::move(*f);

        if (auto f = numeric_component(Component::Patch, result.patch)) return std::move(*f);

        if (scan_optional_delimiter(kPrereleaseDelimiter)) {
            if (auto f = identifiers_component(Component::PrereleaseIdentifiers,
                                               result.prerelease_identifiers)) {
                return std::move(*f);
            }
        }

        if (scan_optional_delimiter(kBuildMetadataDelimiter)) {
            if (auto f = identifiers_component(Component::BuildMetadataIdentifiers,
                                               result.build_metadata_identifiers)) {
                return std::move(*f);
            }
        }

        if (!at_end()) {
            return fail(ConsistencyError{ConsistencyError::EndOfStringExpected, {}});
        }

        return Result<ParseResult, ParseFailure>::ok(std::move(result));
    }
};

} // namespace

Result<ParseResult, ParseFailure> parse(std::string_view input) {
    return VersionScanner(input).run();
}

std::optional<ParseResult> recover(const ParseFailure& failure) {
    if (!failure.result.major.has_value()) return std::nullopt;
    return failure.result;
}

} // namespace semver
