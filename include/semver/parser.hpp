#pragma once

#include <semver/result.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

// Grammar rule active while scanning; reported with every failure.
enum class Component {
    Major,
    Minor,
    Patch,
    PrereleaseIdentifiers,
    BuildMetadataIdentifiers,
};

const char* component_name(Component c);

enum class ParseMode { Strict, Lenient };

// Fields recovered from a version string. A field is unset when scanning
// stopped before reaching it.
struct ParseResult {
    std::optional<std::uint64_t> major;
    std::optional<std::uint64_t> minor;
    std::optional<std::uint64_t> patch;
    std::optional<std::vector<std::string>> prerelease_identifiers;
    std::optional<std::vector<std::string>> build_metadata_identifiers;

    bool operator==(const ParseResult& o) const;
    bool operator!=(const ParseResult& o) const;
};

struct ConsistencyError {
    enum Kind {
        NonNumericValue,      // expected digits, found none (or too many)
        DelimiterExpected,    // expected '.', not found
        MalformedIdentifiers, // empty identifier in a '-' or '+' list
        EndOfStringExpected,  // trailing input after a complete version
    };

    Kind kind = NonNumericValue;
    // Identifiers scanned before the empty one; MalformedIdentifiers only.
    std::vector<std::string> identifiers;

    std::string describe() const;
    bool operator==(const ConsistencyError& o) const;
    bool operator!=(const ConsistencyError& o) const;
};

const char* consistency_kind_name(ConsistencyError::Kind k);

struct ParseFailure {
    std::size_t location = 0;   // byte offset where scanning stopped
    Component component = Component::Major;
    ConsistencyError reason;
    ParseResult result;         // fields parsed before the failure

    // "expected digits for patch at position 4" followed by the input and a
    // caret under the offending byte.
    std::string format(std::string_view input) const;

    SemverError to_error(std::string_view input) const;
};

// Scans MAJOR.MINOR.PATCH[-PRERELEASE][+BUILD] left to right, stopping at
// the first violation. Never throws for malformed input.
Result<ParseResult, ParseFailure> parse(std::string_view input);

// Lenient recovery: the partial result if at least the major component was
// read, nothing otherwise.
std::optional<ParseResult> recover(const ParseFailure& failure);

} // namespace semver
