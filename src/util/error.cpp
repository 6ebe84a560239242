#include <semver/error.hpp>

namespace semver {

const char* SemverError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Version:    return "Version";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string SemverError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }

    return out;
}

} // namespace semver
