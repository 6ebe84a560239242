#pragma once

#include <string>

namespace semver {

struct SemverError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        NotFound,
        InvalidArg
    };

    Code code = Version;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SemverError() = default;
    SemverError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SemverError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SemverError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // error[Code]: message
    //   hint: ...
    //   --> file:line
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace semver
