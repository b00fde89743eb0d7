#pragma once

#include <string>

namespace strata {

struct StrataError {
    enum Code {
        IO,
        Parse,
        Config,
        MissingManifest,
        UnresolvedPackage,
        Invariant,
        NotFound,
        Cycle,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StrataError() = default;
    StrataError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StrataError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StrataError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace strata
