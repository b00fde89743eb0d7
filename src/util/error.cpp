#include <strata/error.hpp>

namespace strata {

const char* StrataError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case MissingManifest:   return "MissingManifest";
        case UnresolvedPackage: return "UnresolvedPackage";
        case Invariant:         return "Invariant";
        case NotFound:          return "NotFound";
        case Cycle:             return "Cycle";
        case InvalidArg:        return "InvalidArg";
    }
    return "Unknown";
}

std::string StrataError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace strata
