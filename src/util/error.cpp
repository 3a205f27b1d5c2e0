#include <resx/error.hpp>

namespace resx {

const char* ResxError::code_name(Code c) {
    switch (c) {
        case IO:           return "IO";
        case Parse:        return "Parse";
        case Config:       return "Config";
        case InvalidArg:   return "InvalidArg";
        case NotFound:     return "NotFound";
        case DuplicateKey: return "DuplicateKey";
        case Immutable:    return "Immutable";
    }
    return "Unknown";
}

std::string ResxError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!key.empty()) {
        result += "\n  --> ";
        result += key;
        if (!culture.empty()) {
            result += " [";
            result += culture;
            result += "]";
        }
    }

    return result;
}

} // namespace resx
