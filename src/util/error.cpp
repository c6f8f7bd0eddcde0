#include <fencelint/error.hpp>

namespace fencelint {

const char* FencelintError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case NotFound:   return "NotFound";
        case Timeout:    return "Timeout";
        case Tool:       return "Tool";
    }
    return "Unknown";
}

std::string FencelintError::format() const {
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

} // namespace fencelint
