#include <acb/error.hpp>

namespace acb {

const char* AcbError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case Archive:    return "Archive";
        case Process:    return "Process";
        case Cancelled:  return "Cancelled";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string AcbError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace acb
