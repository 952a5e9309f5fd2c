#include <grg/error.hpp>

namespace grg {

const char* GrgError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case NotFound:   return "NotFound";
        case Workspace:  return "Workspace";
        case Fetch:      return "Fetch";
        case Metadata:   return "Metadata";
        case Process:    return "Process";
    }
    return "Unknown";
}

std::string GrgError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace grg
