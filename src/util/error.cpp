#include <sitecfg/error.hpp>

namespace sitecfg {

const char* SiteError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case NotFound:            return "NotFound";
        case InvalidArg:          return "InvalidArg";
        case TypeMismatch:        return "TypeMismatch";
        case RangeViolation:      return "RangeViolation";
        case EnumViolation:       return "EnumViolation";
        case StructuralViolation: return "StructuralViolation";
        case UnsupportedSource:   return "UnsupportedSource";
        case ReservedValue:       return "ReservedValue";
    }
    return "Unknown";
}

std::string SiteError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!key.empty() || !file.empty()) {
        result += "\n  --> ";
        if (!key.empty()) {
            result += key;
            if (!file.empty()) result += " (" + file + ")";
        } else {
            result += file;
        }
    }

    return result;
}

} // namespace sitecfg
