#include <verspec/error.hpp>

namespace verspec {

const char* VerspecError::code_name(Code c) {
    switch (c) {
        case IO:           return "IO";
        case Parse:        return "Parse";
        case Config:       return "Config";
        case NullInput:    return "NullInput";
        case Format:       return "Format";
        case InvalidArg:   return "InvalidArg";
        case TypeMismatch: return "TypeMismatch";
    }
    return "Unknown";
}

VerspecError VerspecError::bad_format(const std::string& text, const std::string& what,
                                      std::string reason) {
    VerspecError e{Format, "'" + text + "' is not a valid " + what, std::move(reason)};
    e.input = text;
    return e;
}

std::string VerspecError::format() const {
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

} // namespace verspec
