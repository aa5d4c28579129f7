#include <semrex/error.hpp>

namespace semrex {

const char* SemrexError::code_name(Code c) {
    switch (c) {
        case Parse:               return "Parse";
        case UnsupportedOperator: return "UnsupportedOperator";
        case DialectUnsupported:  return "DialectUnsupported";
        case Regex:               return "Regex";
        case Config:              return "Config";
        case IO:                  return "IO";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

SemrexError& SemrexError::prefix(const std::string& context) {
    message = context + ": " + message;
    return *this;
}

std::string SemrexError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    // TOML parsed from a string has a line but no file
    if (!file.empty() || line > 0) {
        result += "\n  --> ";
        result += file.empty() ? "line " + std::to_string(line) : file;
        if (!file.empty() && line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

std::ostream& operator<<(std::ostream& os, const SemrexError& e) {
    return os << e.format();
}

} // namespace semrex
