#include <resub/error.hpp>
#include <cstdio>

namespace resub {

const char* ResubError::code_name(Code c) {
    switch (c) {
        case TrailingEscape:       return "TrailingEscape";
        case IllegalEscapeChar:    return "IllegalEscapeChar";
        case MissingClosingBrace:  return "MissingClosingBrace";
        case InvalidBackrefSyntax: return "InvalidBackrefSyntax";
        case BackrefOutOfRange:    return "BackrefOutOfRange";
        case Pattern:              return "Pattern";
        case IO:                   return "IO";
        case Config:               return "Config";
        case Parse:                return "Parse";
        case InvalidArg:           return "InvalidArg";
    }
    return "Unknown";
}

ResubError ResubError::at(Code c, std::string msg, size_t pos) {
    ResubError e(c, std::move(msg));
    e.position = pos;
    return e;
}

ResubError ResubError::illegal_escape(char32_t cp, std::string text, size_t pos) {
    char hex[16];
    std::snprintf(hex, sizeof(hex), "U+%04X", static_cast<unsigned>(cp));

    ResubError e(IllegalEscapeChar,
        std::string("escape can only contain backslash or dollar sign, not ") +
            hex + " '" + text + "'",
        "write '\\\\' for a literal backslash");
    e.position = pos;
    e.offending = std::move(text);
    e.code_point = cp;
    return e;
}

ResubError ResubError::backref_out_of_range(size_t requested, size_t available) {
    ResubError e(BackrefOutOfRange,
        "unknown backref $" + std::to_string(requested) +
            "; there are only " + std::to_string(available) + " captures");
    e.requested = requested;
    e.available = available;
    return e;
}

std::string ResubError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (position != npos) {
        result += " (at offset ";
        result += std::to_string(position);
        result += ")";
    }

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

} // namespace resub
