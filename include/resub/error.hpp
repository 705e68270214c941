#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace resub {

struct ResubError {
    enum Code {
        TrailingEscape,
        IllegalEscapeChar,
        MissingClosingBrace,
        InvalidBackrefSyntax,
        BackrefOutOfRange,
        Pattern,
        IO,
        Config,
        Parse,
        InvalidArg
    };

    static constexpr size_t npos = static_cast<size_t>(-1);

    Code code = InvalidArg;
    std::string message;
    std::string hint;

    // Byte offset into the template (or pattern) the error refers to
    size_t position = npos;
    // IllegalEscapeChar: the character after '\' and its code point
    std::string offending;
    char32_t code_point = 0;
    // BackrefOutOfRange: 1-based group number vs. captures produced
    size_t requested = 0;
    size_t available = 0;

    // Rules file location, when loaded from disk
    std::string file;
    int line = 0;

    ResubError() = default;
    ResubError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ResubError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static ResubError at(Code c, std::string msg, size_t pos);
    static ResubError illegal_escape(char32_t cp, std::string text, size_t pos);
    static ResubError backref_out_of_range(size_t requested, size_t available);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace resub
