#pragma once

#include <resub/result.hpp>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace resub {

// Text emitted verbatim.
struct Literal {
    std::string text;
};

// Zero-based index into the capture list. The user writes $1 for index 0.
struct BackrefIndex {
    size_t index;
};

inline bool operator==(const Literal& a, const Literal& b) { return a.text == b.text; }
inline bool operator!=(const Literal& a, const Literal& b) { return !(a == b); }
inline bool operator==(const BackrefIndex& a, const BackrefIndex& b) { return a.index == b.index; }
inline bool operator!=(const BackrefIndex& a, const BackrefIndex& b) { return !(a == b); }

using Segment = std::variant<Literal, BackrefIndex>;

// A parsed replacement template.
//
// Grammar, scanned left to right:
//   literal   any run of characters other than '$' and '\'
//   escape    '\$' or '\\', emitting the second character
//   backref   '$N' or '${N}', N matching [1-9][0-9]*
//
// Adjacent literal text (escapes included) is always coalesced into a
// single Literal segment. The value is immutable once compiled and may be
// rendered any number of times, from any number of threads.
class CompiledTemplate {
public:
    static Result<CompiledTemplate> compile(const std::string& text);

    // Build the replacement for one match. captures[0] is group 1.
    Result<std::string> render(const std::vector<std::string>& captures) const;

    // Append the replacement to `out`. On error `out` is left as it was.
    Status render_into(std::string& out, const std::vector<std::string>& captures) const;

    const std::vector<Segment>& segments() const { return segments_; }
    bool empty() const { return segments_.empty(); }

    // Highest 1-based group number referenced, 0 if none
    size_t max_backref() const;

    // Canonical template text: '$' and '\' escaped, backrefs as ${N}
    std::string to_string() const;

private:
    std::vector<Segment> segments_;
};

} // namespace resub
