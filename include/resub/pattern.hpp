#pragma once

#include <resub/result.hpp>
#include <boost/regex.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace resub {

// Perl modifiers. All off by default, as in Perl.
struct PatternOptions {
    bool icase = false;      // i
    bool multiline = false;  // m: ^ and $ also anchor at line breaks
    bool dotall = false;     // s: '.' also matches newline
};

// One match of a Pattern in a subject string.
struct Match {
    size_t start = 0;  // byte offset in subject
    size_t end = 0;    // byte offset past match

    // Groups 1..N; a group that did not take part is an empty string
    std::vector<std::string> captures;

    size_t length() const { return end - start; }
    bool empty() const { return start == end; }
};

// A compiled Perl-syntax regular expression.
class Pattern {
public:
    static Result<Pattern> compile(const std::string& text,
                                   PatternOptions options = {});

    // First match starting at or after `from`. Text before `from` is still
    // visible to look-behind, \b and ^.
    Result<std::optional<Match>> search(const std::string& subject, size_t from) const;

    // A non-empty match that starts exactly at `at`.
    Result<std::optional<Match>> match_nonempty_at(const std::string& subject,
                                                   size_t at) const;

    size_t group_count() const;
    const std::string& text() const { return text_; }
    const PatternOptions& options() const { return options_; }

private:
    Result<std::optional<Match>> run(const std::string& subject, size_t from,
                                     boost::regex_constants::match_flag_type flags) const;

    boost::regex re_;
    std::string text_;
    PatternOptions options_;
};

} // namespace resub
