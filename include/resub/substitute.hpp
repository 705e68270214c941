#pragma once

#include <resub/pattern.hpp>
#include <resub/result.hpp>
#include <resub/template.hpp>
#include <cstddef>
#include <string>

namespace resub {

struct SubstituteOptions {
    // Replace every non-overlapping match; false stops after the first
    bool global = true;
};

struct Substitution {
    std::string text;
    size_t replacements = 0;
};

// Replace matches of `pattern` in `source` with renderings of `tpl`.
// Either the whole substitution succeeds or an error is returned; no
// partially substituted text is ever handed back.
Result<Substitution> substitute_counted(const std::string& source,
                                        const Pattern& pattern,
                                        const CompiledTemplate& tpl,
                                        SubstituteOptions options = {});

// Compiles `replacement` before any matching, so a malformed template is
// reported even when the pattern never matches.
Result<Substitution> substitute_counted(const std::string& source,
                                        const Pattern& pattern,
                                        const std::string& replacement,
                                        SubstituteOptions options = {});

Result<std::string> substitute(const std::string& source,
                               const Pattern& pattern,
                               const std::string& replacement,
                               SubstituteOptions options = {});

// Convenience form compiling the pattern from text as well.
Result<std::string> substitute(const std::string& source,
                               const std::string& pattern,
                               const std::string& replacement,
                               SubstituteOptions options = {},
                               PatternOptions pattern_options = {});

} // namespace resub
