#include <resub/substitute.hpp>
#include <resub/log.hpp>
#include <resub/utf8.hpp>
#include <optional>

namespace resub {

// Next match at or after `cursor`. After a zero-length match at `cursor`
// only a non-empty match may start there; otherwise the search moves past
// one whole UTF-8 character, which the caller later copies through unchanged.
static Result<std::optional<Match>> next_match(const Pattern& pattern,
                                               const std::string& source,
                                               size_t cursor,
                                               bool after_empty) {
    if (!after_empty) {
        return pattern.search(source, cursor);
    }
    RESUB_TRY_ASSIGN(std::optional<Match> m, pattern.match_nonempty_at(source, cursor));
    if (m || cursor >= source.size()) {
        return Result<std::optional<Match>>::ok(std::move(m));
    }
    return pattern.search(source, cursor + utf8::sequence_length(source, cursor));
}

Result<Substitution> substitute_counted(const std::string& source,
                                        const Pattern& pattern,
                                        const CompiledTemplate& tpl,
                                        SubstituteOptions options) {
    Substitution result;
    std::string& out = result.text;
    out.reserve(source.size());

    size_t copied = 0;   // source[0, copied) has been emitted
    size_t cursor = 0;
    bool after_empty = false;

    for (;;) {
        RESUB_TRY_ASSIGN(std::optional<Match> m,
                         next_match(pattern, source, cursor, after_empty));
        if (!m) break;

        out.append(source, copied, m->start - copied);
        RESUB_TRY(tpl.render_into(out, m->captures));
        ++result.replacements;

        copied = m->end;
        cursor = m->end;
        after_empty = m->empty();

        if (!options.global) break;
    }
    out.append(source, copied, std::string::npos);

    log::debug("'%s': %zu replacement(s), %zu -> %zu bytes",
               pattern.text().c_str(), result.replacements,
               source.size(), out.size());
    return Result<Substitution>::ok(std::move(result));
}

Result<Substitution> substitute_counted(const std::string& source,
                                        const Pattern& pattern,
                                        const std::string& replacement,
                                        SubstituteOptions options) {
    RESUB_TRY_ASSIGN(CompiledTemplate tpl, CompiledTemplate::compile(replacement));
    return substitute_counted(source, pattern, tpl, options);
}

Result<std::string> substitute(const std::string& source,
                               const Pattern& pattern,
                               const std::string& replacement,
                               SubstituteOptions options) {
    return substitute_counted(source, pattern, replacement, options)
        .map([](Substitution&& s) { return std::move(s.text); });
}

Result<std::string> substitute(const std::string& source,
                               const std::string& pattern,
                               const std::string& replacement,
                               SubstituteOptions options,
                               PatternOptions pattern_options) {
    RESUB_TRY_ASSIGN(CompiledTemplate tpl, CompiledTemplate::compile(replacement));
    RESUB_TRY_ASSIGN(Pattern re, Pattern::compile(pattern, pattern_options));
    return substitute_counted(source, re, tpl, options)
        .map([](Substitution&& s) { return std::move(s.text); });
}

} // namespace resub
