#include <resub/pattern.hpp>
#include <resub/log.hpp>
#include <stdexcept>

namespace resub {

static boost::regex::flag_type syntax_flags(const PatternOptions& options) {
    boost::regex::flag_type flags = boost::regex::perl;
    if (options.icase) flags |= boost::regex::icase;
    flags |= options.multiline ? boost::regex::flag_type(0) : boost::regex::no_mod_m;
    flags |= options.dotall ? boost::regex::mod_s : boost::regex::no_mod_s;
    return flags;
}

static Match build_match(const boost::smatch& m, const std::string& subject) {
    Match out;
    out.start = static_cast<size_t>(m[0].first - subject.begin());
    out.end = static_cast<size_t>(m[0].second - subject.begin());

    out.captures.reserve(m.size() > 0 ? m.size() - 1 : 0);
    for (size_t i = 1; i < m.size(); ++i) {
        if (m[i].matched) {
            out.captures.push_back(m[i].str());
        } else {
            out.captures.emplace_back();
        }
    }
    return out;
}

Result<Pattern> Pattern::compile(const std::string& text, PatternOptions options) {
    Pattern p;
    p.text_ = text;
    p.options_ = options;
    try {
        p.re_.assign(text, syntax_flags(options));
    } catch (const boost::regex_error& e) {
        ResubError err = ResubError::at(ResubError::Pattern,
            "invalid regular expression '" + text + "': " + e.what(),
            static_cast<size_t>(e.position()));
        return err;
    }
    log::trace("compiled pattern '%s' with %zu group(s)",
               text.c_str(), p.group_count());
    return Result<Pattern>::ok(std::move(p));
}

size_t Pattern::group_count() const {
    return static_cast<size_t>(re_.mark_count());
}

Result<std::optional<Match>> Pattern::run(
    const std::string& subject, size_t from,
    boost::regex_constants::match_flag_type flags) const
{
    using Found = std::optional<Match>;
    if (from > subject.size()) {
        return Result<Found>::ok(std::nullopt);
    }
    if (from > 0) flags |= boost::match_prev_avail;

    boost::smatch m;
    bool found = false;
    try {
        // Passing the subject start as base lets look-behind see before `from`
        found = boost::regex_search(subject.begin() + static_cast<std::ptrdiff_t>(from),
                                    subject.end(), m, re_, flags, subject.begin());
    } catch (const std::runtime_error& e) {
        // Boost reports exhausted complexity/stack limits this way
        return ResubError::at(ResubError::Pattern,
            "matching '" + text_ + "' failed: " + e.what(), from);
    }

    if (!found) {
        return Result<Found>::ok(std::nullopt);
    }
    return Result<Found>::ok(build_match(m, subject));
}

Result<std::optional<Match>> Pattern::search(const std::string& subject, size_t from) const {
    return run(subject, from, boost::match_default);
}

Result<std::optional<Match>> Pattern::match_nonempty_at(const std::string& subject,
                                                        size_t at) const {
    return run(subject, at, boost::match_default | boost::match_continuous |
                                boost::match_not_null);
}

} // namespace resub
