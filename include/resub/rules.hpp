#pragma once

#include <resub/pattern.hpp>
#include <resub/result.hpp>
#include <resub/substitute.hpp>
#include <resub/template.hpp>
#include <string>
#include <vector>

namespace resub {

// One substitution step: pattern, compiled replacement, and its options.
struct Rule {
    std::string name;
    Pattern pattern;
    CompiledTemplate replacement;
    SubstituteOptions options;
    int line = 0;   // line of the [[rule]] header, when parsed from TOML

    // Compile both halves up front so a broken rule never touches input
    static Result<Rule> make(std::string name,
                             const std::string& pattern,
                             const std::string& replacement,
                             SubstituteOptions options = {},
                             PatternOptions pattern_options = {});
};

// An ordered list of rules; each rule's output feeds the next.
//
// TOML layout:
//   [defaults]            global, icase, multiline, dotall (all optional)
//   [[rule]]              name (optional), pattern, replacement,
//                         plus any of the [defaults] keys as overrides
class RuleSet {
public:
    static Result<RuleSet> parse(const std::string& toml_str,
                                 const std::string& origin = "");
    static Result<RuleSet> load(const std::string& path);

    void add(Rule rule);

    Result<Substitution> apply(const std::string& source) const;

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    std::vector<Rule> rules_;
};

} // namespace resub
