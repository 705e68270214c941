#pragma once

#include <resub/pattern.hpp>
#include <resub/result.hpp>
#include <resub/rules.hpp>
#include <resub/substitute.hpp>
#include <optional>
#include <string>
#include <vector>

namespace resub::cli {

struct Options {
    std::string pattern;
    std::string replacement;
    std::optional<std::string> rules_file;
    std::string input = "-";          // "-" reads stdin

    SubstituteOptions subst;
    PatternOptions pattern_opts;
    bool print_count = false;
    bool show_help = false;
    std::optional<std::string> log_level;
};

// Usage errors come back as InvalidArg.
Result<Options> parse_args(const std::vector<std::string>& args);

// The rule list the options describe: either the --rules file or the
// single PATTERN/REPLACEMENT pair.
Result<RuleSet> build_rules(const Options& opts);

const char* usage();

} // namespace resub::cli
