#include <resub/cli.hpp>

namespace resub::cli {

const char* usage() {
    return
        "usage: resub [options] PATTERN REPLACEMENT [FILE]\n"
        "       resub [options] --rules RULES.toml [FILE]\n"
        "\n"
        "Replace matches of the Perl-style PATTERN in FILE (or stdin) with\n"
        "REPLACEMENT. REPLACEMENT may contain $N or ${N} group references;\n"
        "write \\$ and \\\\ for a literal dollar sign or backslash.\n"
        "\n"
        "options:\n"
        "  --first              replace only the first match\n"
        "  -i, --icase          case-insensitive pattern\n"
        "  -m, --multiline      ^ and $ match at line breaks\n"
        "  -s, --dotall         . matches newline\n"
        "  --rules FILE         apply the [[rule]] list from a TOML file; rule\n"
        "                       flags come from the file, so --first, -i, -m\n"
        "                       and -s are rejected alongside it\n"
        "  --count              report the number of replacements on stderr\n"
        "  --log-level LEVEL    trace, debug, info, warn or error\n"
        "  -h, --help           show this help\n";
}

static ResubError usage_error(std::string msg) {
    return ResubError{ResubError::InvalidArg, std::move(msg),
                      "run 'resub --help' for usage"};
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    std::vector<std::string> positional;
    bool options_done = false;
    std::string rule_flag;  // last of --first/-i/-m/-s seen

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if (options_done || a.empty() || a[0] != '-' || a == "-") {
            positional.push_back(a);
            continue;
        }

        auto take_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return usage_error("option " + flag + " requires a value");
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (a == "--") {
            options_done = true;
        } else if (a == "-h" || a == "--help") {
            opts.show_help = true;
        } else if (a == "--first") {
            opts.subst.global = false;
            rule_flag = a;
        } else if (a == "-i" || a == "--icase") {
            opts.pattern_opts.icase = true;
            rule_flag = a;
        } else if (a == "-m" || a == "--multiline") {
            opts.pattern_opts.multiline = true;
            rule_flag = a;
        } else if (a == "-s" || a == "--dotall") {
            opts.pattern_opts.dotall = true;
            rule_flag = a;
        } else if (a == "--count") {
            opts.print_count = true;
        } else if (a == "--rules") {
            RESUB_TRY_ASSIGN(opts.rules_file, take_value(a));
        } else if (a == "--log-level") {
            RESUB_TRY_ASSIGN(opts.log_level, take_value(a));
        } else {
            return usage_error("unknown option '" + a + "'");
        }
    }

    if (opts.show_help) {
        return Result<Options>::ok(std::move(opts));
    }

    if (opts.rules_file && !rule_flag.empty()) {
        return usage_error("option " + rule_flag +
                           " cannot be combined with --rules; set it in the rules file");
    }

    size_t needed = opts.rules_file ? 0 : 2;
    if (positional.size() < needed) {
        return usage_error("expected PATTERN and REPLACEMENT");
    }
    if (positional.size() > needed + 1) {
        return usage_error("too many arguments");
    }

    if (!opts.rules_file) {
        opts.pattern = positional[0];
        opts.replacement = positional[1];
    }
    if (positional.size() == needed + 1) {
        opts.input = positional[needed];
    }
    return Result<Options>::ok(std::move(opts));
}

Result<RuleSet> build_rules(const Options& opts) {
    if (opts.rules_file) {
        return RuleSet::load(*opts.rules_file);
    }
    RESUB_TRY_ASSIGN(Rule rule, Rule::make("command-line", opts.pattern,
                                           opts.replacement, opts.subst,
                                           opts.pattern_opts));
    RuleSet set;
    set.add(std::move(rule));
    return Result<RuleSet>::ok(std::move(set));
}

} // namespace resub::cli
