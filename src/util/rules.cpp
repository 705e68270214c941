#include <resub/rules.hpp>
#include <resub/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace resub {

Result<Rule> Rule::make(std::string name,
                        const std::string& pattern,
                        const std::string& replacement,
                        SubstituteOptions options,
                        PatternOptions pattern_options) {
    Rule rule;
    rule.name = std::move(name);
    rule.options = options;
    RESUB_TRY_ASSIGN(rule.replacement, CompiledTemplate::compile(replacement));
    RESUB_TRY_ASSIGN(rule.pattern, Pattern::compile(pattern, pattern_options));
    return Result<Rule>::ok(std::move(rule));
}

void RuleSet::add(Rule rule) {
    rules_.push_back(std::move(rule));
}

Result<Substitution> RuleSet::apply(const std::string& source) const {
    Substitution total;
    total.text = source;
    for (const auto& rule : rules_) {
        auto step = substitute_counted(total.text, rule.pattern,
                                       rule.replacement, rule.options);
        if (step.is_err()) {
            ResubError e = std::move(step).error();
            e.message = "rule '" + rule.name + "': " + e.message;
            if (rule.line > 0 && e.line == 0) e.line = rule.line;
            return e;
        }
        log::debug("rule '%s' made %zu replacement(s)",
                   rule.name.c_str(), step.value().replacements);
        total.replacements += step.value().replacements;
        total.text = std::move(step.value().text);
    }
    return Result<Substitution>::ok(std::move(total));
}

// ---- TOML ----

namespace {

struct Flags {
    SubstituteOptions subst;
    PatternOptions pattern;
};

const char* const k_rule_keys[] = {
    "name", "pattern", "replacement", "global", "icase", "multiline", "dotall"
};

bool is_known_rule_key(const std::string& key) {
    for (const char* k : k_rule_keys) {
        if (key == k) return true;
    }
    return false;
}

int line_of(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

Status read_bool(const toml::table& tbl, const char* key,
                 const std::string& where, bool& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<bool>();
    if (!v) {
        ResubError e{ResubError::Config,
            where + ": '" + key + "' must be a boolean"};
        e.line = line_of(*node);
        return e;
    }
    out = *v;
    return ok_status();
}

Status read_flags(const toml::table& tbl, const std::string& where, Flags& flags) {
    RESUB_TRY(read_bool(tbl, "global", where, flags.subst.global));
    RESUB_TRY(read_bool(tbl, "icase", where, flags.pattern.icase));
    RESUB_TRY(read_bool(tbl, "multiline", where, flags.pattern.multiline));
    RESUB_TRY(read_bool(tbl, "dotall", where, flags.pattern.dotall));
    return ok_status();
}

Result<std::string> read_required_string(const toml::table& tbl, const char* key,
                                         const std::string& where, int line) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        ResubError e{ResubError::Config,
            where + ": missing required key '" + key + "'"};
        e.line = line;
        return e;
    }
    auto v = node->value<std::string>();
    if (!v) {
        ResubError e{ResubError::Config,
            where + ": '" + key + "' must be a string"};
        e.line = line_of(*node);
        return e;
    }
    return Result<std::string>::ok(std::move(*v));
}

Result<Rule> parse_rule(const toml::table& tbl, size_t index, const Flags& defaults) {
    std::string where = "rule #" + std::to_string(index + 1);
    int line = line_of(tbl);

    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (!is_known_rule_key(k)) {
            log::warn("%s (line %d): ignoring unknown key '%s'",
                      where.c_str(), line_of(val), k.c_str());
        }
    }

    std::string name = "rule-" + std::to_string(index + 1);
    if (const toml::node* n = tbl.get("name")) {
        auto v = n->value<std::string>();
        if (!v) {
            ResubError e{ResubError::Config, where + ": 'name' must be a string"};
            e.line = line_of(*n);
            return e;
        }
        name = std::move(*v);
    }

    RESUB_TRY_ASSIGN(std::string pattern, read_required_string(tbl, "pattern", where, line));
    RESUB_TRY_ASSIGN(std::string replacement,
                     read_required_string(tbl, "replacement", where, line));

    Flags flags = defaults;
    RESUB_TRY(read_flags(tbl, where, flags));

    auto rule = Rule::make(name, pattern, replacement, flags.subst, flags.pattern);
    if (rule.is_err()) {
        ResubError e = std::move(rule).error();
        e.message = "rule '" + name + "': " + e.message;
        e.line = line;
        return e;
    }
    rule.value().line = line;
    return rule;
}

} // anonymous namespace

Result<RuleSet> RuleSet::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        ResubError err{ResubError::Parse,
            std::string("rules TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        err.file = origin;
        return err;
    }

    Flags defaults;
    if (const toml::node* node = doc.get("defaults")) {
        const toml::table* tbl = node->as_table();
        if (!tbl) {
            ResubError e{ResubError::Config, "'defaults' must be a table"};
            e.line = line_of(*node);
            return Result<RuleSet>(std::move(e)).with_location(origin);
        }
        RESUB_TRY(read_flags(*tbl, "[defaults]", defaults).with_location(origin));
    }

    const toml::array* list = doc["rule"].as_array();
    if (!list || list->empty()) {
        ResubError e{ResubError::Config, "no [[rule]] entries found",
            "add at least one [[rule]] table with 'pattern' and 'replacement'"};
        return Result<RuleSet>(std::move(e)).with_location(origin);
    }

    RuleSet set;
    for (size_t i = 0; i < list->size(); ++i) {
        const toml::table* tbl = (*list)[i].as_table();
        if (!tbl) {
            ResubError e{ResubError::Config,
                "rule #" + std::to_string(i + 1) + " must be a table"};
            e.line = line_of((*list)[i]);
            return Result<RuleSet>(std::move(e)).with_location(origin);
        }
        RESUB_TRY_ASSIGN(Rule rule, parse_rule(*tbl, i, defaults).with_location(origin));
        set.add(std::move(rule));
    }

    log::debug("loaded %zu rule(s)%s%s", set.size(),
               origin.empty() ? "" : " from ", origin.c_str());
    return Result<RuleSet>::ok(std::move(set));
}

Result<RuleSet> RuleSet::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ResubError{ResubError::IO, "cannot open rules file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return RuleSet::parse(ss.str(), path);
}

} // namespace resub
