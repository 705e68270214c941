// demo_cases.cpp
//
// Runs a handful of substitutions and prints each case with its outcome,
// followed by the templates that are rejected and why. Run it with:
//
//     ./demo_cases            # summary only
//     RESUB_LOG=trace ./demo_cases   # also shows compile/match tracing
//
// Exit status is the number of cases whose result differed from expected.

#include <resub/log.hpp>
#include <resub/substitute.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace resub;

struct Case {
    std::string source;
    std::string pattern;
    std::string replacement;
    std::string expected;
    bool global = true;
};

static const std::vector<Case> k_cases = {
    {"aba",        "a(.*?)a", "$1",      "b"},
    {"ababab",     "ab",      "x",       "xxx"},
    {"ababab",     "ab",      "x",       "xabab", false},
    {"ababab",     "(ab)",    "$1x",     "abxabxabx"},
    {"yyababaxxa", "a(.*?)a", "$1",      "yybbxx"},
    {"acccb",      "a(.*?)b", "$1\\$",   "ccc$"},
    {"abxybaxy",   "(x)(y)",  "${2}3$1", "aby3xbay3x"},
};

static const std::vector<std::string> k_bad_templates = {
    "ab\\", "ab\\q", "${2ab", "${x}", "$", "$0",
};

int main() {
    if (!log::init_from_env()) {
        log::warn("ignoring unrecognized RESUB_LOG value");
    }

    int failed = 0;
    for (size_t i = 0; i < k_cases.size(); ++i) {
        const Case& c = k_cases[i];
        SubstituteOptions opts;
        opts.global = c.global;

        std::cout << "Case " << (i + 1) << "\n--------\n"
                  << "String:      '" << c.source << "'\n"
                  << "Pattern:     /" << c.pattern << "/" << (c.global ? "g" : "") << "\n"
                  << "Replacement: '" << c.replacement << "'\n"
                  << "Expected:    '" << c.expected << "'\n";

        auto r = substitute(c.source, c.pattern, c.replacement, opts);
        if (r.is_err()) {
            std::cout << r.error().format() << "\n";
            ++failed;
        } else {
            bool pass = r.value() == c.expected;
            std::cout << "Result:      '" << r.value() << "' ("
                      << (pass ? "passed" : "failed") << ")\n";
            if (!pass) ++failed;
        }
        std::cout << "\n";
    }

    std::cout << "Rejected templates\n------------------\n";
    for (const auto& tpl : k_bad_templates) {
        auto r = CompiledTemplate::compile(tpl);
        std::cout << "'" << tpl << "' -> "
                  << (r.is_err() ? r.error().format() : std::string("accepted?!"))
                  << "\n";
    }

    return failed;
}
