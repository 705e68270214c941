// resub: apply user-supplied regex substitutions to a file or stdin.

#include <resub/cli.hpp>
#include <resub/log.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace resub;

static Result<std::string> read_input(const std::string& path) {
    if (path == "-") {
        std::ostringstream buf;
        buf << std::cin.rdbuf();
        return Result<std::string>::ok(buf.str());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ResubError{ResubError::IO, "cannot open input file: " + path,
                          "check the path and file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

static Result<Substitution> run(const cli::Options& opts) {
    if (opts.log_level) {
        RESUB_TRY_ASSIGN(log::Level lvl, log::parse_level(*opts.log_level));
        log::set_level(lvl);
    }

    // Rules are compiled before the input is read, so bad templates fail fast
    RESUB_TRY_ASSIGN(RuleSet rules, cli::build_rules(opts));
    RESUB_TRY_ASSIGN(std::string input, read_input(opts.input));

    log::debug("read %zu bytes from %s", input.size(),
               opts.input == "-" ? "stdin" : opts.input.c_str());
    return rules.apply(input);
}

int main(int argc, char** argv) {
    if (!log::init_from_env()) {
        log::warn("ignoring unrecognized RESUB_LOG value");
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    auto opts = cli::parse_args(args);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }
    if (opts.value().show_help) {
        std::cout << cli::usage();
        return 0;
    }

    auto result = run(opts.value());
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }

    std::cout << result.value().text;
    std::cout.flush();
    if (opts.value().print_count) {
        std::cerr << result.value().replacements << " replacement(s)\n";
    }
    return std::cout.good() ? 0 : 1;
}
