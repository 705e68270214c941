#include <catch2/catch.hpp>
#include <resub/result.hpp>
#include <memory>
#include <string>

using namespace resub;

static Result<int> parse_digit(char c) {
    if (c < '0' || c > '9') {
        return ResubError::at(ResubError::InvalidArg, "not a digit", 0);
    }
    return Result<int>::ok(c - '0');
}

static Result<int> sum_digits(const std::string& s) {
    int total = 0;
    for (char c : s) {
        RESUB_TRY_ASSIGN(int d, parse_digit(c));
        total += d;
    }
    return Result<int>::ok(total);
}

static Status check_digits(const std::string& s) {
    RESUB_TRY(sum_digits(s));
    return ok_status();
}

TEST_CASE("ok and err results", "[result]") {
    auto ok = Result<int>::ok(42);
    REQUIRE(ok.is_ok());
    REQUIRE(static_cast<bool>(ok));
    REQUIRE(ok.value() == 42);

    auto err = Result<int>::err(ResubError{ResubError::IO, "fail"});
    REQUIRE(err.is_err());
    REQUIRE_FALSE(static_cast<bool>(err));
    REQUIRE(err.error().code == ResubError::IO);
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);
}

TEST_CASE("RESUB_TRY_ASSIGN binds values and propagates errors", "[result]") {
    auto good = sum_digits("123");
    REQUIRE(good.is_ok());
    REQUIRE(good.value() == 6);

    auto bad = sum_digits("1x3");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().message == "not a digit");
}

TEST_CASE("RESUB_TRY propagates into Status", "[result]") {
    REQUIRE(check_digits("42").is_ok());
    auto s = check_digits("4?");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == ResubError::InvalidArg);
}

TEST_CASE("and_then chains fallible steps", "[result]") {
    auto doubled = parse_digit('4').and_then([](int d) {
        return Result<std::string>::ok(std::string(static_cast<size_t>(d), '*'));
    });
    REQUIRE(doubled.is_ok());
    REQUIRE(doubled.value() == "****");

    bool called = false;
    auto skipped = parse_digit('z').and_then([&](int d) {
        called = true;
        return Result<std::string>::ok(std::to_string(d));
    });
    REQUIRE_FALSE(called);
    REQUIRE(skipped.is_err());
    REQUIRE(skipped.error().code == ResubError::InvalidArg);

    auto failed = parse_digit('9').and_then([](int) { return parse_digit('?'); });
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message == "not a digit");
}

TEST_CASE("or_else recovers only from errors", "[result]") {
    auto kept = parse_digit('3').or_else([](const ResubError&) {
        return Result<int>::ok(-1);
    });
    REQUIRE(kept.value() == 3);

    auto recovered = parse_digit('x').or_else([](const ResubError& e) {
        REQUIRE(e.code == ResubError::InvalidArg);
        return Result<int>::ok(0);
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);

    auto relabelled = parse_digit('x').or_else([](const ResubError&) {
        return Result<int>::err(ResubError{ResubError::Config, "bad setting"});
    });
    REQUIRE(relabelled.is_err());
    REQUIRE(relabelled.error().code == ResubError::Config);
}

TEST_CASE("value_or", "[result]") {
    REQUIRE(parse_digit('7').value_or(-1) == 7);
    REQUIRE(parse_digit('z').value_or(-1) == -1);
}

TEST_CASE("map transforms ok and passes errors through", "[result]") {
    auto doubled = parse_digit('4').map([](int&& x) { return x * 2; });
    REQUIRE(doubled.value() == 8);

    bool called = false;
    auto skipped = parse_digit('q').map([&](int&& x) { called = true; return x; });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("with_location fills only missing context", "[result]") {
    auto r = Result<int>(ResubError{ResubError::Config, "bad"}).with_location("a.toml", 3);
    REQUIRE(r.error().file == "a.toml");
    REQUIRE(r.error().line == 3);

    ResubError pinned{ResubError::Config, "bad"};
    pinned.line = 9;
    auto kept = Result<int>(pinned).with_location("b.toml", 3);
    REQUIRE(kept.error().file == "b.toml");
    REQUIRE(kept.error().line == 9);

    auto fine = Result<int>::ok(1).with_location("c.toml");
    REQUIRE(fine.is_ok());
}

TEST_CASE("move-only values", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

// ===== ResubError =====

TEST_CASE("format with position, hint and location", "[error]") {
    ResubError e{ResubError::IllegalEscapeChar, "bad escape", "use \\\\"};
    e.position = 4;
    e.file = "rules.toml";
    e.line = 12;
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IllegalEscapeChar]: bad escape (at offset 4)") == 0);
    REQUIRE(formatted.find("hint: use \\\\") != std::string::npos);
    REQUIRE(formatted.find("--> rules.toml:12") != std::string::npos);
}

TEST_CASE("format without extras", "[error]") {
    ResubError e{ResubError::Pattern, "unbalanced"};
    REQUIRE(e.format() == "error[Pattern]: unbalanced");
}

TEST_CASE("illegal_escape and backref_out_of_range carry context", "[error]") {
    auto esc = ResubError::illegal_escape(0x263A, "\xE2\x98\xBA", 7);
    REQUIRE(esc.code == ResubError::IllegalEscapeChar);
    REQUIRE(esc.position == 7);
    REQUIRE(esc.message.find("U+263A") != std::string::npos);

    auto range = ResubError::backref_out_of_range(5, 1);
    REQUIRE(range.requested == 5);
    REQUIRE(range.available == 1);
    REQUIRE(range.message == "unknown backref $5; there are only 1 captures");
}

TEST_CASE("code_name for all codes", "[error]") {
    REQUIRE(std::string(ResubError::code_name(ResubError::TrailingEscape)) == "TrailingEscape");
    REQUIRE(std::string(ResubError::code_name(ResubError::IllegalEscapeChar)) == "IllegalEscapeChar");
    REQUIRE(std::string(ResubError::code_name(ResubError::MissingClosingBrace)) == "MissingClosingBrace");
    REQUIRE(std::string(ResubError::code_name(ResubError::InvalidBackrefSyntax)) == "InvalidBackrefSyntax");
    REQUIRE(std::string(ResubError::code_name(ResubError::BackrefOutOfRange)) == "BackrefOutOfRange");
    REQUIRE(std::string(ResubError::code_name(ResubError::Pattern)) == "Pattern");
    REQUIRE(std::string(ResubError::code_name(ResubError::IO)) == "IO");
    REQUIRE(std::string(ResubError::code_name(ResubError::Config)) == "Config");
    REQUIRE(std::string(ResubError::code_name(ResubError::Parse)) == "Parse");
    REQUIRE(std::string(ResubError::code_name(ResubError::InvalidArg)) == "InvalidArg");
}
