#include <catch2/catch.hpp>
#include <resub/pattern.hpp>

using namespace resub;

static Pattern compile_ok(const std::string& text, PatternOptions opts = {}) {
    auto r = Pattern::compile(text, opts);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static std::optional<Match> search_ok(const Pattern& p, const std::string& s, size_t from) {
    auto r = p.search(s, from);
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("search reports span and captures", "[pattern]") {
    auto p = compile_ok("a(.*?)a");
    auto m = search_ok(p, "yyababaxxa", 0);
    REQUIRE(m);
    REQUIRE(m->start == 2);
    REQUIRE(m->end == 5);
    REQUIRE(m->captures == std::vector<std::string>{"b"});
}

TEST_CASE("search starts at the given offset", "[pattern]") {
    auto p = compile_ok("ab");
    auto m = search_ok(p, "ababab", 1);
    REQUIRE(m);
    REQUIRE(m->start == 2);
    REQUIRE(m->captures.empty());
}

TEST_CASE("search past the end finds nothing", "[pattern]") {
    auto p = compile_ok("a");
    REQUIRE_FALSE(search_ok(p, "aaa", 4));
    REQUIRE_FALSE(search_ok(p, "bbb", 0));
}

TEST_CASE("group_count", "[pattern]") {
    REQUIRE(compile_ok("ab").group_count() == 0);
    REQUIRE(compile_ok("(x)(y)").group_count() == 2);
    REQUIRE(compile_ok("(?:x)(y)").group_count() == 1);
}

TEST_CASE("non-participating group captures empty text", "[pattern]") {
    auto p = compile_ok("(a)|(b)");
    auto m = search_ok(p, "b", 0);
    REQUIRE(m);
    REQUIRE(m->captures == std::vector<std::string>{"", "b"});
}

TEST_CASE("text before the offset is context", "[pattern]") {
    auto behind = compile_ok("(?<=a)b");
    auto m = search_ok(behind, "ab", 1);
    REQUIRE(m);
    REQUIRE(m->start == 1);

    auto anchored = compile_ok("^b");
    REQUIRE_FALSE(search_ok(anchored, "ab", 1));

    auto word = compile_ok("\\bb");
    REQUIRE_FALSE(search_ok(word, "ab", 1));
}

TEST_CASE("dot does not match newline by default", "[pattern]") {
    REQUIRE_FALSE(search_ok(compile_ok("a.b"), "a\nb", 0));

    PatternOptions opts;
    opts.dotall = true;
    REQUIRE(search_ok(compile_ok("a.b", opts), "a\nb", 0));
}

TEST_CASE("caret anchors at string start unless multiline", "[pattern]") {
    REQUIRE_FALSE(search_ok(compile_ok("^b"), "a\nb", 0));

    PatternOptions opts;
    opts.multiline = true;
    auto m = search_ok(compile_ok("^b", opts), "a\nb", 0);
    REQUIRE(m);
    REQUIRE(m->start == 2);
}

TEST_CASE("icase", "[pattern]") {
    REQUIRE_FALSE(search_ok(compile_ok("abc"), "xABC", 0));

    PatternOptions opts;
    opts.icase = true;
    auto m = search_ok(compile_ok("abc", opts), "xABC", 0);
    REQUIRE(m);
    REQUIRE(m->start == 1);
}

TEST_CASE("zero-length matches", "[pattern]") {
    auto p = compile_ok("x*");
    auto m = search_ok(p, "ab", 0);
    REQUIRE(m);
    REQUIRE(m->empty());
    REQUIRE(m->start == 0);

    auto at_end = search_ok(p, "ab", 2);
    REQUIRE(at_end);
    REQUIRE(at_end->start == 2);
}

TEST_CASE("match_nonempty_at is anchored and non-empty", "[pattern]") {
    auto p = compile_ok("b*");
    auto r = p.match_nonempty_at("abb", 0);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());

    auto r2 = p.match_nonempty_at("abb", 1);
    REQUIRE(r2.is_ok());
    REQUIRE(r2.value());
    REQUIRE(r2.value()->start == 1);
    REQUIRE(r2.value()->end == 3);
}

TEST_CASE("invalid pattern is a Pattern error", "[pattern]") {
    auto r = Pattern::compile("a(b");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ResubError::Pattern);
    REQUIRE(r.error().message.find("a(b") != std::string::npos);
    REQUIRE(r.error().position != ResubError::npos);
}

TEST_CASE("pattern keeps its text and options", "[pattern]") {
    PatternOptions opts;
    opts.icase = true;
    auto p = compile_ok("(x)", opts);
    REQUIRE(p.text() == "(x)");
    REQUIRE(p.options().icase);
    REQUIRE_FALSE(p.options().dotall);
}
