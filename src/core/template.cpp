#include <resub/template.hpp>
#include <resub/log.hpp>
#include <resub/utf8.hpp>
#include <limits>

namespace resub {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

struct TemplateParser {
    const std::string& input;
    size_t pos = 0;
    std::vector<Segment> segments;

    explicit TemplateParser(const std::string& s) : input(s) {}

    bool at_end() const { return pos >= input.size(); }
    char peek() const { return input[pos]; }

    void push_literal(const std::string& text) {
        if (!segments.empty()) {
            if (auto* lit = std::get_if<Literal>(&segments.back())) {
                lit->text += text;
                return;
            }
        }
        segments.push_back(Literal{text});
    }

    void push_literal(char c) {
        push_literal(std::string(1, c));
    }

    // [1-9][0-9]* at the cursor; returns 0 and leaves pos alone if absent.
    size_t read_group_number() {
        if (at_end() || peek() < '1' || peek() > '9') {
            return 0;
        }
        // Numbers past size_t saturate; no pattern has that many groups, so
        // render reports them as out of range.
        constexpr size_t limit = std::numeric_limits<size_t>::max();
        size_t n = 0;
        while (!at_end() && is_digit(peek())) {
            size_t digit = static_cast<size_t>(peek() - '0');
            if (n > (limit - digit) / 10) {
                n = limit;
            } else {
                n = n * 10 + digit;
            }
            ++pos;
        }
        return n;
    }

    void parse_literal_run() {
        size_t start = pos;
        while (!at_end() && peek() != '$' && peek() != '\\') ++pos;
        push_literal(input.substr(start, pos - start));
    }

    Status parse_escape() {
        size_t backslash = pos++;
        if (at_end()) {
            return ResubError::at(ResubError::TrailingEscape,
                "illegal trailing backslash", backslash);
        }
        char c = peek();
        if (c == '$' || c == '\\') {
            ++pos;
            push_literal(c);
            return ok_status();
        }
        size_t len = 1;
        char32_t cp = utf8::decode(input, pos, len);
        return ResubError::illegal_escape(cp, input.substr(pos, len), pos);
    }

    Status parse_backref() {
        size_t dollar = pos++;

        if (!at_end() && peek() == '{') {
            ++pos;
            size_t n = read_group_number();
            if (n == 0) {
                return ResubError::at(ResubError::InvalidBackrefSyntax,
                    "expected ${123} style numeric identifier inside ${...}", pos);
            }
            if (at_end() || peek() != '}') {
                ResubError e = ResubError::at(ResubError::MissingClosingBrace,
                    "expected closing curly brace for ${" + std::to_string(n) +
                        "} identifier",
                    pos);
                e.hint = "a '{' after '$' must be closed by '}'";
                return e;
            }
            ++pos;
            segments.push_back(BackrefIndex{n - 1});
            return ok_status();
        }

        size_t n = read_group_number();
        if (n == 0) {
            ResubError e = ResubError::at(ResubError::InvalidBackrefSyntax,
                "expected $123 or ${123} style number after dollar sign", dollar);
            e.hint = "write '\\$' for a literal dollar sign";
            return e;
        }
        segments.push_back(BackrefIndex{n - 1});
        return ok_status();
    }

    Status parse() {
        while (!at_end()) {
            switch (peek()) {
            case '\\':
                RESUB_TRY(parse_escape());
                break;
            case '$':
                RESUB_TRY(parse_backref());
                break;
            default:
                parse_literal_run();
                break;
            }
        }
        return ok_status();
    }
};

void escape_into(std::string& out, const std::string& text) {
    for (char c : text) {
        if (c == '$' || c == '\\') out += '\\';
        out += c;
    }
}

} // anonymous namespace

Result<CompiledTemplate> CompiledTemplate::compile(const std::string& text) {
    TemplateParser parser(text);
    RESUB_TRY(parser.parse());

    CompiledTemplate tpl;
    tpl.segments_ = std::move(parser.segments);
    log::trace("compiled template '%s' into %zu segment(s)",
               text.c_str(), tpl.segments_.size());
    return Result<CompiledTemplate>::ok(std::move(tpl));
}

Status CompiledTemplate::render_into(std::string& out,
                                     const std::vector<std::string>& captures) const {
    size_t mark = out.size();
    for (const auto& seg : segments_) {
        if (const auto* lit = std::get_if<Literal>(&seg)) {
            out += lit->text;
            continue;
        }
        size_t i = std::get<BackrefIndex>(seg).index;
        if (i >= captures.size()) {
            out.resize(mark);
            return ResubError::backref_out_of_range(i + 1, captures.size());
        }
        out += captures[i];
    }
    return ok_status();
}

Result<std::string> CompiledTemplate::render(const std::vector<std::string>& captures) const {
    std::string buffer;
    RESUB_TRY(render_into(buffer, captures));
    return Result<std::string>::ok(std::move(buffer));
}

size_t CompiledTemplate::max_backref() const {
    size_t highest = 0;
    for (const auto& seg : segments_) {
        if (const auto* ref = std::get_if<BackrefIndex>(&seg)) {
            if (ref->index + 1 > highest) highest = ref->index + 1;
        }
    }
    return highest;
}

std::string CompiledTemplate::to_string() const {
    std::string out;
    for (const auto& seg : segments_) {
        if (const auto* lit = std::get_if<Literal>(&seg)) {
            escape_into(out, lit->text);
        } else {
            out += "${";
            out += std::to_string(std::get<BackrefIndex>(seg).index + 1);
            out += "}";
        }
    }
    return out;
}

} // namespace resub
