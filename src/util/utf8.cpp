#include <resub/utf8.hpp>

namespace resub::utf8 {

char32_t decode(const std::string& s, size_t pos, size_t& len) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char lead = byte(pos);

    size_t need;
    char32_t cp;
    if (lead < 0x80)                { len = 1; return lead; }
    else if ((lead & 0xE0) == 0xC0) { need = 1; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { need = 2; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { need = 3; cp = lead & 0x07; }
    else                            { len = 1; return lead; }

    if (pos + need >= s.size()) {
        len = 1;
        return lead;
    }
    for (size_t i = 1; i <= need; ++i) {
        unsigned char c = byte(pos + i);
        if ((c & 0xC0) != 0x80) { len = 1; return lead; }
        cp = (cp << 6) | (c & 0x3F);
    }
    len = need + 1;
    return cp;
}

size_t sequence_length(const std::string& s, size_t pos) {
    if (pos >= s.size()) return 0;
    size_t len = 1;
    decode(s, pos, len);
    return len;
}

} // namespace resub::utf8
