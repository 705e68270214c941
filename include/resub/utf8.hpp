#pragma once

#include <string>

namespace resub::utf8 {

// Decode one UTF-8 sequence at `pos`, storing its byte length in `len`.
// Malformed or truncated input yields the raw lead byte with len = 1.
char32_t decode(const std::string& s, size_t pos, size_t& len);

// Byte length of the sequence starting at `pos` (1 for malformed input,
// 0 at or past the end).
size_t sequence_length(const std::string& s, size_t pos);

} // namespace resub::utf8
