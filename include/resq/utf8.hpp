#pragma once

#include <cstddef>
#include <string>

namespace resq {

// Text columns are UTF8 on the server; anything sent as $n::TEXT must be valid.

bool is_valid_utf8(const std::string& text);

// Replaces every invalid or incomplete sequence, and NUL, with U+FFFD
std::string sanitize_utf8(const std::string& text);

// At most max_bytes from the front or back of valid UTF-8 text, never
// splitting a character
std::string utf8_prefix(const std::string& text, size_t max_bytes);
std::string utf8_suffix(const std::string& text, size_t max_bytes);

inline bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace resq
