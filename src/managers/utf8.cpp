#include "resq/utf8.hpp"

namespace resq {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at pos, 0 if there is none
size_t sequence_length(const std::string& text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead == 0) return 0;
    if (lead < 0x80) return 1;

    size_t length;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        low = 0xA0;
    } else if (lead == 0xED) {
        length = 3;
        high = 0x9F;    // UTF-16 surrogates
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        length = 3;
    } else if (lead == 0xF0) {
        length = 4;
        low = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        high = 0x8F;    // above U+10FFFF
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    unsigned char second = static_cast<unsigned char>(text[pos + 1]);
    if (second < low || second > high) return 0;
    for (size_t i = 2; i < length; ++i) {
        if (!is_utf8_continuation(text[pos + i])) return 0;
    }
    return length;
}

} // namespace

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = sequence_length(text, pos);
        if (length == 0) return false;
        pos += length;
    }
    return true;
}

std::string sanitize_utf8(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = sequence_length(text, pos);
        if (length == 0) {
            result += kReplacement;
            pos++;
        } else {
            result.append(text, pos, length);
            pos += length;
        }
    }
    return result;
}

std::string utf8_prefix(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    while (cut > 0 && is_utf8_continuation(text[cut])) {
        cut--;
    }
    return text.substr(0, cut);
}

std::string utf8_suffix(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = text.size() - max_bytes;
    while (cut < text.size() && is_utf8_continuation(text[cut])) {
        cut++;
    }
    return text.substr(cut);
}

} // namespace resq
