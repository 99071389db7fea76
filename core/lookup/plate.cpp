#include "plate.hpp"

#include <cctype>

namespace vrm {
namespace lookup {

namespace {

/**
 * Decode the UTF-8 sequence starting at pos into cp and return its length
 * in bytes. A malformed or truncated sequence decodes as its first byte
 * with length 1, so arbitrary input is passed through unchanged.
 */
size_t decode_utf8(const std::string &text, size_t pos, char32_t &cp) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    size_t length = 1;
    char32_t value = lead;

    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        value = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        value = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        value = lead & 0x07;
    }

    if (length == 1 || pos + length > text.size()) {
        cp = lead;
        return 1;
    }

    for (size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            cp = lead;
            return 1;
        }
        value = (value << 6) | (byte & 0x3F);
    }

    cp = value;
    return length;
}

}  // namespace

bool is_whitespace(char32_t cp) {
    // ASCII controls 0x09-0x0D and 0x1C-0x1F, plus the Unicode White_Space set
    if (cp < 0x80) {
        return cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F);
    }
    switch (cp) {
        case 0x0085:
        case 0x00A0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_plate_separator(char32_t cp) { return cp == '-' || is_whitespace(cp); }

std::string trim(const std::string &raw) {
    size_t begin = raw.size();
    size_t end = 0;

    size_t pos = 0;
    while (pos < raw.size()) {
        char32_t cp = 0;
        const size_t length = decode_utf8(raw, pos, cp);
        if (!is_whitespace(cp)) {
            if (begin == raw.size()) {
                begin = pos;
            }
            end = pos + length;
        }
        pos += length;
    }

    if (begin >= end) {
        return std::string();
    }
    return raw.substr(begin, end - begin);
}

std::string normalize_plate(const std::string &plate) {
    std::string normalized;
    normalized.reserve(plate.size());

    size_t pos = 0;
    while (pos < plate.size()) {
        char32_t cp = 0;
        const size_t length = decode_utf8(plate, pos, cp);
        if (!is_plate_separator(cp)) {
            if (length == 1) {
                normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(plate[pos]))));
            } else {
                normalized.append(plate, pos, length);
            }
        }
        pos += length;
    }
    return normalized;
}

}  // namespace lookup
}  // namespace vrm
