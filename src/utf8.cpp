#include "basen/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

#include "basen/errors.hpp"

namespace basen {

namespace {

[[noreturn]] void malformed(std::size_t offset) {
    throw InvalidInput("Malformed UTF-8 sequence at byte " + std::to_string(offset), offset);
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0U) == 0x80U;
}

}  // namespace

bool is_scalar_value(char32_t cp) noexcept {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string to_utf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        append_utf8(out, cp);
    }
    return out;
}

std::u32string from_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0U) == 0xC0U) {
            length = 2;
            cp = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0U) {
            length = 3;
            cp = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0U) {
            length = 4;
            cp = lead & 0x07U;
        } else {
            malformed(i);
        }
        if (i + length > text.size()) {
            malformed(i);
        }
        for (std::size_t j = 1; j < length; ++j) {
            const unsigned char byte = static_cast<unsigned char>(text[i + j]);
            if (!is_continuation(byte)) {
                malformed(i);
            }
            cp = (cp << 6) | (byte & 0x3FU);
        }
        // Reject overlong forms, surrogates and values past U+10FFFF.
        const char32_t minimum = length == 2 ? 0x80 : (length == 3 ? 0x800 : 0x10000);
        if (cp < minimum || !is_scalar_value(cp)) {
            malformed(i);
        }
        out.push_back(cp);
        i += length;
    }
    return out;
}

}  // namespace basen
