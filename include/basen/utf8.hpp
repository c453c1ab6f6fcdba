#pragma once

#include <string>
#include <string_view>

namespace basen {

// True for code points that can be written as UTF-8 (no surrogates, at most U+10FFFF).
bool is_scalar_value(char32_t cp) noexcept;

// Append the UTF-8 form of cp to out. cp must be a scalar value.
void append_utf8(std::string& out, char32_t cp);

std::string to_utf8(std::u32string_view text);

// Decode UTF-8 into code points; throws InvalidInput at the first malformed sequence.
std::u32string from_utf8(std::string_view text);

}  // namespace basen
