#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Pre-defined alphabets. Every alphabet ends with its padding symbol.
namespace basen::alphabets {

// RFC 4648 alphabets.
inline constexpr std::string_view kBase16 = "0123456789ABCDEF=";
inline constexpr std::string_view kBase32 = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567=";
inline constexpr std::string_view kBase32Hex = "0123456789ABCDEFGHIJKLMNOPQRSTUV=";
inline constexpr std::string_view kBase64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";
inline constexpr std::string_view kBase64Url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_=";

inline constexpr std::string_view kBase8 = "01234567=";
inline constexpr std::string_view kBase4 = "0123=";

// count consecutive code points starting at first, followed by padding.
std::u32string contiguous(char32_t first, std::size_t count, char32_t padding = U'=');

// U+0100..U+01FF (Latin Extended-A and -B).
std::u32string base256();

// U+3400..U+37FF (CJK Unified Ideographs Extension A).
std::u32string base1024();

// U+4E00..U+5DFF (CJK Unified Ideographs).
std::u32string base4096();

// Alphabet registered under name (e.g. "base64"), or nullopt.
std::optional<std::u32string> find(std::string_view name);

std::vector<std::string> names();

}  // namespace basen::alphabets
