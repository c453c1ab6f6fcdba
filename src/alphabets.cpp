#include "basen/alphabets.hpp"

#include "basen/utf8.hpp"

namespace basen::alphabets {

namespace {

struct Entry {
    const char* name;
    std::u32string (*make)();
};

const Entry kEntries[] = {
    {"base4", [] { return from_utf8(kBase4); }},
    {"base8", [] { return from_utf8(kBase8); }},
    {"base16", [] { return from_utf8(kBase16); }},
    {"base32", [] { return from_utf8(kBase32); }},
    {"base32hex", [] { return from_utf8(kBase32Hex); }},
    {"base64", [] { return from_utf8(kBase64); }},
    {"base64url", [] { return from_utf8(kBase64Url); }},
    {"base256", &base256},
    {"base1024", &base1024},
    {"base4096", &base4096},
};

}  // namespace

std::u32string contiguous(char32_t first, std::size_t count, char32_t padding) {
    std::u32string out;
    out.reserve(count + 1);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(static_cast<char32_t>(first + i));
    }
    out.push_back(padding);
    return out;
}

std::u32string base256() {
    return contiguous(U'\u0100', 256);
}

std::u32string base1024() {
    return contiguous(U'\u3400', 1024);
}

std::u32string base4096() {
    return contiguous(U'\u4E00', 4096);
}

std::optional<std::u32string> find(std::string_view name) {
    for (const Entry& entry : kEntries) {
        if (name == entry.name) {
            return entry.make();
        }
    }
    return std::nullopt;
}

std::vector<std::string> names() {
    std::vector<std::string> out;
    for (const Entry& entry : kEntries) {
        out.emplace_back(entry.name);
    }
    return out;
}

}  // namespace basen::alphabets
