#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "basen/errors.hpp"

namespace basen {

// Symbol counts produced by encoding a given number of bytes.
struct Layout {
    std::size_t data_symbols{0};
    std::size_t padding_symbols{0};

    std::size_t total() const noexcept { return data_symbols + padding_symbols; }

    bool operator==(const Layout& other) const noexcept {
        return data_symbols == other.data_symbols && padding_symbols == other.padding_symbols;
    }
    bool operator!=(const Layout& other) const noexcept { return !(*this == other); }
};

// Base-N codec over a power-of-two alphabet whose last symbol is the padding symbol.
//
// Input bits are regrouped MSB-first into k-bit values, k = log2(N), each written as one data
// symbol. Output is padded to a whole block of L = lcm(k, 8) / k symbols, so Base64, Base32
// and Base16 alphabets produce the RFC 4648 encodings. Immutable after construction.
class Codec {
public:
    // alphabet holds the N data symbols followed by the padding symbol.
    explicit Codec(std::u32string alphabet, std::optional<char32_t> separator = std::nullopt);

    // UTF-8 overload. An empty separator means none; otherwise it must be one code point.
    explicit Codec(std::string_view alphabet, std::string_view separator = {});

    std::string encode(const std::uint8_t* data, std::size_t size) const;
    std::string encode(const std::vector<std::uint8_t>& data) const;
    std::string encode(std::string_view data) const;

    std::vector<std::uint8_t> decode(std::string_view text) const;

    // Data and padding symbol counts for an input of the given size.
    Layout layout(std::size_t bytes) const noexcept;

    // Number of code points encode() emits for an input of the given size, separators included.
    std::size_t encoded_length(std::size_t bytes) const noexcept;

    std::size_t bits_per_symbol() const noexcept { return bits_per_symbol_; }
    std::size_t block_symbols() const noexcept { return block_symbols_; }
    std::size_t block_bytes() const noexcept { return block_bytes_; }
    std::size_t data_symbol_count() const noexcept { return symbols_.size(); }
    char32_t padding() const noexcept { return padding_; }
    std::optional<char32_t> separator() const noexcept { return separator_; }

    // True for data symbols and the padding symbol.
    bool is_symbol(char32_t cp) const;

private:
    // stride maps a symbol index back to its code point position in the text.
    std::vector<std::uint8_t> decode_symbols(const std::u32string& symbols, std::size_t stride) const;

    std::u32string symbols_;
    char32_t padding_{0};
    std::optional<char32_t> separator_;
    std::unordered_map<char32_t, std::uint32_t> values_;
    std::size_t bits_per_symbol_{0};
    std::size_t block_symbols_{0};
    std::size_t block_bytes_{0};
};

}  // namespace basen
