#include "basen/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "basen/utf8.hpp"

namespace basen {

namespace {

constexpr std::size_t kByteBits = 8;

std::size_t log2_floor(std::size_t n) {
    std::size_t p = 0;
    while ((static_cast<std::size_t>(1) << (p + 1)) <= n) {
        ++p;
    }
    return p;
}

std::u32string alphabet_from_utf8(std::string_view alphabet) {
    try {
        return from_utf8(alphabet);
    } catch (const InvalidInput& ex) {
        throw InvalidAlphabet(std::string("Alphabet is not valid UTF-8: ") + ex.what());
    }
}

std::optional<char32_t> separator_from_utf8(std::string_view separator) {
    if (separator.empty()) {
        return std::nullopt;
    }
    std::u32string decoded;
    try {
        decoded = from_utf8(separator);
    } catch (const InvalidInput& ex) {
        throw InvalidAlphabet(std::string("Separator is not valid UTF-8: ") + ex.what());
    }
    if (decoded.size() != 1) {
        throw InvalidAlphabet("Separator must be a single symbol, got " +
                              std::to_string(decoded.size()));
    }
    return decoded.front();
}

}  // namespace

Codec::Codec(std::u32string alphabet, std::optional<char32_t> separator)
    : separator_(separator) {
    if (alphabet.size() < 3) {
        throw InvalidAlphabet("Alphabet must contain at least 2 data symbols and a padding symbol");
    }
    const std::size_t count = alphabet.size() - 1;
    if ((count & (count - 1)) != 0) {
        throw InvalidAlphabet("Alphabet length (excluding padding) must be a power of 2, got " +
                              std::to_string(count));
    }

    std::unordered_map<char32_t, std::size_t> seen;
    seen.reserve(alphabet.size());
    for (std::size_t i = 0; i < alphabet.size(); ++i) {
        const char32_t symbol = alphabet[i];
        if (!is_scalar_value(symbol)) {
            throw InvalidAlphabet("Alphabet symbol " + describe_symbol(symbol) + " at index " +
                                  std::to_string(i) + " is not a Unicode scalar value");
        }
        auto inserted = seen.emplace(symbol, i);
        if (!inserted.second) {
            throw InvalidAlphabet("Alphabet contains duplicate symbol " + describe_symbol(symbol) +
                                  " at indices " + std::to_string(inserted.first->second) +
                                  " and " + std::to_string(i));
        }
    }
    if (separator_) {
        if (!is_scalar_value(*separator_)) {
            throw InvalidAlphabet("Separator " + describe_symbol(*separator_) +
                                  " is not a Unicode scalar value");
        }
        if (seen.count(*separator_) != 0) {
            throw InvalidAlphabet("Separator " + describe_symbol(*separator_) +
                                  " is also an alphabet symbol");
        }
    }

    padding_ = alphabet.back();
    alphabet.pop_back();
    symbols_ = std::move(alphabet);

    values_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values_.emplace(symbols_[i], static_cast<std::uint32_t>(i));
    }

    bits_per_symbol_ = log2_floor(count);
    const std::size_t group_bits = std::lcm(bits_per_symbol_, kByteBits);
    block_symbols_ = group_bits / bits_per_symbol_;
    block_bytes_ = group_bits / kByteBits;
}

Codec::Codec(std::string_view alphabet, std::string_view separator)
    : Codec(alphabet_from_utf8(alphabet), separator_from_utf8(separator)) {}

Layout Codec::layout(std::size_t bytes) const noexcept {
    Layout out;
    if (bytes == 0) {
        return out;
    }
    const std::size_t k = bits_per_symbol_;
    const std::size_t bits = bytes * kByteBits;
    out.data_symbols = (bits + k - 1) / k;

    const std::size_t tail = out.data_symbols % block_symbols_;
    out.padding_symbols = tail == 0 ? 0 : block_symbols_ - tail;

    // Wider than a byte, the zero-extension of the last group can hide whole bytes. Each one is
    // marked by an extra block of padding so the decoder can recover the exact length.
    const std::size_t extension_bits = out.data_symbols * k - bits;
    out.padding_symbols += (extension_bits / kByteBits) * block_symbols_;
    return out;
}

std::size_t Codec::encoded_length(std::size_t bytes) const noexcept {
    const std::size_t symbols = layout(bytes).total();
    if (separator_ && symbols > 0) {
        return symbols * 2 - 1;
    }
    return symbols;
}

bool Codec::is_symbol(char32_t cp) const {
    return cp == padding_ || values_.count(cp) != 0;
}

std::string Codec::encode(const std::uint8_t* data, std::size_t size) const {
    std::string text;
    if (size == 0) {
        return text;
    }
    const Layout shape = layout(size);
    text.reserve(encoded_length(size));

    std::size_t emitted = 0;
    auto emit = [&](char32_t symbol) {
        if (separator_ && emitted > 0) {
            append_utf8(text, *separator_);
        }
        append_utf8(text, symbol);
        ++emitted;
    };

    const std::size_t k = bits_per_symbol_;
    const std::uint64_t mask = (static_cast<std::uint64_t>(1) << k) - 1;
    std::uint64_t acc = 0;
    std::size_t acc_bits = 0;
    for (std::size_t i = 0; i < size; ++i) {
        acc = (acc << kByteBits) | data[i];
        acc_bits += kByteBits;
        while (acc_bits >= k) {
            acc_bits -= k;
            emit(symbols_[static_cast<std::size_t>((acc >> acc_bits) & mask)]);
        }
        acc &= (static_cast<std::uint64_t>(1) << acc_bits) - 1;
    }
    if (acc_bits > 0) {
        emit(symbols_[static_cast<std::size_t>((acc << (k - acc_bits)) & mask)]);
    }
    for (std::size_t i = 0; i < shape.padding_symbols; ++i) {
        emit(padding_);
    }
    return text;
}

std::string Codec::encode(const std::vector<std::uint8_t>& data) const {
    return encode(data.data(), data.size());
}

std::string Codec::encode(std::string_view data) const {
    return encode(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::vector<std::uint8_t> Codec::decode(std::string_view text) const {
    if (text.empty()) {
        return {};
    }
    const std::u32string decoded = from_utf8(text);
    if (!separator_) {
        return decode_symbols(decoded, 1);
    }

    // Symbols sit at even positions and separators at odd ones.
    std::u32string symbols;
    symbols.reserve(decoded.size() / 2 + 1);
    for (std::size_t i = 0; i < decoded.size(); ++i) {
        const bool at_separator = decoded[i] == *separator_;
        if (i % 2 == 1) {
            if (!at_separator) {
                throw InvalidInput("Expected separator " + describe_symbol(*separator_) +
                                   " at position " + std::to_string(i) + ", found " +
                                   describe_symbol(decoded[i]), i);
            }
        } else if (at_separator) {
            throw InvalidInput("Unexpected separator at position " + std::to_string(i), i);
        } else {
            symbols.push_back(decoded[i]);
        }
    }
    if (decoded.size() % 2 == 0) {
        throw InvalidInput("Encoded text ends with a separator", decoded.size() - 1);
    }
    return decode_symbols(symbols, 2);
}

std::vector<std::uint8_t> Codec::decode_symbols(const std::u32string& symbols,
                                                std::size_t stride) const {
    const std::size_t k = bits_per_symbol_;
    std::vector<std::uint8_t> out;
    out.reserve(symbols.size() * k / kByteBits + 1);

    std::size_t data_count = 0;
    std::size_t pad_count = 0;
    std::uint64_t acc = 0;
    std::size_t acc_bits = 0;
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        const char32_t symbol = symbols[i];
        if (symbol == padding_) {
            ++pad_count;
            continue;
        }
        auto it = values_.find(symbol);
        if (it == values_.end()) {
            throw InvalidInput("Invalid symbol " + describe_symbol(symbol) + " at position " +
                               std::to_string(i * stride), i * stride);
        }
        if (pad_count > 0) {
            throw InvalidInput("Data symbol after padding at position " +
                               std::to_string(i * stride), i * stride);
        }
        ++data_count;
        acc = (acc << k) | it->second;
        acc_bits += k;
        while (acc_bits >= kByteBits) {
            acc_bits -= kByteBits;
            out.push_back(static_cast<std::uint8_t>(acc >> acc_bits));
        }
        acc &= (static_cast<std::uint64_t>(1) << acc_bits) - 1;
    }

    // The symbol counts must be exactly what encode() emits for the recovered length.
    const std::size_t whole_bytes = out.size();
    const std::size_t hidden_bytes = pad_count / block_symbols_;
    if (hidden_bytes > whole_bytes ||
        layout(whole_bytes - hidden_bytes) != Layout{data_count, pad_count}) {
        throw InvalidInput("Encoded text has " + std::to_string(data_count) +
                           " data symbols and " + std::to_string(pad_count) +
                           " padding symbols, which does not describe a whole number of bytes",
                           data_count * stride);
    }
    out.resize(whole_bytes - hidden_bytes);
    return out;
}

}  // namespace basen
