#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace basen {

// Thrown by Codec construction when the alphabet or separator is unusable.
class InvalidAlphabet : public std::invalid_argument {
public:
    explicit InvalidAlphabet(const std::string& what) : std::invalid_argument(what) {}
};

// Thrown when encoded text cannot be decoded. position() is the index of the offending
// code point, or the byte offset for malformed UTF-8.
class InvalidInput : public std::runtime_error {
public:
    InvalidInput(const std::string& what, std::size_t position)
        : std::runtime_error(what), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// Format a code point as U+XXXX for error messages.
std::string describe_symbol(char32_t symbol);

}  // namespace basen
