#pragma once

#include <string>
#include <vector>

#include "basen/codec.hpp"

namespace basen {

enum class Mode { Encode, Decode, List };

struct Options {
    Mode mode{Mode::Encode};
    std::string input_path;
    std::string output_path;
    std::string alphabet{"base64"};
    std::string charset;
    std::string separator;
    bool alphabet_provided{false};
    bool charset_provided{false};
};

// Parse CLI arguments; throws std::runtime_error on invalid usage.
Options parse_args(const std::vector<std::string>& args);

// Build the codec selected by --alphabet or --charset and --separator.
Codec make_codec(const Options& options);

}  // namespace basen
