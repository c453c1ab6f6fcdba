#pragma once

#include <string>

#include "basen/codec.hpp"

namespace basen {

// Paths that are empty or "-" refer to stdin/stdout.

// Encode the whole input file to the output file.
void encode_file(const std::string& input_path, const std::string& output_path, const Codec& codec);

// Decode the whole input file to the output file. Trailing CR/LF that are not symbols of the
// codec are ignored.
void decode_file(const std::string& input_path, const std::string& output_path, const Codec& codec);

}  // namespace basen
