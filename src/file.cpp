#include "basen/file.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace basen {

namespace {

bool is_standard_stream(const std::string& path) {
    return path.empty() || path == "-";
}

std::string read_all(const std::string& input_path) {
    if (is_standard_stream(input_path)) {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(input_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open input file: " + input_path);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Failed to read input file: " + input_path);
    }
    return data;
}

void write_all(const std::string& output_path, const char* data, std::size_t size) {
    if (is_standard_stream(output_path)) {
        std::cout.write(data, static_cast<std::streamsize>(size));
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Failed to write to stdout");
        }
        return;
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + output_path);
    }
}

}  // namespace

void encode_file(const std::string& input_path, const std::string& output_path, const Codec& codec) {
    const std::string data = read_all(input_path);
    const std::string encoded = codec.encode(std::string_view(data));
    write_all(output_path, encoded.data(), encoded.size());
}

void decode_file(const std::string& input_path, const std::string& output_path, const Codec& codec) {
    std::string text = read_all(input_path);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r') &&
           !codec.is_symbol(static_cast<char32_t>(text.back())) &&
           codec.separator() != static_cast<char32_t>(text.back())) {
        text.pop_back();
    }
    const std::vector<std::uint8_t> decoded = codec.decode(text);
    write_all(output_path, reinterpret_cast<const char*>(decoded.data()), decoded.size());
}

}  // namespace basen
