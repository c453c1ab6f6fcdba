#include "basen/errors.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace basen {

std::string describe_symbol(char32_t symbol) {
    std::ostringstream out;
    if (symbol >= 0x20 && symbol < 0x7F) {
        out << '\'' << static_cast<char>(symbol) << "' ";
    }
    out << "(U+" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
        << static_cast<std::uint32_t>(symbol) << ')';
    return out.str();
}

}  // namespace basen
