#include "WordFormat.hpp"

#include <iomanip>
#include <sstream>

namespace vmem {

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) oss << ' ';
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string format_address(std::size_t address) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << address;
    return oss.str();
}

} // namespace vmem
