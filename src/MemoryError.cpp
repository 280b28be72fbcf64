#include "MemoryError.hpp"

#include <sstream>

namespace vmem {

AddressOutOfBounds::AddressOutOfBounds(std::size_t address, std::size_t length)
    : std::out_of_range(describe(address, length)), address_(address), length_(length) {}

std::string AddressOutOfBounds::describe(std::size_t address, std::size_t length) {
    std::ostringstream oss;
    oss << "address 0x" << std::hex << address
        << " is out of bounds (length 0x" << length << ")";
    return oss.str();
}

} // namespace vmem
