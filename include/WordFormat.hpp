#ifndef VMEM_WORD_FORMAT_H
#define VMEM_WORD_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vmem {

// "0a 0b 0c 0d"
std::string to_hex(const std::uint8_t* data, std::size_t size);

inline std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

template <std::size_t W>
std::string to_hex(const std::array<std::uint8_t, W>& word) {
    return to_hex(word.data(), W);
}

// "0x0003", zero padded to four digits
std::string format_address(std::size_t address);

} // namespace vmem

#endif // VMEM_WORD_FORMAT_H
