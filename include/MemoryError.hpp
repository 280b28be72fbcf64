#ifndef VMEM_MEMORY_ERROR_H
#define VMEM_MEMORY_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vmem {

// Raised when a word-granular write targets an address outside [0, length).
// Reads never raise it: an out-of-range read yields an empty optional instead.
class AddressOutOfBounds : public std::out_of_range {
public:
    AddressOutOfBounds(std::size_t address, std::size_t length);

    std::size_t address() const { return address_; }
    std::size_t length() const { return length_; }

private:
    static std::string describe(std::size_t address, std::size_t length);

    std::size_t address_;
    std::size_t length_;
};

} // namespace vmem

#endif // VMEM_MEMORY_ERROR_H
