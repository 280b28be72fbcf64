#ifndef VMEM_CONFIG_H
#define VMEM_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace vmem {

/**
 * Settings for one runner session.
 *
 * JSON form (every key optional):
 * {
 *   "length": 256,          // words, integer or "0x100"
 *   "width": 4,             // bytes per word: 1, 2, 4 or 8
 *   "chunk_size": 8,        // max words per adjacency chunk
 *   "verbose": false,       // log every write, not only reads and reports
 *   "image": "fw.bin"       // raw image loaded with from_bytes; overrides length
 * }
 */
struct VMemConfig {
    std::size_t length{256};
    std::size_t width{4};
    std::size_t chunk_size{8};
    bool verbose{false};
    std::string image_path;
};

// Unsigned JSON number, or a string in decimal / 0x-hex / 0-octal notation.
// Throws std::runtime_error for anything else.
std::uint64_t parse_unsigned(const nlohmann::json& value);

// Throws std::invalid_argument for an unsupported width or a zero length
// without an image.
void validate_config(const VMemConfig& cfg);

void from_json(const nlohmann::json& j, VMemConfig& cfg);
void to_json(nlohmann::json& j, const VMemConfig& cfg);

} // namespace vmem

#endif // VMEM_CONFIG_H
