#ifndef VMEM_SCRIPT_PARSER_H
#define VMEM_SCRIPT_PARSER_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "VMemConfig.hpp"
#include "WordIterators.hpp"

namespace vmem {

enum class ScriptOpKind { WriteWord, ReadWord, WriteAt, ReadAt, Snapshot, Diff, Patch, Chunks, Fill, Dump };

// One step of an operation script. Only the fields its kind uses are set.
struct ScriptOp {
    ScriptOpKind kind{ScriptOpKind::Dump};
    Address addr{0};
    std::vector<std::uint8_t> bytes;   // word for write_word / fill, payload for write_at
    std::size_t size{0};               // read_at byte count, chunks size (0 = config chunk_size)
    std::vector<std::pair<Address, std::vector<std::uint8_t>>> changes; // patch entries
};

struct Script {
    VMemConfig config;
    std::vector<ScriptOp> ops;
};

/**
 * Parse an operation script.
 *
 * Expected JSON format:
 * {
 *   "config": { "length": 15, "width": 4 },
 *   "ops": [
 *     { "op": "write_word", "addr": "0x03", "word": [10, 11, 12, 13] },
 *     { "op": "write_at",   "addr": 13, "bytes": ["0x01", 2, 3, 4, 5] },
 *     { "op": "read_word",  "addr": 3 },
 *     { "op": "read_at",    "addr": 13, "size": 8 },
 *     { "op": "snapshot" },
 *     { "op": "diff" },
 *     { "op": "patch", "changes": [ { "addr": 6, "word": [1, 2, 3, 4] } ] },
 *     { "op": "chunks", "size": 3 },
 *     { "op": "fill", "word": [0, 0, 0, 1] },
 *     { "op": "dump" }
 *   ]
 * }
 *
 * Throws std::runtime_error if the file cannot be opened or the root is not an
 * object with an "ops" array, std::invalid_argument for an unknown "op" or a
 * byte value above 0xff. nlohmann::json exceptions propagate for missing or
 * mistyped fields.
 */
class ScriptJsonParser {
public:
    Script parse_file(const std::string& path) const;
    Script parse(const nlohmann::json& root) const;

private:
    ScriptOp parse_op(const nlohmann::json& item) const;
    std::vector<std::uint8_t> parse_bytes(const nlohmann::json& arr) const;
};

ScriptOpKind to_op_kind(const std::string& name);
const char* to_string(ScriptOpKind kind);

} // namespace vmem

#endif // VMEM_SCRIPT_PARSER_H
