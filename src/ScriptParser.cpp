#include "ScriptParser.hpp"

#include <fstream>
#include <stdexcept>

namespace vmem {

// ─────────────── op names ─────────────────────────────────────────────
ScriptOpKind to_op_kind(const std::string& name) {
    if (name == "write_word") return ScriptOpKind::WriteWord;
    if (name == "read_word")  return ScriptOpKind::ReadWord;
    if (name == "write_at")   return ScriptOpKind::WriteAt;
    if (name == "read_at")    return ScriptOpKind::ReadAt;
    if (name == "snapshot")   return ScriptOpKind::Snapshot;
    if (name == "diff")       return ScriptOpKind::Diff;
    if (name == "patch")      return ScriptOpKind::Patch;
    if (name == "chunks")     return ScriptOpKind::Chunks;
    if (name == "fill")       return ScriptOpKind::Fill;
    if (name == "dump")       return ScriptOpKind::Dump;
    throw std::invalid_argument("Unknown script op: " + name);
}

const char* to_string(ScriptOpKind kind) {
    switch (kind) {
        case ScriptOpKind::WriteWord: return "write_word";
        case ScriptOpKind::ReadWord:  return "read_word";
        case ScriptOpKind::WriteAt:   return "write_at";
        case ScriptOpKind::ReadAt:    return "read_at";
        case ScriptOpKind::Snapshot:  return "snapshot";
        case ScriptOpKind::Diff:      return "diff";
        case ScriptOpKind::Patch:     return "patch";
        case ScriptOpKind::Chunks:    return "chunks";
        case ScriptOpKind::Fill:      return "fill";
        case ScriptOpKind::Dump:      return "dump";
    }
    return "?";
}

// ─────────────── parsing ──────────────────────────────────────────────
Script ScriptJsonParser::parse_file(const std::string& path) const {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json root;
    ifs >> root;
    return parse(root);
}

Script ScriptJsonParser::parse(const nlohmann::json& root) const {
    if (!root.is_object()) {
        throw std::runtime_error("Top-level JSON is not an object");
    }
    if (!root.contains("ops") || !root.at("ops").is_array()) {
        throw std::runtime_error("Script needs an \"ops\" array");
    }
    Script script;
    if (root.contains("config")) {
        script.config = root.at("config").get<VMemConfig>();
    }
    const auto& ops = root.at("ops");
    script.ops.reserve(ops.size());
    for (const auto& item : ops) {
        script.ops.push_back(parse_op(item));
    }
    return script;
}

ScriptOp ScriptJsonParser::parse_op(const nlohmann::json& item) const {
    ScriptOp op;
    op.kind = to_op_kind(item.at("op").get<std::string>());
    switch (op.kind) {
        case ScriptOpKind::WriteWord:
            op.addr = parse_unsigned(item.at("addr"));
            op.bytes = parse_bytes(item.at("word"));
            break;
        case ScriptOpKind::ReadWord:
            op.addr = parse_unsigned(item.at("addr"));
            break;
        case ScriptOpKind::WriteAt:
            op.addr = parse_unsigned(item.at("addr"));
            op.bytes = parse_bytes(item.at("bytes"));
            break;
        case ScriptOpKind::ReadAt:
            op.addr = parse_unsigned(item.at("addr"));
            op.size = parse_unsigned(item.at("size"));
            break;
        case ScriptOpKind::Patch:
            for (const auto& change : item.at("changes")) {
                op.changes.emplace_back(parse_unsigned(change.at("addr")),
                                        parse_bytes(change.at("word")));
            }
            break;
        case ScriptOpKind::Chunks:
            if (item.contains("size")) op.size = parse_unsigned(item.at("size"));
            break;
        case ScriptOpKind::Fill:
            op.bytes = parse_bytes(item.at("word"));
            break;
        case ScriptOpKind::Snapshot:
        case ScriptOpKind::Diff:
        case ScriptOpKind::Dump:
            break;
    }
    return op;
}

std::vector<std::uint8_t> ScriptJsonParser::parse_bytes(const nlohmann::json& arr) const {
    if (!arr.is_array()) {
        throw std::runtime_error("Expected a byte array, got " + arr.dump());
    }
    std::vector<std::uint8_t> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        std::uint64_t b = parse_unsigned(v);
        if (b > 0xff) throw std::invalid_argument("Byte value out of range: " + v.dump());
        out.push_back(static_cast<std::uint8_t>(b));
    }
    return out;
}

} // namespace vmem
