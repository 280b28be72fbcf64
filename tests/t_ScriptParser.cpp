#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "ScriptParser.hpp"
#include "VMemConfigCLI.hpp"

using json = nlohmann::json;
using vmem::ScriptOpKind;

void test_parse_unsigned() {
    assert(vmem::parse_unsigned(json(15)) == 15);
    assert(vmem::parse_unsigned(json("0x0f")) == 15);
    assert(vmem::parse_unsigned(json("17")) == 17);

    bool threw = false;
    try { vmem::parse_unsigned(json(-1)); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { vmem::parse_unsigned(json("12zz")); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    for (const char* bad : {" -1", "-1", "+5", " 7", ""}) {
        threw = false;
        try { vmem::parse_unsigned(json(bad)); }
        catch (const std::runtime_error&) { threw = true; }
        assert(threw);
    }

    threw = false;
    try { vmem::parse_unsigned(json(true)); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);
}

void test_config_defaults_and_overrides() {
    vmem::VMemConfig defaults = json::object().get<vmem::VMemConfig>();
    assert(defaults.length == 256);
    assert(defaults.width == 4);
    assert(defaults.chunk_size == 8);
    assert(!defaults.verbose);
    assert(defaults.image_path.empty());

    auto cfg = json::parse(R"({"length": "0x100", "width": 8, "verbose": true, "image": "fw.bin"})")
                   .get<vmem::VMemConfig>();
    assert(cfg.length == 0x100);
    assert(cfg.width == 8);
    assert(cfg.chunk_size == 8);
    assert(cfg.verbose);
    assert(cfg.image_path == "fw.bin");

    json back = cfg;
    assert(back.at("width") == 8);
    assert(back.at("image") == "fw.bin");
}

void test_validate_config() {
    vmem::VMemConfig cfg;
    vmem::validate_config(cfg);

    cfg.width = 3;
    bool threw = false;
    try { vmem::validate_config(cfg); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    cfg.width = 2;
    cfg.length = 0;
    threw = false;
    try { vmem::validate_config(cfg); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    cfg.image_path = "fw.bin";   // length comes from the image
    vmem::validate_config(cfg);
}

void test_cli_flags() {
    vmem::VMemConfig cfg;
    const char* args[] = {"vmem_runner", "script.json", "--length=0x20", "--width", "2",
                          "--verbose", "--chunk_size=3", "--unknown=1"};
    std::ostringstream warn;
    vmemcli::parse_cli_flags(8, const_cast<char**>(args), 2, cfg, warn);
    assert(warn.str() == "[Config] ignoring unknown flag --unknown\n");
    assert(cfg.length == 0x20);
    assert(cfg.width == 2);
    assert(cfg.verbose);
    assert(cfg.chunk_size == 3);

    assert(!vmemcli::apply_flag("unknown", "1", cfg));
    assert(vmemcli::apply_flag("image", "dump.bin", cfg));
    assert(cfg.image_path == "dump.bin");
}

void test_parse_script() {
    auto root = json::parse(R"({
        "config": { "length": 15, "width": 4 },
        "ops": [
            { "op": "write_word", "addr": "0x03", "word": [10, 11, "0x0c", 13] },
            { "op": "read_word", "addr": 3 },
            { "op": "write_at", "addr": 13, "bytes": [1, 2, 3, 4, 5] },
            { "op": "read_at", "addr": 13, "size": 8 },
            { "op": "snapshot" },
            { "op": "diff" },
            { "op": "patch", "changes": [ { "addr": 6, "word": [1, 2, 3, 4] }, { "addr": 7, "word": [0, 0, 0, 1] } ] },
            { "op": "chunks" },
            { "op": "chunks", "size": 2 },
            { "op": "fill", "word": [0, 0, 0, 1] },
            { "op": "dump" }
        ]
    })");
    vmem::ScriptJsonParser parser;
    auto script = parser.parse(root);

    assert(script.config.length == 15);
    assert(script.ops.size() == 11);

    const auto& w = script.ops[0];
    assert(w.kind == ScriptOpKind::WriteWord);
    assert(w.addr == 3);
    assert((w.bytes == std::vector<std::uint8_t>{10, 11, 12, 13}));

    assert(script.ops[1].kind == ScriptOpKind::ReadWord);
    assert(script.ops[2].kind == ScriptOpKind::WriteAt && script.ops[2].bytes.size() == 5);
    assert(script.ops[3].kind == ScriptOpKind::ReadAt && script.ops[3].size == 8);
    assert(script.ops[4].kind == ScriptOpKind::Snapshot);
    assert(script.ops[5].kind == ScriptOpKind::Diff);

    const auto& p = script.ops[6];
    assert(p.kind == ScriptOpKind::Patch);
    assert(p.changes.size() == 2);
    assert(p.changes[1].first == 7);

    assert(script.ops[7].kind == ScriptOpKind::Chunks && script.ops[7].size == 0);
    assert(script.ops[8].size == 2);
    assert(script.ops[9].kind == ScriptOpKind::Fill);
    assert(script.ops[10].kind == ScriptOpKind::Dump);
    assert(std::string(vmem::to_string(script.ops[10].kind)) == "dump");
}

void test_parse_errors() {
    vmem::ScriptJsonParser parser;

    bool threw = false;
    try { parser.parse(json::array()); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { parser.parse(json::parse(R"({"config": {}})")); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { parser.parse(json::parse(R"({"ops": [ {"op": "erase", "addr": 1} ]})")); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    threw = false;
    try { parser.parse(json::parse(R"({"ops": [ {"op": "write_word", "addr": 1, "word": [256]} ]})")); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // missing field surfaces as a json exception
    threw = false;
    try { parser.parse(json::parse(R"({"ops": [ {"op": "read_word"} ]})")); }
    catch (const json::out_of_range&) { threw = true; }
    assert(threw);

    threw = false;
    try { parser.parse_file("does/not/exist.json"); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);
}

int main() {
    test_parse_unsigned();
    test_config_defaults_and_overrides();
    test_validate_config();
    test_cli_flags();
    test_parse_script();
    test_parse_errors();
    std::cout << "All ScriptParser tests passed!\n";
    return 0;
}
