#include "ScriptParser.hpp"
#include "ScriptRunner.hpp"
#include "VMemConfigCLI.hpp"
#include <chrono>
#include <iostream>

int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] <<
        " <script.json> [--length=N] [--width=1|2|4|8] [--chunk_size=N] [--image=path] [--verbose]\n";
        return 1;
    }

    try {
        vmem::ScriptJsonParser parser;
        vmem::Script script = parser.parse_file(argv[1]);
        vmemcli::parse_cli_flags(argc, argv, 2, script.config);
        vmem::validate_config(script.config);
        std::cout << "[Config] " << nlohmann::json(script.config).dump() << "\n";

        auto start = std::chrono::high_resolution_clock::now();

        vmem::ScriptRunner runner;
        std::size_t failed = runner.run(script);

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        std::cout << "[Runner] " << script.ops.size() << " op(s), " << failed << " failed\n";
        std::cout << "Execution time: " << duration.count() << " us\n";

        return failed == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
