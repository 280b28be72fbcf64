#ifndef VMEM_SCRIPT_RUNNER_H
#define VMEM_SCRIPT_RUNNER_H

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "ScriptParser.hpp"

namespace vmem {

// Runs an operation script against a fresh VirtualMemory whose word width is
// picked from the script config. Results go to `out`, per-op failures to
// `err`, every line tagged "[Script]".
class ScriptRunner {
public:
    explicit ScriptRunner(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out), err_(err) {}

    // Returns the number of ops that failed. A failing op does not stop the run.
    // Throws std::invalid_argument for an invalid config and
    // std::runtime_error when the configured image cannot be read.
    std::size_t run(const Script& script);

private:
    template <std::size_t W>
    std::size_t run_width(const Script& script);

    std::ostream& out_;
    std::ostream& err_;
};

// Whole file as raw bytes. Throws std::runtime_error if it cannot be opened.
std::vector<std::uint8_t> load_image(const std::string& path);

} // namespace vmem

#endif // VMEM_SCRIPT_RUNNER_H
