#pragma once

/**
 * @file VMemConfigCLI.hpp
 * @brief Command-line overrides for VMemConfig.
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "VMemConfig.hpp"

namespace vmemcli {

inline bool starts_with(const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; }
inline bool parse_bool(const std::string& v){
    if (v=="1"||v=="true"||v=="True"||v=="TRUE"||v=="yes") return true;
    if (v=="0"||v=="false"||v=="False"||v=="FALSE"||v=="no") return false;
    return std::atoi(v.c_str())!=0;
}

/**
 * @brief Apply a single --flag value to VMemConfig.
 * Recognized names: length, width, chunk_size, verbose, image.
 * Numeric values go through vmem::parse_unsigned, so "0x100" is accepted.
 * @return false if the name is not recognized.
 */
inline bool apply_flag(const std::string& name, const std::string& val, vmem::VMemConfig& cfg){
    if (name=="length") cfg.length = vmem::parse_unsigned(val);
    else if (name=="width") cfg.width = vmem::parse_unsigned(val);
    else if (name=="chunk_size") cfg.chunk_size = vmem::parse_unsigned(val);
    else if (name=="verbose") cfg.verbose = parse_bool(val);
    else if (name=="image") cfg.image_path = val;
    else return false;
    return true;
}

/**
 * @brief Parse flags of the form --name=value or --name value from argv[start..).
 * Unknown flags leave cfg unchanged and are reported on `warn`.
 */
inline void parse_cli_flags(int argc, char** argv, int start, vmem::VMemConfig& cfg,
                            std::ostream& warn = std::cerr){
    for (int i=start;i<argc;++i){
        std::string tok = argv[i];
        if (!starts_with(tok, "--")) continue;
        std::string name, val;
        auto pos = tok.find('=');
        if (pos != std::string::npos){
            name = tok.substr(2, pos-2);
            val = tok.substr(pos+1);
        } else {
            name = tok.substr(2);
            if (i+1 < argc && std::string(argv[i+1]).rfind("--",0)!=0){
                val = argv[i+1];
                ++i;
            } else {
                val = "1"; // bare switch, e.g. --verbose
            }
        }
        if (!apply_flag(name, val, cfg)) {
            warn << "[Config] ignoring unknown flag --" << name << "\n";
        }
    }
}

} // namespace vmemcli
