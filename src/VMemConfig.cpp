#include "VMemConfig.hpp"

#include <cctype>
#include <stdexcept>

namespace vmem {

std::uint64_t parse_unsigned(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return value.get<std::uint64_t>();
    if (value.is_number_integer()) {
        auto v = value.get<std::int64_t>();
        if (v < 0) throw std::runtime_error("Expected a non-negative number, got " + value.dump());
        return static_cast<std::uint64_t>(v);
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        // stoull would skip whitespace and accept a sign, so insist on a digit first
        if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) {
            throw std::runtime_error("Cannot parse number: " + s);
        }
        std::size_t used = 0;
        std::uint64_t v = 0;
        try {
            v = std::stoull(s, &used, 0);
        } catch (const std::logic_error&) {
            throw std::runtime_error("Cannot parse number: " + s);
        }
        if (used != s.size()) throw std::runtime_error("Cannot parse number: " + s);
        return v;
    }
    throw std::runtime_error("Expected a number, got " + value.dump());
}

void validate_config(const VMemConfig& cfg) {
    if (cfg.width != 1 && cfg.width != 2 && cfg.width != 4 && cfg.width != 8) {
        throw std::invalid_argument("Unsupported word width " + std::to_string(cfg.width) +
                                    " (expected 1, 2, 4 or 8)");
    }
    if (cfg.length == 0 && cfg.image_path.empty()) {
        throw std::invalid_argument("Memory length must be positive");
    }
}

void from_json(const nlohmann::json& j, VMemConfig& cfg) {
    if (!j.is_object()) throw std::runtime_error("\"config\" must be an object");
    if (j.contains("length")) cfg.length = parse_unsigned(j.at("length"));
    if (j.contains("width")) cfg.width = parse_unsigned(j.at("width"));
    if (j.contains("chunk_size")) cfg.chunk_size = parse_unsigned(j.at("chunk_size"));
    cfg.verbose = j.value("verbose", cfg.verbose);
    cfg.image_path = j.value("image", cfg.image_path);
}

void to_json(nlohmann::json& j, const VMemConfig& cfg) {
    j = nlohmann::json{{"length", cfg.length},
                       {"width", cfg.width},
                       {"chunk_size", cfg.chunk_size},
                       {"verbose", cfg.verbose}};
    if (!cfg.image_path.empty()) j["image"] = cfg.image_path;
}

} // namespace vmem
