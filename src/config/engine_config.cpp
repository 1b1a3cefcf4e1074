#include "../../include/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace p2p {
namespace config {

namespace {

// value<uintN_t>() would static_cast negative and oversized numbers; demand
// a JSON unsigned integer and check the range explicitly
uint64_t read_unsigned(const json& data, const char* key, uint64_t fallback, uint64_t ceiling) {
    if (!data.contains(key)) return fallback;

    const json& v = data.at(key);
    if (!v.is_number_unsigned()) {
        throw std::runtime_error(std::string(key) + " must be a non-negative integer");
    }
    uint64_t n = v.get<uint64_t>();
    if (n > ceiling) {
        throw std::runtime_error(std::string(key) + " out of range: " + std::to_string(n));
    }
    return n;
}

}  // namespace

EngineConfig ConfigLoader::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig ConfigLoader::parse(const std::string& json_text) {
    EngineConfig config;

    json data;
    try {
        data = json::parse(json_text);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed engine config: ") + e.what());
    }

    if (!data.is_object()) {
        throw std::runtime_error("Engine config must be a JSON object");
    }

    config.arbitrator = read_unsigned(data, "arbitrator", config.arbitrator, std::numeric_limits<Principal>::max());
    config.escrow_timeout_secs = read_unsigned(data, "escrow_timeout_secs", config.escrow_timeout_secs,
                                               escrow::MAX_CONFIRM_TIMEOUT_SECS);
    config.max_open_escrows_per_offer = static_cast<uint32_t>(read_unsigned(
        data, "max_open_escrows_per_offer", config.max_open_escrows_per_offer, std::numeric_limits<uint32_t>::max()));

    try {
        if (data.contains("log_level")) {
            config.log_level = parse_log_level(data.at("log_level").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid engine config value: ") + e.what());
    }

    if (config.escrow_timeout_secs == 0) {
        throw std::runtime_error("escrow_timeout_secs must be positive");
    }
    if (config.max_open_escrows_per_offer == 0) {
        throw std::runtime_error("max_open_escrows_per_offer must be positive");
    }

    return config;
}

void ConfigLoader::save(const std::string& filename, const EngineConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }

    json data = {
        {"arbitrator", config.arbitrator},
        {"escrow_timeout_secs", config.escrow_timeout_secs},
        {"max_open_escrows_per_offer", config.max_open_escrows_per_offer},
        {"log_level", log_level_name(config.log_level)},
    };
    file << data.dump(2) << "\n";
}

uint8_t ConfigLoader::parse_log_level(const std::string& name) {
    if (name == "trace") return 0;
    if (name == "debug") return 1;
    if (name == "info") return 2;
    if (name == "warn") return 3;
    if (name == "error") return 4;
    if (name == "fatal") return 5;
    throw std::runtime_error("Unknown log level: " + name);
}

const char* ConfigLoader::log_level_name(uint8_t level) {
    switch (level) {
        case 0: return "trace";
        case 1: return "debug";
        case 2: return "info";
        case 3: return "warn";
        case 4: return "error";
        case 5: return "fatal";
    }
    return "info";
}

}  // namespace config
}  // namespace p2p
