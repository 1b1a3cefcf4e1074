#pragma once

#include "defaults.hpp"
#include "../types.hpp"

#include <cstdint>
#include <string>

namespace p2p {
namespace config {

/**
 * Engine configuration
 *
 * Format:
 * {
 *   "arbitrator": 900,
 *   "escrow_timeout_secs": 172800,
 *   "max_open_escrows_per_offer": 100,
 *   "log_level": "info"
 * }
 *
 * Every key is optional; missing keys keep the defaults from defaults.hpp.
 */
struct EngineConfig {
    Principal arbitrator = NO_PRINCIPAL;
    Duration escrow_timeout_secs = escrow::CONFIRM_TIMEOUT_SECS;
    uint32_t max_open_escrows_per_offer = escrow::MAX_OPEN_ESCROWS_PER_OFFER;
    uint8_t log_level = logging::MIN_LEVEL;
};

class ConfigLoader {
public:
    // Throws std::runtime_error if the file cannot be read or holds invalid values
    static EngineConfig load(const std::string& filename);

    static EngineConfig parse(const std::string& json_text);

    static void save(const std::string& filename, const EngineConfig& config);

    static uint8_t parse_log_level(const std::string& name);
    static const char* log_level_name(uint8_t level);
};

}  // namespace config
}  // namespace p2p
