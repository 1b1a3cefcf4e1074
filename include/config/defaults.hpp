#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the escrow engine.
 *
 * EngineConfig starts from these values; a JSON config file overrides any
 * subset of them.
 *
 * Naming:
 * - _SECS suffix: duration in seconds
 */

namespace p2p::config {

// =============================================================================
// Escrow Lifecycle
// =============================================================================
namespace escrow {
// Seller must confirm payment within this window after the escrow opens
constexpr uint64_t CONFIRM_TIMEOUT_SECS = 48 * 60 * 60;

// Largest confirmation window a config file may ask for (one year)
constexpr uint64_t MAX_CONFIRM_TIMEOUT_SECS = 365 * 24 * 60 * 60;

// Concurrent PENDING + DISPUTED escrows allowed against one offer
constexpr uint32_t MAX_OPEN_ESCROWS_PER_OFFER = 100;
} // namespace escrow

// =============================================================================
// Logging
// =============================================================================
namespace logging {
// Matches logging::LogLevel::Info
constexpr uint8_t MIN_LEVEL = 2;
} // namespace logging

} // namespace p2p::config
