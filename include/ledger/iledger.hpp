#pragma once

#include "../types.hpp"

#include <cstdint>

namespace p2p {
namespace ledger {

enum class TransferResult : uint8_t {
    Ok = 0,
    InsufficientAllowance, // transfer_in: principal has not approved enough for custody
    InsufficientFunds,     // transfer_in: principal's external balance too low
    ReserveInsufficient    // transfer_out: custody holds less than requested
};

inline const char* transfer_result_to_string(TransferResult result) {
    switch (result) {
    case TransferResult::Ok:
        return "Ok";
    case TransferResult::InsufficientAllowance:
        return "InsufficientAllowance";
    case TransferResult::InsufficientFunds:
        return "InsufficientFunds";
    case TransferResult::ReserveInsufficient:
        return "ReserveInsufficient";
    default:
        return "Unknown";
    }
}

/**
 * ILedger - Settlement-asset transfer primitive
 *
 * Moves value between an external principal and the engine's custody
 * account. The engine owns no logic here: it only asks for transfers and
 * reacts to the result.
 *
 * Implementations:
 *   - InMemoryLedger (demo, conservation tests)
 *   - MockLedger (failure injection, re-entry tests)
 */
class ILedger {
public:
    virtual ~ILedger() = default;

    /// Pull amount from `from` into custody
    virtual TransferResult transfer_in(Principal from, Amount amount) = 0;

    /// Pay amount out of custody to `to`
    virtual TransferResult transfer_out(Principal to, Amount amount) = 0;
};

}  // namespace ledger
}  // namespace p2p
