#pragma once

#include <cstddef>
#include <cstdint>

namespace p2p {

// Settlement-asset amounts are in base units (18 decimals, 1 token = 10^18).
// 128-bit so amount * unit_price never needs a wider intermediate.
using Amount = unsigned __int128;
using UnitPrice = unsigned __int128; // Fiat units per whole token
using FiatAmount = unsigned __int128;
using Principal = uint64_t;          // Account identity, 0 = invalid
using OfferId = uint64_t;
using EscrowId = uint64_t;
using Timestamp = uint64_t;          // Seconds since Unix epoch
using Duration = uint64_t;           // Seconds

constexpr Principal NO_PRINCIPAL = 0;
constexpr OfferId INVALID_OFFER_ID = 0;
constexpr EscrowId INVALID_ESCROW_ID = 0;

// Fixed-point scale between settlement base units and whole tokens
constexpr Amount PRICE_PRECISION = static_cast<Amount>(1'000'000'000'000'000'000ULL);

constexpr Amount MAX_AMOUNT = ~static_cast<Amount>(0);

__attribute__((always_inline)) inline bool is_valid_principal(Principal p) {
    return p != NO_PRINCIPAL;
}

// Whole tokens -> base units
constexpr Amount tokens(uint64_t whole) {
    return static_cast<Amount>(whole) * PRICE_PRECISION;
}

// Operation result
enum class Status : uint8_t {
    Ok = 0,
    InvalidInput,           // Empty string or zero amount
    InvalidAddress,         // Principal 0
    InvalidPriceParameters, // max < min, zero price or overflowing notional
    Unauthorized,           // Caller lacks the role for this transition
    AlreadyExists,          // Profile already registered
    ProfileRequired,        // Caller has no profile
    OfferNotFound,
    OfferInactive,
    EscrowNotFound,
    InvalidState,           // Escrow not in the required state, or offer at capacity
    InsufficientBalance,    // Available balance too low
    ActiveEscrowsExist,     // Offer still has open escrows
    EscrowTimeout,          // Confirmation window elapsed
    CannotTradeWithSelf,
    TradeAmountTooLow,
    TradeAmountTooHigh,
    TransferFailed,         // Ledger adapter refused the transfer
    Reentrancy              // Called back into the engine during a transfer
};

inline const char* status_to_string(Status status) {
    switch (status) {
    case Status::Ok:
        return "Ok";
    case Status::InvalidInput:
        return "InvalidInput";
    case Status::InvalidAddress:
        return "InvalidAddress";
    case Status::InvalidPriceParameters:
        return "InvalidPriceParameters";
    case Status::Unauthorized:
        return "Unauthorized";
    case Status::AlreadyExists:
        return "AlreadyExists";
    case Status::ProfileRequired:
        return "ProfileRequired";
    case Status::OfferNotFound:
        return "OfferNotFound";
    case Status::OfferInactive:
        return "OfferInactive";
    case Status::EscrowNotFound:
        return "EscrowNotFound";
    case Status::InvalidState:
        return "InvalidState";
    case Status::InsufficientBalance:
        return "InsufficientBalance";
    case Status::ActiveEscrowsExist:
        return "ActiveEscrowsExist";
    case Status::EscrowTimeout:
        return "EscrowTimeout";
    case Status::CannotTradeWithSelf:
        return "CannotTradeWithSelf";
    case Status::TradeAmountTooLow:
        return "TradeAmountTooLow";
    case Status::TradeAmountTooHigh:
        return "TradeAmountTooHigh";
    case Status::TransferFailed:
        return "TransferFailed";
    case Status::Reentrancy:
        return "Reentrancy";
    default:
        return "Unknown";
    }
}

enum class EscrowStatus : uint8_t { Pending = 0, Completed, Cancelled, Disputed };

inline const char* escrow_status_to_string(EscrowStatus status) {
    switch (status) {
    case EscrowStatus::Pending:
        return "PENDING";
    case EscrowStatus::Completed:
        return "COMPLETED";
    case EscrowStatus::Cancelled:
        return "CANCELLED";
    case EscrowStatus::Disputed:
        return "DISPUTED";
    default:
        return "UNKNOWN";
    }
}

} // namespace p2p
