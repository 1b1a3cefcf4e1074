#pragma once

#include "../types.hpp"

#include <cstdint>
#include <functional>

namespace p2p {
namespace market {

enum class EventType : uint8_t {
    ProfileCreated = 0,
    ProfileUpdated,
    Deposited,
    Withdrawn,
    OfferCreated,
    OfferDeactivated,
    EscrowOpened,
    PaymentConfirmed,
    EscrowCancelled,
    DisputeRaised,
    DisputeResolved
};

inline const char* event_type_to_string(EventType type) {
    switch (type) {
    case EventType::ProfileCreated:
        return "ProfileCreated";
    case EventType::ProfileUpdated:
        return "ProfileUpdated";
    case EventType::Deposited:
        return "Deposited";
    case EventType::Withdrawn:
        return "Withdrawn";
    case EventType::OfferCreated:
        return "OfferCreated";
    case EventType::OfferDeactivated:
        return "OfferDeactivated";
    case EventType::EscrowOpened:
        return "EscrowOpened";
    case EventType::PaymentConfirmed:
        return "PaymentConfirmed";
    case EventType::EscrowCancelled:
        return "EscrowCancelled";
    case EventType::DisputeRaised:
        return "DisputeRaised";
    case EventType::DisputeResolved:
        return "DisputeResolved";
    default:
        return "Unknown";
    }
}

/**
 * MarketEvent - Emitted after a state change has been committed
 *
 * Fields that do not apply to the event type stay zero.
 */
struct MarketEvent {
    EventType type = EventType::ProfileCreated;
    Timestamp timestamp = 0;
    Principal actor = NO_PRINCIPAL;         // Caller that triggered the change
    Principal counterparty = NO_PRINCIPAL;  // Other side of an escrow
    OfferId offer_id = INVALID_OFFER_ID;
    EscrowId escrow_id = INVALID_ESCROW_ID;
    Amount amount = 0;
    bool favor_buyer = false;               // DisputeResolved only
};

// Invoked with the engine lock held; calling back into the engine fails with Reentrancy
using EventCallback = std::function<void(const MarketEvent&)>;

}  // namespace market
}  // namespace p2p
