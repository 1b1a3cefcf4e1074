#pragma once

#include "../types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace p2p {
namespace market {

/**
 * OfferParams - What a seller supplies to post an offer
 *
 * Trade sizes are settlement-asset base units; price is fiat units per
 * whole token.
 */
struct OfferParams {
    Amount max_trade = 0;
    Amount min_trade = 0;
    UnitPrice price = 0;
    std::string currency;        // e.g. "NGN"
    std::string payment_method;  // e.g. "Bank Transfer"
};

struct Offer {
    OfferId id = INVALID_OFFER_ID;
    Principal seller = NO_PRINCIPAL;
    Amount max_trade = 0;
    Amount min_trade = 0;
    UnitPrice price = 0;
    std::string currency;
    std::string payment_method;
    uint32_t open_escrows = 0;  // PENDING + DISPUTED escrows against this offer
    bool active = false;
    Timestamp created_at = 0;

    bool operator==(const Offer&) const = default;
};

/**
 * OfferBook - Sell offers indexed by id
 *
 * Ids are allocated from 1 upward and never reused; offers are deactivated,
 * never removed. Affordability and profile checks belong to the engine.
 */
class OfferBook {
public:
    // Shape checks only: sizes, price, strings, notional overflow
    static Status validate(const OfferParams& params);

    OfferId add(Principal seller, const OfferParams& params, Timestamp now);

    // OfferNotFound, OfferInactive, Unauthorized, ActiveEscrowsExist, in that order
    Status deactivate(OfferId id, Principal caller);

    const Offer* find(OfferId id) const;
    Offer* find(OfferId id);

    void increment_open(OfferId id);
    void decrement_open(OfferId id);

    const std::vector<OfferId>& offers_of(Principal seller) const;
    std::vector<OfferId> active_offers() const;

    size_t size() const { return offers_.size(); }
    OfferId next_id() const { return static_cast<OfferId>(offers_.size()) + 1; }

private:
    std::vector<Offer> offers_;  // offers_[id - 1]
    std::unordered_map<Principal, std::vector<OfferId>> by_seller_;

    static const std::vector<OfferId> kNoOffers;
};

}  // namespace market
}  // namespace p2p
