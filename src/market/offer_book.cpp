#include "../../include/market/offer_book.hpp"

#include <cassert>

namespace p2p::market {

const std::vector<OfferId> OfferBook::kNoOffers{};

Status OfferBook::validate(const OfferParams& params) {
    if (params.max_trade == 0 || params.min_trade == 0) {
        return Status::InvalidInput;
    }
    if (params.currency.empty() || params.payment_method.empty()) {
        return Status::InvalidInput;
    }
    if (params.max_trade < params.min_trade || params.price == 0) {
        return Status::InvalidPriceParameters;
    }

    // Every escrow's fiat amount is computed from amount * price <= max * price
    FiatAmount notional;
    if (__builtin_mul_overflow(params.max_trade, params.price, &notional)) {
        return Status::InvalidPriceParameters;
    }
    return Status::Ok;
}

OfferId OfferBook::add(Principal seller, const OfferParams& params, Timestamp now) {
    Offer offer;
    offer.id = next_id();
    offer.seller = seller;
    offer.max_trade = params.max_trade;
    offer.min_trade = params.min_trade;
    offer.price = params.price;
    offer.currency = params.currency;
    offer.payment_method = params.payment_method;
    offer.open_escrows = 0;
    offer.active = true;
    offer.created_at = now;

    offers_.push_back(std::move(offer));
    OfferId id = offers_.back().id;
    by_seller_[seller].push_back(id);
    return id;
}

Status OfferBook::deactivate(OfferId id, Principal caller) {
    Offer* offer = find(id);
    if (!offer) {
        return Status::OfferNotFound;
    }
    if (!offer->active) {
        return Status::OfferInactive;
    }
    if (offer->seller != caller) {
        return Status::Unauthorized;
    }
    if (offer->open_escrows > 0) {
        return Status::ActiveEscrowsExist;
    }

    offer->active = false;
    return Status::Ok;
}

const Offer* OfferBook::find(OfferId id) const {
    if (id == INVALID_OFFER_ID || id > offers_.size()) {
        return nullptr;
    }
    return &offers_[id - 1];
}

Offer* OfferBook::find(OfferId id) {
    if (id == INVALID_OFFER_ID || id > offers_.size()) {
        return nullptr;
    }
    return &offers_[id - 1];
}

void OfferBook::increment_open(OfferId id) {
    Offer* offer = find(id);
    assert(offer && "open escrow against unknown offer");
    offer->open_escrows++;
}

void OfferBook::decrement_open(OfferId id) {
    Offer* offer = find(id);
    assert(offer && offer->open_escrows > 0 && "open escrow count underflow");
    offer->open_escrows--;
}

const std::vector<OfferId>& OfferBook::offers_of(Principal seller) const {
    auto it = by_seller_.find(seller);
    return it == by_seller_.end() ? kNoOffers : it->second;
}

std::vector<OfferId> OfferBook::active_offers() const {
    std::vector<OfferId> ids;
    for (const auto& offer : offers_) {
        if (offer.active) ids.push_back(offer.id);
    }
    return ids;
}

}  // namespace p2p::market
