#include "../../include/market/escrow_engine.hpp"
#include "../../include/market/reentrancy_guard.hpp"
#include "../../include/util/string_utils.hpp"

#include <cassert>

namespace p2p::market {

namespace {

using ULL = unsigned long long;

Duration elapsed_since(Timestamp start, Timestamp now) {
    return now > start ? now - start : 0;
}

}  // namespace

EscrowEngine::EscrowEngine(ledger::ILedger& ledger, const auth::IAuthority& authority,
                           const config::EngineConfig& config)
    : ledger_(ledger), authority_(authority), config_(config) {}

// =============================================================================
// Profiles
// =============================================================================

Status EscrowEngine::create_profile(Principal who, const std::string& name, const std::string& primary_contact,
                                    const std::string& secondary_contact, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Profile, "create_profile");

    if (!is_valid_principal(who)) return reject(Status::InvalidAddress, logging::LogCategory::Profile, "create_profile");

    Status s = profiles_.create(who, name, primary_contact, secondary_contact, now);
    if (s != Status::Ok) return reject(s, logging::LogCategory::Profile, "create_profile");

    P2P_LOGF_INFO(logger_, Profile, "profile %llu created", static_cast<ULL>(who));
    emit({EventType::ProfileCreated, now, who});
    return Status::Ok;
}

Status EscrowEngine::update_profile(Principal who, const std::string& primary_contact,
                                    const std::string& secondary_contact, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Profile, "update_profile");

    if (!is_valid_principal(who)) return reject(Status::InvalidAddress, logging::LogCategory::Profile, "update_profile");

    Status s = profiles_.update(who, primary_contact, secondary_contact);
    if (s != Status::Ok) return reject(s, logging::LogCategory::Profile, "update_profile");

    P2P_LOGF_INFO(logger_, Profile, "profile %llu updated", static_cast<ULL>(who));
    emit({EventType::ProfileUpdated, now, who});
    return Status::Ok;
}

// =============================================================================
// Custody balance
// =============================================================================

Status EscrowEngine::deposit(Principal who, Amount amount, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Balance, "deposit");

    if (!is_valid_principal(who)) return reject(Status::InvalidAddress, logging::LogCategory::Balance, "deposit");
    if (amount == 0) return reject(Status::InvalidInput, logging::LogCategory::Balance, "deposit");

    ledger::TransferResult r = ledger_.transfer_in(who, amount);
    if (r != ledger::TransferResult::Ok) {
        P2P_LOGF_WARN(logger_, Ledger, "deposit %llu: %s", static_cast<ULL>(who), ledger::transfer_result_to_string(r));
        return Status::TransferFailed;
    }

    balances_.credit(who, amount);

    P2P_LOGF_INFO(logger_, Balance, "deposit %llu +%s", static_cast<ULL>(who), util::format_tokens(amount).c_str());
    MarketEvent ev{EventType::Deposited, now, who};
    ev.amount = amount;
    emit(ev);
    return Status::Ok;
}

Status EscrowEngine::withdraw(Principal who, Amount amount, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Balance, "withdraw");

    if (!is_valid_principal(who)) return reject(Status::InvalidAddress, logging::LogCategory::Balance, "withdraw");
    if (amount == 0) return reject(Status::InvalidInput, logging::LogCategory::Balance, "withdraw");
    if (!balances_.can_cover(who, amount)) {
        return reject(Status::InsufficientBalance, logging::LogCategory::Balance, "withdraw");
    }

    ledger::TransferResult r = ledger_.transfer_out(who, amount);
    if (r != ledger::TransferResult::Ok) {
        P2P_LOGF_WARN(logger_, Ledger, "withdraw %llu: %s", static_cast<ULL>(who), ledger::transfer_result_to_string(r));
        return Status::TransferFailed;
    }

    Status s = balances_.debit_available(who, amount);
    assert(s == Status::Ok);
    (void)s;

    P2P_LOGF_INFO(logger_, Balance, "withdraw %llu -%s", static_cast<ULL>(who), util::format_tokens(amount).c_str());
    MarketEvent ev{EventType::Withdrawn, now, who};
    ev.amount = amount;
    emit(ev);
    return Status::Ok;
}

// =============================================================================
// Offers
// =============================================================================

Status EscrowEngine::create_offer(Principal seller, const OfferParams& params, Timestamp now, OfferId& out_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Offer, "create_offer");

    if (!is_valid_principal(seller)) return reject(Status::InvalidAddress, logging::LogCategory::Offer, "create_offer");
    if (!profiles_.exists(seller)) return reject(Status::ProfileRequired, logging::LogCategory::Offer, "create_offer");

    Status s = OfferBook::validate(params);
    if (s != Status::Ok) return reject(s, logging::LogCategory::Offer, "create_offer");

    // Point-in-time affordability check; nothing is reserved here
    if (!balances_.can_cover(seller, params.max_trade)) {
        return reject(Status::InsufficientBalance, logging::LogCategory::Offer, "create_offer");
    }

    out_id = offers_.add(seller, params, now);

    P2P_LOGF_INFO(logger_, Offer, "offer %llu by %llu %s", static_cast<ULL>(out_id), static_cast<ULL>(seller),
                  params.currency.c_str());
    MarketEvent ev{EventType::OfferCreated, now, seller};
    ev.offer_id = out_id;
    ev.amount = params.max_trade;
    emit(ev);
    return Status::Ok;
}

Status EscrowEngine::deactivate_offer(OfferId id, Principal caller, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Offer, "deactivate_offer");

    Status s = offers_.deactivate(id, caller);
    if (s != Status::Ok) return reject(s, logging::LogCategory::Offer, "deactivate_offer");

    P2P_LOGF_INFO(logger_, Offer, "offer %llu deactivated", static_cast<ULL>(id));
    MarketEvent ev{EventType::OfferDeactivated, now, caller};
    ev.offer_id = id;
    emit(ev);
    return Status::Ok;
}

// =============================================================================
// Escrow lifecycle
// =============================================================================

Status EscrowEngine::open_escrow(Principal buyer, OfferId offer_id, Amount amount, Timestamp now, EscrowId& out_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Escrow, "open_escrow");

    if (!is_valid_principal(buyer)) return reject(Status::InvalidAddress, logging::LogCategory::Escrow, "open_escrow");
    if (!profiles_.exists(buyer)) return reject(Status::ProfileRequired, logging::LogCategory::Escrow, "open_escrow");

    const Offer* offer = offers_.find(offer_id);
    if (!offer) return reject(Status::OfferNotFound, logging::LogCategory::Escrow, "open_escrow");
    if (!offer->active) return reject(Status::OfferInactive, logging::LogCategory::Escrow, "open_escrow");
    if (offer->seller == buyer) return reject(Status::CannotTradeWithSelf, logging::LogCategory::Escrow, "open_escrow");
    if (amount < offer->min_trade) return reject(Status::TradeAmountTooLow, logging::LogCategory::Escrow, "open_escrow");
    if (amount > offer->max_trade) return reject(Status::TradeAmountTooHigh, logging::LogCategory::Escrow, "open_escrow");

    const Principal seller = offer->seller;
    if (!balances_.can_cover(seller, amount)) {
        return reject(Status::InsufficientBalance, logging::LogCategory::Escrow, "open_escrow");
    }
    if (offer->open_escrows >= config_.max_open_escrows_per_offer) {
        return reject(Status::InvalidState, logging::LogCategory::Escrow, "open_escrow");
    }

    // All checks passed; from here on nothing can fail
    Status s = balances_.lock(seller, amount);
    assert(s == Status::Ok);
    (void)s;
    offers_.increment_open(offer_id);

    Escrow escrow;
    escrow.id = static_cast<EscrowId>(escrows_.size()) + 1;
    escrow.offer_id = offer_id;
    escrow.buyer = buyer;
    escrow.seller = seller;
    escrow.amount = amount;
    escrow.fiat_amount = compute_fiat(amount, offer->price);
    escrow.created_at = now;
    escrow.status = EscrowStatus::Pending;
    escrows_.push_back(escrow);

    escrows_by_principal_[buyer].push_back(escrow.id);
    escrows_by_principal_[seller].push_back(escrow.id);
    profiles_.record_trade_opened(buyer);
    profiles_.record_trade_opened(seller);

    out_id = escrow.id;

    P2P_LOGF_INFO(logger_, Escrow, "escrow %llu opened on offer %llu", static_cast<ULL>(escrow.id),
                  static_cast<ULL>(offer_id));
    MarketEvent ev{EventType::EscrowOpened, now, buyer, seller, offer_id, escrow.id, amount};
    emit(ev);
    return Status::Ok;
}

Status EscrowEngine::confirm_payment(EscrowId id, Principal caller, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Escrow, "confirm_payment");

    Escrow* escrow = find_escrow(id);
    if (!escrow) return reject(Status::EscrowNotFound, logging::LogCategory::Escrow, "confirm_payment");
    if (escrow->status != EscrowStatus::Pending) {
        return reject(Status::InvalidState, logging::LogCategory::Escrow, "confirm_payment");
    }
    if (caller != escrow->seller) return reject(Status::Unauthorized, logging::LogCategory::Escrow, "confirm_payment");
    if (elapsed_since(escrow->created_at, now) > config_.escrow_timeout_secs) {
        return reject(Status::EscrowTimeout, logging::LogCategory::Escrow, "confirm_payment");
    }

    // Pay first; a refused transfer leaves every record untouched
    ledger::TransferResult r = ledger_.transfer_out(escrow->buyer, escrow->amount);
    if (r != ledger::TransferResult::Ok) {
        P2P_LOGF_WARN(logger_, Ledger, "confirm %llu: %s", static_cast<ULL>(id), ledger::transfer_result_to_string(r));
        return Status::TransferFailed;
    }

    close_escrow(*escrow, EscrowStatus::Completed);
    balances_.settle(escrow->seller, escrow->amount);
    profiles_.record_settlement(escrow->seller, elapsed_since(escrow->created_at, now));

    P2P_LOGF_INFO(logger_, Escrow, "escrow %llu completed", static_cast<ULL>(id));
    MarketEvent ev{EventType::PaymentConfirmed, now, caller, escrow->buyer, escrow->offer_id, id, escrow->amount};
    emit(ev);
    return Status::Ok;
}

Status EscrowEngine::cancel_escrow(EscrowId id, Principal caller, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Escrow, "cancel_escrow");

    Escrow* escrow = find_escrow(id);
    if (!escrow) return reject(Status::EscrowNotFound, logging::LogCategory::Escrow, "cancel_escrow");
    if (escrow->status != EscrowStatus::Pending) {
        return reject(Status::InvalidState, logging::LogCategory::Escrow, "cancel_escrow");
    }
    if (caller != escrow->buyer) return reject(Status::Unauthorized, logging::LogCategory::Escrow, "cancel_escrow");

    // Funds never left custody; releasing the lock is the whole refund
    close_escrow(*escrow, EscrowStatus::Cancelled);

    P2P_LOGF_INFO(logger_, Escrow, "escrow %llu cancelled", static_cast<ULL>(id));
    MarketEvent ev{EventType::EscrowCancelled, now, caller, escrow->seller, escrow->offer_id, id, escrow->amount};
    emit(ev);
    return Status::Ok;
}

Status EscrowEngine::raise_dispute(EscrowId id, Principal caller, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Dispute, "raise_dispute");

    Escrow* escrow = find_escrow(id);
    if (!escrow) return reject(Status::EscrowNotFound, logging::LogCategory::Dispute, "raise_dispute");
    if (escrow->status != EscrowStatus::Pending) {
        return reject(Status::InvalidState, logging::LogCategory::Dispute, "raise_dispute");
    }
    if (caller != escrow->buyer && caller != escrow->seller) {
        return reject(Status::Unauthorized, logging::LogCategory::Dispute, "raise_dispute");
    }

    escrow->status = EscrowStatus::Disputed;

    Principal other = caller == escrow->buyer ? escrow->seller : escrow->buyer;
    P2P_LOGF_INFO(logger_, Dispute, "escrow %llu disputed by %llu", static_cast<ULL>(id), static_cast<ULL>(caller));
    MarketEvent ev{EventType::DisputeRaised, now, caller, other, escrow->offer_id, id, escrow->amount};
    emit(ev);
    return Status::Ok;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Profile> EscrowEngine::profile(Principal who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Profile* p = profiles_.find(who);
    if (!p) return std::nullopt;
    return *p;
}

std::optional<Offer> EscrowEngine::offer(OfferId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Offer* o = offers_.find(id);
    if (!o) return std::nullopt;
    return *o;
}

std::optional<Escrow> EscrowEngine::escrow(EscrowId id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (id == INVALID_ESCROW_ID || id > escrows_.size()) return std::nullopt;
    return escrows_[id - 1];
}

Amount EscrowEngine::deposited_balance(Principal who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balances_.deposited(who);
}

Amount EscrowEngine::available_balance(Principal who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balances_.available(who);
}

BalanceRecord EscrowEngine::balance_record(Principal who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balances_.record(who);
}

Amount EscrowEngine::total_custody() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return balances_.total_deposited();
}

std::vector<OfferId> EscrowEngine::offers_of(Principal seller) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return offers_.offers_of(seller);
}

std::vector<EscrowId> EscrowEngine::escrows_of(Principal who) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = escrows_by_principal_.find(who);
    if (it == escrows_by_principal_.end()) return {};
    return it->second;
}

std::vector<OfferId> EscrowEngine::active_offers() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return offers_.active_offers();
}

size_t EscrowEngine::offer_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return offers_.size();
}

size_t EscrowEngine::escrow_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return escrows_.size();
}

bool EscrowEngine::check_invariants() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!balances_.invariant_holds()) return false;

    std::vector<uint32_t> open_counts(offers_.size(), 0);
    for (const auto& e : escrows_) {
        if (e.is_open()) open_counts[e.offer_id - 1]++;
    }
    for (OfferId id = 1; id <= offers_.size(); ++id) {
        if (offers_.find(id)->open_escrows != open_counts[id - 1]) return false;
    }
    return true;
}

void EscrowEngine::set_event_callback(EventCallback cb) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    on_event_ = std::move(cb);
}

void EscrowEngine::set_logger(logging::AsyncLogger* logger) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    logger_ = logger;
}

// =============================================================================
// Internals
// =============================================================================

Escrow* EscrowEngine::find_escrow(EscrowId id) {
    if (id == INVALID_ESCROW_ID || id > escrows_.size()) return nullptr;
    return &escrows_[id - 1];
}

void EscrowEngine::close_escrow(Escrow& escrow, EscrowStatus final_status) {
    assert(escrow.is_open());
    escrow.status = final_status;
    offers_.decrement_open(escrow.offer_id);
    balances_.unlock(escrow.seller, escrow.amount);
}

Status EscrowEngine::reject(Status status, uint8_t category, const char* op) {
    if (logger_) {
        logger_->logf(logging::LogLevel::Debug, category, "%s: %s", op, status_to_string(status));
    }
    return status;
}

void EscrowEngine::emit(const MarketEvent& event) {
    if (on_event_) on_event_(event);
}

}  // namespace p2p::market
