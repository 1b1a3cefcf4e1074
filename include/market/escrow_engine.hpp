#pragma once

/**
 * EscrowEngine - Escrow-mediated P2P trading
 *
 * Sellers deposit settlement asset into custody and post offers; buyers open
 * escrows that lock part of the seller's deposit; the escrow then settles:
 *
 *   PENDING --confirm_payment (seller)--> COMPLETED   (amount paid to buyer)
 *   PENDING --cancel_escrow (buyer)-----> CANCELLED   (lock released)
 *   PENDING --raise_dispute (either)----> DISPUTED
 *   DISPUTED --resolve_dispute (arbitrator)--> COMPLETED
 *
 * COMPLETED and CANCELLED are terminal.
 *
 * Every public mutator:
 * - runs under one engine mutex, so transitions never interleave
 * - is wrapped in a reentrancy guard; a ledger callback that calls back
 *   into any mutator gets Status::Reentrancy
 * - validates completely before touching state; a non-Ok status means
 *   nothing changed
 *
 * Time and caller identity are always explicit arguments.
 *
 * Usage:
 *   ledger::InMemoryLedger ledger;
 *   auth::SingleArbitrator arbitrator(900);
 *   EscrowEngine engine(ledger, arbitrator, config);
 *   engine.create_profile(seller, "Joe", "joe@mail", "+234", now);
 *   engine.deposit(seller, tokens(1000), now);
 *   OfferId offer;
 *   engine.create_offer(seller, params, now, offer);
 */

#include "../auth/authority.hpp"
#include "../config/engine_config.hpp"
#include "../ledger/iledger.hpp"
#include "../logging/async_logger.hpp"
#include "../types.hpp"
#include "balance_book.hpp"
#include "events.hpp"
#include "offer_book.hpp"
#include "profile_registry.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace p2p {
namespace market {

struct Escrow {
    EscrowId id = INVALID_ESCROW_ID;
    OfferId offer_id = INVALID_OFFER_ID;
    Principal buyer = NO_PRINCIPAL;
    Principal seller = NO_PRINCIPAL;
    Amount amount = 0;           // Locked settlement asset
    FiatAmount fiat_amount = 0;  // Display only, never transferred
    Timestamp created_at = 0;
    EscrowStatus status = EscrowStatus::Pending;

    bool is_open() const { return status == EscrowStatus::Pending || status == EscrowStatus::Disputed; }

    bool operator==(const Escrow&) const = default;
};

class EscrowEngine {
public:
    EscrowEngine(ledger::ILedger& ledger, const auth::IAuthority& authority,
                 const config::EngineConfig& config = config::EngineConfig{});

    EscrowEngine(const EscrowEngine&) = delete;
    EscrowEngine& operator=(const EscrowEngine&) = delete;

    // ========================================
    // Profiles
    // ========================================

    Status create_profile(Principal who, const std::string& name, const std::string& primary_contact,
                          const std::string& secondary_contact, Timestamp now);

    Status update_profile(Principal who, const std::string& primary_contact, const std::string& secondary_contact,
                          Timestamp now);

    // ========================================
    // Custody balance
    // ========================================

    // No profile needed; pulls amount from the ledger first
    Status deposit(Principal who, Amount amount, Timestamp now);

    // Draws on the available (unlocked) part only
    Status withdraw(Principal who, Amount amount, Timestamp now);

    // ========================================
    // Offers
    // ========================================

    /**
     * Post a sell offer.
     *
     * The seller must have at least max_trade available right now; nothing
     * is reserved, so several offers may together exceed the deposit.
     */
    Status create_offer(Principal seller, const OfferParams& params, Timestamp now, OfferId& out_id);

    Status deactivate_offer(OfferId id, Principal caller, Timestamp now);

    // ========================================
    // Escrow lifecycle
    // ========================================

    // Locks `amount` of the seller's deposit for the buyer
    Status open_escrow(Principal buyer, OfferId offer_id, Amount amount, Timestamp now, EscrowId& out_id);

    // Seller received the fiat payment; releases the escrow to the buyer
    Status confirm_payment(EscrowId id, Principal caller, Timestamp now);

    // Buyer backs out; the lock returns to the seller's available pool
    Status cancel_escrow(EscrowId id, Principal caller, Timestamp now);

    Status raise_dispute(EscrowId id, Principal caller, Timestamp now);

    /**
     * Arbitrator settles a DISPUTED escrow.
     *
     * favor_buyer: escrow amount is paid to the buyer; buyer gets the
     * completion, seller the dispute mark.
     * otherwise: the amount stays in the seller's deposit; seller gets the
     * completion, buyer the dispute mark.
     *
     * Settlement-time averages are left untouched on this path.
     */
    Status resolve_dispute(EscrowId id, bool favor_buyer, Principal caller, Timestamp now);

    // ========================================
    // Queries (return copies; safe from any thread)
    // ========================================

    std::optional<Profile> profile(Principal who) const;
    std::optional<Offer> offer(OfferId id) const;
    std::optional<Escrow> escrow(EscrowId id) const;

    Amount deposited_balance(Principal who) const;
    Amount available_balance(Principal who) const;
    BalanceRecord balance_record(Principal who) const;
    Amount total_custody() const;

    std::vector<OfferId> offers_of(Principal seller) const;
    std::vector<EscrowId> escrows_of(Principal who) const;
    std::vector<OfferId> active_offers() const;

    size_t offer_count() const;
    size_t escrow_count() const;

    // locked <= deposited everywhere and every offer's open count matches its open escrows
    bool check_invariants() const;

    // fiat = amount * price / PRICE_PRECISION
    static FiatAmount compute_fiat(Amount amount, UnitPrice price) { return amount * price / PRICE_PRECISION; }

    const config::EngineConfig& config() const { return config_; }

    void set_event_callback(EventCallback cb);
    void set_logger(logging::AsyncLogger* logger);

private:
    ledger::ILedger& ledger_;
    const auth::IAuthority& authority_;
    const config::EngineConfig config_;

    mutable std::recursive_mutex mutex_;
    bool entered_ = false;

    ProfileRegistry profiles_;
    BalanceBook balances_;
    OfferBook offers_;
    std::vector<Escrow> escrows_;  // escrows_[id - 1]
    std::unordered_map<Principal, std::vector<EscrowId>> escrows_by_principal_;

    EventCallback on_event_;
    logging::AsyncLogger* logger_ = nullptr;

    Escrow* find_escrow(EscrowId id);

    // Shared tail of every terminal transition out of an open escrow
    void close_escrow(Escrow& escrow, EscrowStatus final_status);

    Status reject(Status status, uint8_t category, const char* op);
    void emit(const MarketEvent& event);
};

}  // namespace market
}  // namespace p2p
