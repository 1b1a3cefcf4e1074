#pragma once

#include "../types.hpp"

#include <unordered_map>

namespace p2p {
namespace market {

/**
 * BalanceRecord - Custody balance of one principal
 *
 * deposited: everything the principal has paid into custody and not yet
 *            withdrawn or paid out
 * locked:    the part of deposited reserved by open escrows
 *
 * Invariant: locked <= deposited
 */
struct BalanceRecord {
    Amount deposited = 0;
    Amount locked = 0;

    Amount available() const { return deposited - locked; }

    bool operator==(const BalanceRecord&) const = default;
};

/**
 * BalanceBook - Deposit/lock/unlock bookkeeping
 *
 * Pure accounting; moving value in and out of custody is the caller's job.
 * Withdrawals and new reservations only ever draw on available().
 */
class BalanceBook {
public:
    // Funds arrived in custody
    void credit(Principal who, Amount amount);

    // Funds left custody from the available pool (withdrawal)
    Status debit_available(Principal who, Amount amount);

    // Reserve for an escrow
    Status lock(Principal who, Amount amount);

    // Release a reservation made by lock()
    void unlock(Principal who, Amount amount);

    // Funds of a released reservation left custody (payout to a buyer)
    void settle(Principal who, Amount amount);

    Amount deposited(Principal who) const;
    Amount locked(Principal who) const;
    Amount available(Principal who) const;

    bool can_cover(Principal who, Amount amount) const { return available(who) >= amount; }

    // Sum of deposited over all principals; equals what custody must hold
    Amount total_deposited() const;

    BalanceRecord record(Principal who) const;

    // locked <= deposited for every principal
    bool invariant_holds() const;

private:
    std::unordered_map<Principal, BalanceRecord> records_;
};

}  // namespace market
}  // namespace p2p
