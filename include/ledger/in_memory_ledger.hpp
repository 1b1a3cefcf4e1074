#pragma once

#include "iledger.hpp"

#include <unordered_map>

namespace p2p {
namespace ledger {

/**
 * InMemoryLedger - Process-local settlement asset
 *
 * Holds external balances and custody allowances per principal plus the
 * custody reserve the engine draws on for payouts. Transfers follow token
 * semantics: a principal must approve() custody before transfer_in().
 *
 * Invariant: sum(balances) + custody_balance() == total minted.
 */
class InMemoryLedger : public ILedger {
public:
    // Create value out of thin air (faucet for demos and tests)
    void mint(Principal to, Amount amount) {
        balances_[to] += amount;
        total_minted_ += amount;
    }

    // Allow custody to pull up to `amount` from `owner`
    void approve(Principal owner, Amount amount) { allowances_[owner] = amount; }

    TransferResult transfer_in(Principal from, Amount amount) override {
        Amount& allowance = allowances_[from];
        if (allowance < amount) {
            return TransferResult::InsufficientAllowance;
        }
        Amount& balance = balances_[from];
        if (balance < amount) {
            return TransferResult::InsufficientFunds;
        }
        balance -= amount;
        allowance -= amount;
        custody_ += amount;
        return TransferResult::Ok;
    }

    TransferResult transfer_out(Principal to, Amount amount) override {
        if (custody_ < amount) {
            return TransferResult::ReserveInsufficient;
        }
        custody_ -= amount;
        balances_[to] += amount;
        return TransferResult::Ok;
    }

    Amount balance_of(Principal who) const {
        auto it = balances_.find(who);
        return it == balances_.end() ? 0 : it->second;
    }

    Amount allowance_of(Principal who) const {
        auto it = allowances_.find(who);
        return it == allowances_.end() ? 0 : it->second;
    }

    Amount custody_balance() const { return custody_; }
    Amount total_minted() const { return total_minted_; }

private:
    std::unordered_map<Principal, Amount> balances_;
    std::unordered_map<Principal, Amount> allowances_;
    Amount custody_ = 0;
    Amount total_minted_ = 0;
};

}  // namespace ledger
}  // namespace p2p
