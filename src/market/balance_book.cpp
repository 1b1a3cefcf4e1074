#include "../../include/market/balance_book.hpp"

#include <cassert>

namespace p2p::market {

void BalanceBook::credit(Principal who, Amount amount) {
    records_[who].deposited += amount;
}

Status BalanceBook::debit_available(Principal who, Amount amount) {
    auto it = records_.find(who);
    if (it == records_.end() || it->second.available() < amount) {
        return Status::InsufficientBalance;
    }
    it->second.deposited -= amount;
    return Status::Ok;
}

Status BalanceBook::lock(Principal who, Amount amount) {
    auto it = records_.find(who);
    if (it == records_.end() || it->second.available() < amount) {
        return Status::InsufficientBalance;
    }
    it->second.locked += amount;
    return Status::Ok;
}

void BalanceBook::unlock(Principal who, Amount amount) {
    BalanceRecord& rec = records_[who];
    assert(rec.locked >= amount && "unlock without matching lock");
    rec.locked -= amount;
}

void BalanceBook::settle(Principal who, Amount amount) {
    BalanceRecord& rec = records_[who];
    assert(rec.available() >= amount && "settling more than the released reservation");
    rec.deposited -= amount;
}

Amount BalanceBook::deposited(Principal who) const {
    auto it = records_.find(who);
    return it == records_.end() ? 0 : it->second.deposited;
}

Amount BalanceBook::locked(Principal who) const {
    auto it = records_.find(who);
    return it == records_.end() ? 0 : it->second.locked;
}

Amount BalanceBook::available(Principal who) const {
    auto it = records_.find(who);
    return it == records_.end() ? 0 : it->second.available();
}

Amount BalanceBook::total_deposited() const {
    Amount total = 0;
    for (const auto& [who, rec] : records_) {
        total += rec.deposited;
    }
    return total;
}

BalanceRecord BalanceBook::record(Principal who) const {
    auto it = records_.find(who);
    return it == records_.end() ? BalanceRecord{} : it->second;
}

bool BalanceBook::invariant_holds() const {
    for (const auto& [who, rec] : records_) {
        if (rec.locked > rec.deposited) return false;
    }
    return true;
}

}  // namespace p2p::market
