#pragma once

#include "iledger.hpp"

#include <functional>
#include <vector>

namespace p2p {
namespace ledger {

/**
 * MockLedger - Test implementation
 *
 * Accepts every transfer unless told otherwise and records it for
 * verification. A hook runs inside each transfer so tests can try to call
 * back into the engine mid-transfer.
 */
class MockLedger : public ILedger {
public:
    struct TransferRecord {
        bool inbound;
        Principal principal;
        Amount amount;
    };

    using TransferHook = std::function<void(const TransferRecord&)>;

    TransferResult transfer_in(Principal from, Amount amount) override {
        TransferRecord rec{true, from, amount};
        if (hook_) hook_(rec);

        if (fail_in_ != TransferResult::Ok) {
            TransferResult r = fail_in_;
            fail_in_ = TransferResult::Ok;
            return r;
        }
        transfers_.push_back(rec);
        return TransferResult::Ok;
    }

    TransferResult transfer_out(Principal to, Amount amount) override {
        TransferRecord rec{false, to, amount};
        if (hook_) hook_(rec);

        if (fail_out_ != TransferResult::Ok) {
            TransferResult r = fail_out_;
            fail_out_ = TransferResult::Ok;
            return r;
        }
        transfers_.push_back(rec);
        return TransferResult::Ok;
    }

    // Test helpers
    const std::vector<TransferRecord>& transfers() const { return transfers_; }
    size_t transfer_count() const { return transfers_.size(); }
    const TransferRecord& last_transfer() const { return transfers_.back(); }
    void clear() { transfers_.clear(); }

    // Simulate failures (one-shot)
    void fail_next_transfer_in(TransferResult r) { fail_in_ = r; }
    void fail_next_transfer_out(TransferResult r = TransferResult::ReserveInsufficient) { fail_out_ = r; }

    void set_hook(TransferHook hook) { hook_ = std::move(hook); }

private:
    std::vector<TransferRecord> transfers_;
    TransferResult fail_in_ = TransferResult::Ok;
    TransferResult fail_out_ = TransferResult::Ok;
    TransferHook hook_;
};

}  // namespace ledger
}  // namespace p2p
