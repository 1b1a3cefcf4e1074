#include "../../include/market/escrow_engine.hpp"
#include "../../include/market/reentrancy_guard.hpp"

namespace p2p::market {

Status EscrowEngine::resolve_dispute(EscrowId id, bool favor_buyer, Principal caller, Timestamp now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.acquired()) return reject(Status::Reentrancy, logging::LogCategory::Dispute, "resolve_dispute");

    if (!authority_.is_arbitrator(caller)) {
        return reject(Status::Unauthorized, logging::LogCategory::Dispute, "resolve_dispute");
    }

    Escrow* escrow = find_escrow(id);
    if (!escrow) return reject(Status::EscrowNotFound, logging::LogCategory::Dispute, "resolve_dispute");
    if (escrow->status != EscrowStatus::Disputed) {
        return reject(Status::InvalidState, logging::LogCategory::Dispute, "resolve_dispute");
    }

    if (favor_buyer) {
        ledger::TransferResult r = ledger_.transfer_out(escrow->buyer, escrow->amount);
        if (r != ledger::TransferResult::Ok) {
            P2P_LOGF_WARN(logger_, Ledger, "resolve %llu: %s", static_cast<unsigned long long>(id),
                          ledger::transfer_result_to_string(r));
            return Status::TransferFailed;
        }

        close_escrow(*escrow, EscrowStatus::Completed);
        // The payout left custody, so it leaves the seller's deposit too
        balances_.settle(escrow->seller, escrow->amount);
        profiles_.record_completed(escrow->buyer);
        profiles_.record_disputed(escrow->seller);
    } else {
        // Amount simply stays in the seller's deposit
        close_escrow(*escrow, EscrowStatus::Completed);
        profiles_.record_completed(escrow->seller);
        profiles_.record_disputed(escrow->buyer);
    }

    P2P_LOGF_INFO(logger_, Dispute, "escrow %llu resolved for %s", static_cast<unsigned long long>(id),
                  favor_buyer ? "buyer" : "seller");
    MarketEvent ev{EventType::DisputeResolved, now, caller, favor_buyer ? escrow->buyer : escrow->seller,
                   escrow->offer_id, id, escrow->amount};
    ev.favor_buyer = favor_buyer;
    emit(ev);
    return Status::Ok;
}

}  // namespace p2p::market
