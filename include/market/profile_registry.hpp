#pragma once

#include "../types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace p2p {
namespace market {

/**
 * Profile - Identity and reputation of one principal
 *
 * Counters only ever grow. avg_settlement_secs is the running mean of
 * open -> confirm durations, updated by confirmed payments only.
 */
struct Profile {
    std::string name;
    std::string primary_contact;
    std::string secondary_contact;
    Timestamp joined_at = 0;
    uint64_t total_trades = 0;     // Escrows opened as buyer or seller
    uint64_t completed_trades = 0;
    uint64_t disputed_trades = 0;  // Disputes lost
    Duration avg_settlement_secs = 0;
    bool exists = false;

    bool operator==(const Profile&) const = default;
};

/**
 * ProfileRegistry - One profile per principal, never deleted
 *
 * Gate for trading: offers and escrows require an existing profile.
 */
class ProfileRegistry {
public:
    Status create(Principal who, const std::string& name, const std::string& primary_contact,
                  const std::string& secondary_contact, Timestamp now);

    // Only the contact fields are mutable after creation
    Status update(Principal who, const std::string& primary_contact, const std::string& secondary_contact);

    bool exists(Principal who) const { return find(who) != nullptr; }

    const Profile* find(Principal who) const;

    size_t size() const { return profiles_.size(); }

    // Reputation updates, driven by escrow transitions
    void record_trade_opened(Principal who);
    void record_settlement(Principal who, Duration elapsed);
    void record_completed(Principal who);
    void record_disputed(Principal who);

private:
    std::unordered_map<Principal, Profile> profiles_;

    Profile& at(Principal who);
};

}  // namespace market
}  // namespace p2p
