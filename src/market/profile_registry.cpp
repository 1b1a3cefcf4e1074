#include "../../include/market/profile_registry.hpp"

#include <utility>

namespace p2p::market {

Status ProfileRegistry::create(Principal who, const std::string& name, const std::string& primary_contact,
                               const std::string& secondary_contact, Timestamp now) {
    if (exists(who)) {
        return Status::AlreadyExists;
    }
    if (name.empty() || primary_contact.empty() || secondary_contact.empty()) {
        return Status::InvalidInput;
    }

    Profile profile;
    profile.name = name;
    profile.primary_contact = primary_contact;
    profile.secondary_contact = secondary_contact;
    profile.joined_at = now;
    profile.exists = true;
    profiles_.emplace(who, std::move(profile));
    return Status::Ok;
}

Status ProfileRegistry::update(Principal who, const std::string& primary_contact,
                               const std::string& secondary_contact) {
    auto it = profiles_.find(who);
    if (it == profiles_.end()) {
        return Status::ProfileRequired;
    }
    if (primary_contact.empty() || secondary_contact.empty()) {
        return Status::InvalidInput;
    }

    it->second.primary_contact = primary_contact;
    it->second.secondary_contact = secondary_contact;
    return Status::Ok;
}

const Profile* ProfileRegistry::find(Principal who) const {
    auto it = profiles_.find(who);
    return it == profiles_.end() ? nullptr : &it->second;
}

void ProfileRegistry::record_trade_opened(Principal who) {
    at(who).total_trades++;
}

void ProfileRegistry::record_settlement(Principal who, Duration elapsed) {
    Profile& p = at(who);
    p.completed_trades++;

    // n counts every completion, including dispute wins that never fed the mean
    uint64_t n = p.completed_trades;
    if (n == 1) {
        p.avg_settlement_secs = elapsed;
    } else {
        p.avg_settlement_secs = (p.avg_settlement_secs * (n - 1) + elapsed) / n;
    }
}

void ProfileRegistry::record_completed(Principal who) {
    at(who).completed_trades++;
}

void ProfileRegistry::record_disputed(Principal who) {
    at(who).disputed_trades++;
}

// Escrow participants always have profiles; a miss here is an engine bug
Profile& ProfileRegistry::at(Principal who) {
    return profiles_.at(who);
}

}  // namespace p2p::market
