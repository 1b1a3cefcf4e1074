#pragma once

#include "../types.hpp"

namespace p2p {
namespace auth {

/**
 * IAuthority - Decides who may resolve disputes
 *
 * Injected into the engine; checked before every resolve_dispute().
 */
class IAuthority {
public:
    virtual ~IAuthority() = default;

    virtual bool is_arbitrator(Principal who) const = 0;
};

/**
 * SingleArbitrator - One fixed arbitrator, set at construction
 */
class SingleArbitrator : public IAuthority {
public:
    explicit SingleArbitrator(Principal arbitrator) : arbitrator_(arbitrator) {}

    bool is_arbitrator(Principal who) const override {
        return who != NO_PRINCIPAL && who == arbitrator_;
    }

    Principal arbitrator() const { return arbitrator_; }

private:
    const Principal arbitrator_;
};

}  // namespace auth
}  // namespace p2p
