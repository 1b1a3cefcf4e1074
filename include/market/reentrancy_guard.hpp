#pragma once

namespace p2p {
namespace market {

/**
 * ReentrancyGuard - Scoped "one call at a time" flag
 *
 * The first guard on a flag acquires it; nested guards on the same flag
 * (a ledger callback calling back into the engine) do not, and the caller
 * rejects the nested call.
 */
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& entered) : entered_(entered), acquired_(!entered) {
        if (acquired_) entered_ = true;
    }

    ~ReentrancyGuard() {
        if (acquired_) entered_ = false;
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    bool& entered_;
    const bool acquired_;
};

}  // namespace market
}  // namespace p2p
