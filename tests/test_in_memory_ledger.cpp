/**
 * In-Memory Ledger Tests
 *
 * Run with: ./test_in_memory_ledger
 */

#include <cassert>
#include <iostream>
#include <string>
#include "../include/ledger/in_memory_ledger.hpp"

using namespace p2p;
using namespace p2p::ledger;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)

TEST(test_mint_credits_wallet) {
    InMemoryLedger ledger;
    ledger.mint(1, tokens(50));
    ASSERT_TRUE(ledger.balance_of(1) == tokens(50));
    ASSERT_TRUE(ledger.total_minted() == tokens(50));
    ASSERT_TRUE(ledger.balance_of(2) == 0);
}

TEST(test_transfer_in_requires_allowance) {
    InMemoryLedger ledger;
    ledger.mint(1, tokens(50));
    ASSERT_EQ(ledger.transfer_in(1, tokens(10)), TransferResult::InsufficientAllowance);

    ledger.approve(1, tokens(10));
    ASSERT_EQ(ledger.transfer_in(1, tokens(10)), TransferResult::Ok);
    ASSERT_TRUE(ledger.balance_of(1) == tokens(40));
    ASSERT_TRUE(ledger.custody_balance() == tokens(10));
    ASSERT_TRUE(ledger.allowance_of(1) == 0);

    // Allowance is spent
    ASSERT_EQ(ledger.transfer_in(1, tokens(1)), TransferResult::InsufficientAllowance);
}

TEST(test_transfer_in_requires_funds) {
    InMemoryLedger ledger;
    ledger.mint(1, tokens(5));
    ledger.approve(1, tokens(100));
    ASSERT_EQ(ledger.transfer_in(1, tokens(6)), TransferResult::InsufficientFunds);
    ASSERT_TRUE(ledger.balance_of(1) == tokens(5));
    ASSERT_TRUE(ledger.allowance_of(1) == tokens(100));
    ASSERT_TRUE(ledger.custody_balance() == 0);
}

TEST(test_transfer_out_bounded_by_custody) {
    InMemoryLedger ledger;
    ledger.mint(1, tokens(20));
    ledger.approve(1, tokens(20));
    ASSERT_EQ(ledger.transfer_in(1, tokens(20)), TransferResult::Ok);

    ASSERT_EQ(ledger.transfer_out(2, tokens(21)), TransferResult::ReserveInsufficient);
    ASSERT_EQ(ledger.transfer_out(2, tokens(15)), TransferResult::Ok);
    ASSERT_TRUE(ledger.balance_of(2) == tokens(15));
    ASSERT_TRUE(ledger.custody_balance() == tokens(5));
    ASSERT_TRUE(ledger.balance_of(1) + ledger.balance_of(2) + ledger.custody_balance() == ledger.total_minted());
}

TEST(test_result_names) {
    ASSERT_EQ(std::string(transfer_result_to_string(TransferResult::Ok)), "Ok");
    ASSERT_EQ(std::string(transfer_result_to_string(TransferResult::ReserveInsufficient)), "ReserveInsufficient");
}

int main() {
    std::cout << "=== In-Memory Ledger Tests ===\n";

    RUN_TEST(test_mint_credits_wallet);
    RUN_TEST(test_transfer_in_requires_allowance);
    RUN_TEST(test_transfer_in_requires_funds);
    RUN_TEST(test_transfer_out_bounded_by_custody);
    RUN_TEST(test_result_names);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
