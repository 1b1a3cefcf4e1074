#include <cassert>
#include <iostream>
#include "../include/market/profile_registry.hpp"

using namespace p2p;
using namespace p2p::market;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

constexpr Timestamp T0 = 1'700'000'000;

TEST(test_create_profile) {
    ProfileRegistry reg;

    ASSERT_EQ(reg.create(1, "Joe", "joe@mail.com", "+234", T0), Status::Ok);

    const Profile* p = reg.find(1);
    ASSERT_TRUE(p != nullptr);
    ASSERT_TRUE(p->exists);
    ASSERT_EQ(p->name, "Joe");
    ASSERT_EQ(p->joined_at, T0);
    ASSERT_EQ(p->total_trades, 0u);
    ASSERT_EQ(p->completed_trades, 0u);
    ASSERT_EQ(p->disputed_trades, 0u);
    ASSERT_EQ(p->avg_settlement_secs, 0u);
}

TEST(test_create_twice_fails) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "a", "b", T0);

    ASSERT_EQ(reg.create(1, "Other", "c", "d", T0 + 5), Status::AlreadyExists);
    ASSERT_EQ(reg.find(1)->name, "Joe");
    ASSERT_EQ(reg.find(1)->joined_at, T0);
}

TEST(test_create_with_empty_string_fails) {
    ProfileRegistry reg;

    ASSERT_EQ(reg.create(1, "", "a", "b", T0), Status::InvalidInput);
    ASSERT_EQ(reg.create(1, "Joe", "", "b", T0), Status::InvalidInput);
    ASSERT_EQ(reg.create(1, "Joe", "a", "", T0), Status::InvalidInput);

    ASSERT_FALSE(reg.exists(1));
    ASSERT_EQ(reg.size(), 0u);
}

TEST(test_update_contacts_only) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "old@mail", "111", T0);

    ASSERT_EQ(reg.update(1, "new@mail", "222"), Status::Ok);
    ASSERT_EQ(reg.find(1)->primary_contact, "new@mail");
    ASSERT_EQ(reg.find(1)->secondary_contact, "222");
    ASSERT_EQ(reg.find(1)->name, "Joe");
}

TEST(test_update_requires_profile) {
    ProfileRegistry reg;
    ASSERT_EQ(reg.update(7, "a", "b"), Status::ProfileRequired);
}

TEST(test_update_rejects_empty) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "a", "b", T0);

    ASSERT_EQ(reg.update(1, "", "x"), Status::InvalidInput);
    ASSERT_EQ(reg.update(1, "x", ""), Status::InvalidInput);
    ASSERT_EQ(reg.find(1)->primary_contact, "a");
}

TEST(test_settlement_average) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "a", "b", T0);

    // First completion sets the mean directly
    reg.record_settlement(1, 3600);
    ASSERT_EQ(reg.find(1)->completed_trades, 1u);
    ASSERT_EQ(reg.find(1)->avg_settlement_secs, 3600u);

    // (3600 * 1 + 1800) / 2 = 2700
    reg.record_settlement(1, 1800);
    ASSERT_EQ(reg.find(1)->avg_settlement_secs, 2700u);

    // Integer division truncates: (2700 * 2 + 1001) / 3 = 2133
    reg.record_settlement(1, 1001);
    ASSERT_EQ(reg.find(1)->avg_settlement_secs, 2133u);
}

TEST(test_dispute_completion_counts_toward_mean_divisor) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "a", "b", T0);

    reg.record_completed(1);  // dispute win: counter only
    reg.record_settlement(1, 1000);

    // n = 2, previous mean 0: (0 * 1 + 1000) / 2
    ASSERT_EQ(reg.find(1)->completed_trades, 2u);
    ASSERT_EQ(reg.find(1)->avg_settlement_secs, 500u);
}

TEST(test_counters) {
    ProfileRegistry reg;
    reg.create(1, "Joe", "a", "b", T0);

    reg.record_trade_opened(1);
    reg.record_trade_opened(1);
    reg.record_disputed(1);

    ASSERT_EQ(reg.find(1)->total_trades, 2u);
    ASSERT_EQ(reg.find(1)->disputed_trades, 1u);
    ASSERT_EQ(reg.find(1)->completed_trades, 0u);
}

int main() {
    std::cout << "=== Profile Registry Tests ===\n";

    RUN_TEST(test_create_profile);
    RUN_TEST(test_create_twice_fails);
    RUN_TEST(test_create_with_empty_string_fails);
    RUN_TEST(test_update_contacts_only);
    RUN_TEST(test_update_requires_profile);
    RUN_TEST(test_update_rejects_empty);
    RUN_TEST(test_settlement_average);
    RUN_TEST(test_dispute_completion_counts_toward_mean_divisor);
    RUN_TEST(test_counters);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
