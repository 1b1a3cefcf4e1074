/**
 * String Utils Tests
 *
 * Run with: ./test_string_utils
 */

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/util/string_utils.hpp"

using namespace p2p;
using namespace p2p::util;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)

TEST(test_to_string) {
    ASSERT_EQ(to_string(0), "0");
    ASSERT_EQ(to_string(42), "42");
    // 1000 tokens at price 8000: 8e24 does not fit in 64 bits
    ASSERT_EQ(to_string(tokens(1000) * 8000), "8000000000000000000000000");
}

TEST(test_format_tokens) {
    ASSERT_EQ(format_tokens(0), "0");
    ASSERT_EQ(format_tokens(tokens(1000)), "1000");
    ASSERT_EQ(format_tokens(tokens(1) + PRICE_PRECISION / 2), "1.5");
    ASSERT_EQ(format_tokens(1), "0.000000000000000001");
}

TEST(test_parse_u128) {
    ASSERT_TRUE(parse_u128("0") == 0);
    ASSERT_TRUE(parse_u128("1000000000000000000000") == tokens(1000));
    ASSERT_TRUE(parse_u128(to_string(MAX_AMOUNT)) == MAX_AMOUNT);
}

TEST(test_parse_u128_rejects) {
    bool threw = false;
    try { parse_u128(""); } catch (const std::invalid_argument&) { threw = true; }
    ASSERT_TRUE(threw);

    threw = false;
    try { parse_u128("12a"); } catch (const std::invalid_argument&) { threw = true; }
    ASSERT_TRUE(threw);

    threw = false;
    try { parse_u128(to_string(MAX_AMOUNT) + "0"); } catch (const std::out_of_range&) { threw = true; }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "=== String Utils Tests ===\n";

    RUN_TEST(test_to_string);
    RUN_TEST(test_format_tokens);
    RUN_TEST(test_parse_u128);
    RUN_TEST(test_parse_u128_rejects);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
