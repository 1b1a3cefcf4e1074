/**
 * Engine Config Tests
 *
 * Run with: ./test_engine_config
 */

#include <cassert>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../include/config/engine_config.hpp"

using namespace p2p;
using namespace p2p::config;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

static bool parse_throws(const std::string& text) {
    try {
        ConfigLoader::parse(text);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

TEST(test_empty_object_keeps_defaults) {
    EngineConfig cfg = ConfigLoader::parse("{}");
    ASSERT_EQ(cfg.arbitrator, NO_PRINCIPAL);
    ASSERT_EQ(cfg.escrow_timeout_secs, 172800u);
    ASSERT_EQ(cfg.max_open_escrows_per_offer, 100u);
    ASSERT_EQ(cfg.log_level, 2);
}

TEST(test_overrides_applied) {
    EngineConfig cfg = ConfigLoader::parse(R"({
        "arbitrator": 77,
        "escrow_timeout_secs": 3600,
        "max_open_escrows_per_offer": 5,
        "log_level": "warn"
    })");
    ASSERT_EQ(cfg.arbitrator, 77u);
    ASSERT_EQ(cfg.escrow_timeout_secs, 3600u);
    ASSERT_EQ(cfg.max_open_escrows_per_offer, 5u);
    ASSERT_EQ(cfg.log_level, 3);
}

TEST(test_partial_override) {
    EngineConfig cfg = ConfigLoader::parse(R"({"max_open_escrows_per_offer": 3})");
    ASSERT_EQ(cfg.max_open_escrows_per_offer, 3u);
    ASSERT_EQ(cfg.escrow_timeout_secs, 172800u);
}

TEST(test_malformed_rejected) {
    ASSERT_TRUE(parse_throws("{"));
    ASSERT_TRUE(parse_throws("not json"));
    ASSERT_TRUE(parse_throws("[1, 2]"));
    ASSERT_TRUE(parse_throws("42"));
}

TEST(test_bad_values_rejected) {
    ASSERT_TRUE(parse_throws(R"({"arbitrator": "nine hundred"})"));
    ASSERT_TRUE(parse_throws(R"({"escrow_timeout_secs": 0})"));
    ASSERT_TRUE(parse_throws(R"({"max_open_escrows_per_offer": 0})"));
    ASSERT_TRUE(parse_throws(R"({"log_level": "loud"})"));
    ASSERT_TRUE(parse_throws(R"({"log_level": 3})"));
}

TEST(test_out_of_range_numbers_rejected) {
    // Negative numbers must not wrap into huge unsigned values
    ASSERT_TRUE(parse_throws(R"({"escrow_timeout_secs": -1})"));
    ASSERT_TRUE(parse_throws(R"({"max_open_escrows_per_offer": -5})"));
    ASSERT_TRUE(parse_throws(R"({"arbitrator": -900})"));

    // Larger than the field, or than the allowed window
    ASSERT_TRUE(parse_throws(R"({"max_open_escrows_per_offer": 5000000000})"));
    ASSERT_TRUE(parse_throws(R"({"escrow_timeout_secs": 18446744073709551615})"));
    ASSERT_TRUE(parse_throws(R"({"escrow_timeout_secs": 31536001})"));

    // Fractions are not counts
    ASSERT_TRUE(parse_throws(R"({"escrow_timeout_secs": 3600.5})"));
    ASSERT_TRUE(parse_throws(R"({"max_open_escrows_per_offer": 2.0})"));
}

TEST(test_range_limits_accepted) {
    EngineConfig cfg = ConfigLoader::parse(R"({
        "escrow_timeout_secs": 31536000,
        "max_open_escrows_per_offer": 4294967295
    })");
    ASSERT_EQ(cfg.escrow_timeout_secs, 31536000u);
    ASSERT_EQ(cfg.max_open_escrows_per_offer, 4294967295u);
}

TEST(test_log_level_names) {
    const char* names[] = {"trace", "debug", "info", "warn", "error", "fatal"};
    for (uint8_t i = 0; i < 6; ++i) {
        ASSERT_EQ(ConfigLoader::parse_log_level(names[i]), i);
        ASSERT_EQ(std::string(ConfigLoader::log_level_name(i)), names[i]);
    }
    ASSERT_EQ(std::string(ConfigLoader::log_level_name(200)), "info");
}

TEST(test_save_then_load) {
    EngineConfig cfg;
    cfg.arbitrator = 4242;
    cfg.escrow_timeout_secs = 900;
    cfg.max_open_escrows_per_offer = 12;
    cfg.log_level = 1;

    std::string path = "/tmp/p2p_engine_config_test.json";
    ConfigLoader::save(path, cfg);
    EngineConfig loaded = ConfigLoader::load(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded.arbitrator, 4242u);
    ASSERT_EQ(loaded.escrow_timeout_secs, 900u);
    ASSERT_EQ(loaded.max_open_escrows_per_offer, 12u);
    ASSERT_EQ(loaded.log_level, 1);
}

TEST(test_missing_file_throws) {
    bool threw = false;
    try {
        ConfigLoader::load("/nonexistent/dir/engine.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

int main() {
    std::cout << "=== Engine Config Tests ===\n";

    RUN_TEST(test_empty_object_keeps_defaults);
    RUN_TEST(test_overrides_applied);
    RUN_TEST(test_partial_override);
    RUN_TEST(test_malformed_rejected);
    RUN_TEST(test_bad_values_rejected);
    RUN_TEST(test_out_of_range_numbers_rejected);
    RUN_TEST(test_range_limits_accepted);
    RUN_TEST(test_log_level_names);
    RUN_TEST(test_save_then_load);
    RUN_TEST(test_missing_file_throws);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
