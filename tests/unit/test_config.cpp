#include <gtest/gtest.h>
#include "config/config.h"
#include "core/errors.h"
#include <cstdlib>

using namespace tabbit;

TEST(ConfigTest, test_config_defaults) {
    Config cfg;
    EXPECT_EQ(cfg.sides_per_room, 2);
    EXPECT_EQ(cfg.panel_size, 1);
    EXPECT_TRUE(cfg.avoid_institution_clash);
    EXPECT_EQ(cfg.bye_policy, ByePolicy::LowestRankBye);
    EXPECT_EQ(cfg.pairing_method, PairingMethod::Adjacent);
    EXPECT_FALSE(cfg.tie_break_seed.has_value());
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ConfigTest, test_get_config_singleton_same_address) {
    auto& cfg1 = get_config();
    auto& cfg2 = get_config();
    EXPECT_EQ(&cfg1, &cfg2);
}

TEST(ConfigTest, test_config_reads_numbers_from_env) {
    setenv("TABBIT_SIDES_PER_ROOM", "4", 1);
    setenv("TABBIT_PANEL_SIZE", "3", 1);
    Config cfg = Config::from_env();
    EXPECT_EQ(cfg.sides_per_room, 4);
    EXPECT_EQ(cfg.panel_size, 3);
    unsetenv("TABBIT_SIDES_PER_ROOM");
    unsetenv("TABBIT_PANEL_SIZE");
}

TEST(ConfigTest, test_config_malformed_number_keeps_default) {
    setenv("TABBIT_SIDES_PER_ROOM", "two", 1);
    EXPECT_NO_THROW({
        Config cfg = Config::from_env();
        EXPECT_EQ(cfg.sides_per_room, 2);
    });
    setenv("TABBIT_SIDES_PER_ROOM", "3x", 1);
    EXPECT_EQ(Config::from_env().sides_per_room, 2);
    unsetenv("TABBIT_SIDES_PER_ROOM");
}

TEST(ConfigTest, test_config_enum_and_flag_options) {
    setenv("TABBIT_BYE_POLICY", "no_bye", 1);
    setenv("TABBIT_PAIRING_METHOD", "folded", 1);
    setenv("TABBIT_AVOID_INSTITUTION_CLASH", "false", 1);
    setenv("TABBIT_TIE_BREAK_SEED", "42", 1);
    Config cfg = Config::from_env();
    EXPECT_EQ(cfg.bye_policy, ByePolicy::NoBye);
    EXPECT_EQ(cfg.pairing_method, PairingMethod::Folded);
    EXPECT_FALSE(cfg.avoid_institution_clash);
    ASSERT_TRUE(cfg.tie_break_seed.has_value());
    EXPECT_EQ(*cfg.tie_break_seed, 42u);
    unsetenv("TABBIT_BYE_POLICY");
    unsetenv("TABBIT_PAIRING_METHOD");
    unsetenv("TABBIT_AVOID_INSTITUTION_CLASH");
    unsetenv("TABBIT_TIE_BREAK_SEED");
}

TEST(ConfigTest, test_config_unknown_enum_keeps_default) {
    setenv("TABBIT_BYE_POLICY", "sometimes", 1);
    EXPECT_EQ(Config::from_env().bye_policy, ByePolicy::LowestRankBye);
    unsetenv("TABBIT_BYE_POLICY");
}

TEST(ConfigTest, test_validate_rejects_non_positive_sides) {
    Config cfg;
    cfg.sides_per_room = 0;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
    cfg.sides_per_room = -2;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(ConfigTest, test_validate_rejects_non_positive_panel) {
    Config cfg;
    cfg.panel_size = 0;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(ConfigTest, test_validate_rejects_negative_swap_bounds) {
    Config cfg;
    cfg.max_swap_distance = -1;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(ConfigTest, test_config_out_of_range_number_keeps_default) {
    setenv("TABBIT_WORKER_THREADS", "-1", 1);
    setenv("TABBIT_SIDES_PER_ROOM", "4294967298", 1);
    Config cfg = Config::from_env();
    EXPECT_EQ(cfg.worker_threads, 2u);
    EXPECT_EQ(cfg.sides_per_room, 2);
    EXPECT_NO_THROW(cfg.validate());
    unsetenv("TABBIT_WORKER_THREADS");
    unsetenv("TABBIT_SIDES_PER_ROOM");
}

TEST(ConfigTest, test_validate_caps_worker_threads) {
    Config cfg;
    cfg.worker_threads = Config::kMaxWorkerThreads;
    EXPECT_NO_THROW(cfg.validate());
    cfg.worker_threads = Config::kMaxWorkerThreads + 1;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
    cfg.worker_threads = 0;
    EXPECT_THROW(cfg.validate(), ConfigurationError);
}

TEST(ConfigTest, test_config_malformed_seed_left_unset) {
    for (const char* raw : {"12abc", "-5", "+7", " 9", ""}) {
        setenv("TABBIT_TIE_BREAK_SEED", raw, 1);
        EXPECT_FALSE(Config::from_env().tie_break_seed.has_value()) << "seed '" << raw << "'";
    }
    setenv("TABBIT_TIE_BREAK_SEED", "18446744073709551615", 1);
    auto seed = Config::from_env().tie_break_seed;
    ASSERT_TRUE(seed.has_value());
    EXPECT_EQ(*seed, 18446744073709551615ull);
    unsetenv("TABBIT_TIE_BREAK_SEED");
}
