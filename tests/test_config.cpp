#include <gtest/gtest.h>

#include "shroud/config/ConfigLoader.hpp"
#include "shroud/config/EngineConfig.hpp"

using namespace shroud;

namespace {

const char* kIni = R"(
# comment
[engine]
principal = 0x00000000000000000000000000000000000000e1
pool_manager = 0x00000000000000000000000000000000000000e2
deviation_mode = signed
log_events = false

; another comment
[governance]
principal = 0x00000000000000000000000000000000000000e3
vote_threshold = 2
executors = 0x01 , 0x02,, 0x03

[timing]
cooldown_blocks = 4
stale_multiplier = 6
spread_divisor = 3

[persistence]
snapshot_path = /tmp/snap.json
)";

}

TEST(ConfigLoaderTest, ParsesSectionsAndValues) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(kIni));

    EXPECT_TRUE(loader.has("engine", "principal"));
    EXPECT_FALSE(loader.has("engine", "missing"));
    EXPECT_EQ(loader.get("engine", "missing", "fallback"), "fallback");
    EXPECT_EQ(loader.getInt("timing", "cooldown_blocks"), 4);
    EXPECT_FALSE(loader.getBool("engine", "log_events", true));

    auto executors = loader.getList("governance", "executors");
    ASSERT_EQ(executors.size(), 3u);
    EXPECT_EQ(executors[0], "0x01");
    EXPECT_EQ(executors[2], "0x03");
}

TEST(ConfigLoaderTest, NonNumericFallsBackToDefault) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString("[timing]\ncooldown_blocks = soon\n"));
    EXPECT_EQ(loader.getInt("timing", "cooldown_blocks", 9), 9);
}

TEST(EngineConfigTest, MapsLoaderOntoFields) {
    ConfigLoader loader;
    ASSERT_TRUE(loader.loadFromString(kIni));

    EngineConfig cfg = EngineConfig::fromLoader(loader);
    EXPECT_EQ(cfg.engine_principal, "0x00000000000000000000000000000000000000e1");
    EXPECT_EQ(cfg.pool_manager, "0x00000000000000000000000000000000000000e2");
    EXPECT_EQ(cfg.governance, "0x00000000000000000000000000000000000000e3");
    EXPECT_EQ(cfg.deviation_mode, DeviationMode::SIGNED);
    EXPECT_FALSE(cfg.log_events);
    EXPECT_EQ(cfg.vote_threshold, 2u);
    EXPECT_EQ(cfg.executors.size(), 3u);
    EXPECT_EQ(cfg.cooldown_blocks, 4u);
    EXPECT_EQ(cfg.stale_multiplier, 6u);
    EXPECT_EQ(cfg.spread_divisor, 3u);
    EXPECT_EQ(cfg.basis_points, 10000);
    EXPECT_EQ(cfg.snapshot_path, "/tmp/snap.json");
    EXPECT_TRUE(cfg.audit_journal_path.empty());
}

TEST(EngineConfigTest, DefaultsWhenSectionsMissing) {
    ConfigLoader loader;
    loader.loadFromString("[other]\nkey = value\n");

    EngineConfig cfg = EngineConfig::fromLoader(loader);
    EXPECT_EQ(cfg.deviation_mode, DeviationMode::ABSOLUTE);
    EXPECT_EQ(cfg.vote_threshold, 3u);
    EXPECT_EQ(cfg.stale_multiplier, 10u);
    EXPECT_EQ(cfg.spread_divisor, 5u);
    EXPECT_TRUE(cfg.executors.empty());
}

TEST(EngineConfigTest, RejectsUnusableValues) {
    ConfigLoader bad_mode;
    bad_mode.loadFromString("[engine]\ndeviation_mode = squared\n");
    EXPECT_THROW(EngineConfig::fromLoader(bad_mode), std::invalid_argument);

    ConfigLoader zero_threshold;
    zero_threshold.loadFromString("[governance]\nvote_threshold = 0\n");
    EXPECT_THROW(EngineConfig::fromLoader(zero_threshold), std::invalid_argument);

    ConfigLoader negative_threshold;
    negative_threshold.loadFromString("[governance]\nvote_threshold = -1\n");
    EXPECT_THROW(EngineConfig::fromLoader(negative_threshold),
                 std::invalid_argument);

    ConfigLoader huge_threshold;
    huge_threshold.loadFromString("[governance]\nvote_threshold = 4294967296\n");
    EXPECT_THROW(EngineConfig::fromLoader(huge_threshold),
                 std::invalid_argument);

    ConfigLoader negative_cooldown;
    negative_cooldown.loadFromString("[timing]\ncooldown_blocks = -1\n");
    EXPECT_THROW(EngineConfig::fromLoader(negative_cooldown),
                 std::invalid_argument);

    ConfigLoader negative_multiplier;
    negative_multiplier.loadFromString("[timing]\nstale_multiplier = -10\n");
    EXPECT_THROW(EngineConfig::fromLoader(negative_multiplier),
                 std::invalid_argument);

    EngineConfig cfg;
    cfg.spread_divisor = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(EngineConfigTest, DeviationModeNames) {
    EXPECT_STREQ(deviationModeToString(DeviationMode::SIGNED), "signed");
    EXPECT_EQ(deviationModeFromString("absolute"), DeviationMode::ABSOLUTE);
}
