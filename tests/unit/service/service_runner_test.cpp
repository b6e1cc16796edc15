#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "duel/service/server_config.hpp"
#include "duel/service/service_runner.hpp"
#include "duel/service/stat_provider.hpp"

using namespace duel::service;
using duel::foundation::ConfigManager;
using duel::foundation::ErrorCode;
using duel::game::BaseStats;

// ===========================================================================
// Command line and config file
// ===========================================================================

TEST(ServiceRunnerTest, ParseConfigArg) {
    char prog[] = "duel_server";
    char flag[] = "--config";
    char path[] = "/tmp/duel.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/duel.yaml"));

    char* bare[] = {prog};
    EXPECT_TRUE(parseConfigArg(1, bare).empty());

    char* dangling[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, dangling).empty());
}

TEST(ServiceRunnerTest, LoadConfigHonoursEnvironmentOverride) {
    auto file = std::filesystem::temp_directory_path() / "duel_runner_env_test.yaml";
    {
        std::ofstream out(file);
        out << "duel:\n  ticker_hz: 25\n";
    }
    ::setenv(kConfigPathEnv, file.c_str(), 1);

    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/duel.yaml");
    ::unsetenv(kConfigPathEnv);
    std::filesystem::remove(file);

    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.get<int>("duel.ticker_hz").value(), 25);
}

TEST(ServiceRunnerTest, LoadConfigReportsMissingFile) {
    ::unsetenv(kConfigPathEnv);
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/duel.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ServiceRunnerTest, RequestShutdownSetsFlag) {
    SignalHandler handler;
    EXPECT_FALSE(handler.shutdownRequested());
    SignalHandler::requestShutdown();
    EXPECT_TRUE(handler.shutdownRequested());
    handler.waitForShutdown();
}

// ===========================================================================
// Settings
// ===========================================================================

TEST(ServerSettingsTest, DefaultsWhenKeysAbsent) {
    ConfigManager config;
    auto settings = buildServiceSettings(config);
    ASSERT_TRUE(settings.hasValue());
    const auto& s = settings.value();
    EXPECT_EQ(s.server.rules.timings.styleLock, std::chrono::seconds(10));
    EXPECT_EQ(s.server.rules.timings.swingPhase, std::chrono::seconds(30));
    EXPECT_EQ(s.server.rules.maxRounds, 0u);
    EXPECT_DOUBLE_EQ(s.server.rules.controlBarStart, 50.0);
    EXPECT_EQ(s.tickerHz, 10u);
    EXPECT_EQ(s.broadcastThreads, 2u);
}

TEST(ServerSettingsTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(
        "duel:\n"
        "  style_lock_seconds: 5\n"
        "  swing_phase_seconds: 12.5\n"
        "  max_rounds: 9\n"
        "  control_bar:\n"
        "    start: 40\n"
        "  push:\n"
        "    margin_bonus: 5\n"
        "  ticker_hz: 20\n"
        "  broadcast_threads: 4\n").hasValue());

    auto settings = buildServiceSettings(config);
    ASSERT_TRUE(settings.hasValue());
    const auto& s = settings.value();
    EXPECT_EQ(s.server.rules.timings.styleLock, std::chrono::milliseconds(5000));
    EXPECT_EQ(s.server.rules.timings.swingPhase, std::chrono::milliseconds(12500));
    EXPECT_EQ(s.server.rules.maxRounds, 9u);
    EXPECT_DOUBLE_EQ(s.server.rules.controlBarStart, 40.0);
    EXPECT_DOUBLE_EQ(s.server.pushCurve.marginBonus, 5.0);
    EXPECT_EQ(s.tickerHz, 20u);
    EXPECT_EQ(s.broadcastThreads, 4u);
}

TEST(ServerSettingsTest, RejectsOutOfRangeValues) {
    const char* documents[] = {
        "duel:\n  style_lock_seconds: 0\n",
        "duel:\n  swing_phase_seconds: -3\n",
        "duel:\n  max_rounds: -1\n",
        "duel:\n  control_bar:\n    start: 100\n",
        "duel:\n  ticker_hz: 0\n",
        "duel:\n  broadcast_threads: 0\n",
        "duel:\n  push:\n    miss: -1\n",
    };
    for (const char* doc : documents) {
        SCOPED_TRACE(doc);
        ConfigManager config;
        ASSERT_TRUE(config.loadString(doc).hasValue());
        auto settings = buildServiceSettings(config);
        ASSERT_TRUE(settings.hasError());
        EXPECT_EQ(settings.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST(ServerSettingsTest, ReportsMistypedValues) {
    const char* documents[] = {
        "duel:\n  style_lock_seconds: ten\n",
        "duel:\n  max_rounds: many\n",
        "duel:\n  control_bar:\n    start: middle\n",
        "duel:\n  push:\n    hit: big\n",
        "duel:\n  ticker_hz: [10]\n",
    };
    for (const char* doc : documents) {
        SCOPED_TRACE(doc);
        ConfigManager config;
        ASSERT_TRUE(config.loadString(doc).hasValue());
        auto settings = buildServiceSettings(config);
        ASSERT_TRUE(settings.hasError());
        EXPECT_EQ(settings.error().code(), ErrorCode::ConfigTypeMismatch);
    }
}

// ===========================================================================
// Stat provider
// ===========================================================================

TEST(StaticStatProviderTest, DefaultsAndOverrides) {
    StaticStatProvider provider;
    auto base = provider.lookup(PlayerId(5));
    ASSERT_TRUE(base.hasValue());
    EXPECT_DOUBLE_EQ(base.value().baseHitChance, 0.65);
    EXPECT_DOUBLE_EQ(base.value().baseCritRate, 0.10);
    EXPECT_EQ(base.value().baseRollCap, 3);

    ASSERT_TRUE(provider.setOverride(PlayerId(5), BaseStats{0.8, 0.2, 4}).hasValue());
    EXPECT_DOUBLE_EQ(provider.lookup(PlayerId(5)).value().baseHitChance, 0.8);
    EXPECT_DOUBLE_EQ(provider.lookup(PlayerId(6)).value().baseHitChance, 0.65);

    provider.clearOverride(PlayerId(5));
    EXPECT_DOUBLE_EQ(provider.lookup(PlayerId(5)).value().baseHitChance, 0.65);
}

TEST(StaticStatProviderTest, RejectsInvalidInput) {
    StaticStatProvider provider;
    EXPECT_EQ(provider.lookup(PlayerId()).error().code(), ErrorCode::StatLookupFailed);
    EXPECT_EQ(provider.setOverride(PlayerId(), BaseStats{}).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(provider.setOverride(PlayerId(1), BaseStats{1.5, 0.1, 3}).error().code(),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(provider.setOverride(PlayerId(1), BaseStats{0.5, 0.1, 0}).error().code(),
              ErrorCode::InvalidArgument);
}

TEST(StaticStatProviderTest, FromConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(
        "duel:\n"
        "  base_swing_cap: 5\n"
        "  stats:\n"
        "    base_hit_chance: 0.7\n"
        "    base_crit_rate: 0.15\n").hasValue());
    auto provider = StaticStatProvider::fromConfig(config);
    ASSERT_TRUE(provider.hasValue());
    EXPECT_DOUBLE_EQ(provider.value().defaults().baseHitChance, 0.7);
    EXPECT_DOUBLE_EQ(provider.value().defaults().baseCritRate, 0.15);
    EXPECT_EQ(provider.value().defaults().baseRollCap, 5);

    ConfigManager bad;
    ASSERT_TRUE(bad.loadString("duel:\n  stats:\n    base_crit_rate: 2\n").hasValue());
    EXPECT_TRUE(StaticStatProvider::fromConfig(bad).hasError());

    ConfigManager mistyped;
    ASSERT_TRUE(mistyped.loadString("duel:\n  base_swing_cap: three\n").hasValue());
    auto rejected = StaticStatProvider::fromConfig(mistyped);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ConfigTypeMismatch);
}
