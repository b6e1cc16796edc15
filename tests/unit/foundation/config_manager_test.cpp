#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "duel/foundation/config_manager.hpp"

using namespace duel::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                (std::string("duel_config_test_") +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".yaml");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void writeFile(const std::string& body) {
        std::ofstream out(path_);
        out << body;
    }

    std::filesystem::path path_;
    ConfigManager config_;
};

// ===========================================================================
// Loading
// ===========================================================================

TEST_F(ConfigManagerTest, LoadFileFlattensNestedKeys) {
    writeFile(
        "duel:\n"
        "  style_lock_seconds: 10\n"
        "  control_bar:\n"
        "    start: 50.0\n"
        "  default_style: balanced\n");

    ASSERT_TRUE(config_.load(path_).hasValue());
    EXPECT_EQ(config_.get<int>("duel.style_lock_seconds").value(), 10);
    EXPECT_DOUBLE_EQ(config_.get<double>("duel.control_bar.start").value(), 50.0);
    EXPECT_EQ(config_.get<std::string>("duel.default_style").value(), "balanced");
}

TEST_F(ConfigManagerTest, MissingFileIsLoadError) {
    auto result = config_.load(path_.string() + ".missing");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlIsLoadError) {
    auto result = config_.loadString("duel: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonMappingRootIsRejected) {
    auto result = config_.loadString("- a\n- b\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ReloadReplacesPreviousEntries) {
    ASSERT_TRUE(config_.loadString("duel:\n  max_rounds: 5\n").hasValue());
    ASSERT_TRUE(config_.loadString("duel:\n  ticker_hz: 20\n").hasValue());
    EXPECT_FALSE(config_.hasKey("duel.max_rounds"));
    EXPECT_TRUE(config_.hasKey("duel.ticker_hz"));
}

// ===========================================================================
// Typed access
// ===========================================================================

TEST_F(ConfigManagerTest, MissingKeyAndTypeMismatch) {
    ASSERT_TRUE(config_.loadString("duel:\n  default_style: balanced\n").hasValue());

    auto missing = config_.get<int>("duel.max_rounds");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto mismatch = config_.get<int>("duel.default_style");
    ASSERT_TRUE(mismatch.hasError());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBack) {
    ASSERT_TRUE(config_.loadString("duel:\n  default_style: guard\n").hasValue());
    EXPECT_EQ(config_.getOr<int>("duel.max_rounds", 7), 7);
    EXPECT_EQ(config_.getOr<int>("duel.default_style", 3), 3);
    EXPECT_EQ(config_.getOr<std::string>("duel.default_style", "x"), "guard");
}

TEST_F(ConfigManagerTest, GetIfPresentFallsBackOnlyWhenAbsent) {
    ASSERT_TRUE(config_.loadString("duel:\n  ticker_hz: fast\n  max_rounds: 5\n").hasValue());

    auto absent = config_.getIfPresent<int>("duel.broadcast_threads", 2);
    ASSERT_TRUE(absent.hasValue());
    EXPECT_EQ(absent.value(), 2);

    auto present = config_.getIfPresent<int>("duel.max_rounds", 0);
    ASSERT_TRUE(present.hasValue());
    EXPECT_EQ(present.value(), 5);

    auto mistyped = config_.getIfPresent<int>("duel.ticker_hz", 10);
    ASSERT_TRUE(mistyped.hasError());
    EXPECT_EQ(mistyped.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ===========================================================================
// Prefix enumeration
// ===========================================================================

TEST_F(ConfigManagerTest, KeysWithPrefixAreSortedAndScoped) {
    ASSERT_TRUE(config_.loadString(
        "duel:\n"
        "  styles:\n"
        "    guard:\n"
        "      opponent_hit_mult: 0.8\n"
        "    aggressive:\n"
        "      self_hit_mult: 0.8\n"
        "  stylesheet: other\n").hasValue());

    auto keys = config_.keysWithPrefix("duel.styles");
    std::vector<std::string> expected = {
        "duel.styles.aggressive.self_hit_mult",
        "duel.styles.guard.opponent_hit_mult",
    };
    EXPECT_EQ(keys, expected);
    EXPECT_TRUE(config_.keysWithPrefix("duel.nothing").empty());
}

// ===========================================================================
// Set and watch
// ===========================================================================

TEST_F(ConfigManagerTest, SetNotifiesWatchers) {
    int calls = 0;
    std::string seenKey;
    config_.watch("duel.max_rounds", [&](std::string_view key) {
        ++calls;
        seenKey = std::string(key);
    });

    config_.set("duel.max_rounds", 12);
    config_.set("duel.ticker_hz", 5);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seenKey, "duel.max_rounds");
    EXPECT_EQ(config_.get<int>("duel.max_rounds").value(), 12);
}
