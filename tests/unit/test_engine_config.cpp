#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/configuration/engine_config.hpp"
using namespace ratchetcore::protocol;
using ratchetcore::protocol::configuration::EngineConfig;
TEST_CASE("EngineConfig - Presets", "[config]") {
    SECTION("Default matches protocol constants") {
        constexpr auto config = EngineConfig::Default();
        STATIC_REQUIRE(config.GetPreKeyBatchSize() == kPreKeyBatchSize);
        STATIC_REQUIRE(config.GetPreKeyLowWaterMark() == kPreKeyLowWaterMark);
        STATIC_REQUIRE(config.GetMaxSkip() == kMaxSkip);
        STATIC_REQUIRE(config.GetMaxStoredSkippedKeys() == kMaxStoredSkippedKeys);
        REQUIRE(config.GetSkippedKeyMaxAge() == std::chrono::hours(24 * 7));
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("HighThroughput") {
        const auto config = EngineConfig::HighThroughput();
        REQUIRE(config.GetPreKeyBatchSize() > EngineConfig::Default().GetPreKeyBatchSize());
        REQUIRE(config.GetMaxStoredSkippedKeys() > kMaxStoredSkippedKeys);
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Strict") {
        const auto config = EngineConfig::Strict();
        REQUIRE(config.GetMaxSkip() < kMaxSkip);
        REQUIRE(config.GetSkippedKeyMaxAge() == std::chrono::hours(24));
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Presets differ") {
        REQUIRE_FALSE(EngineConfig::Default() == EngineConfig::Strict());
        REQUIRE(EngineConfig::Default() == EngineConfig::Default());
    }
}
TEST_CASE("EngineConfig - Validation", "[config]") {
    const auto week = std::chrono::seconds(kDefaultSkippedKeyMaxAgeSeconds);
    auto expect_invalid = [](const EngineConfig& config) {
        auto result = config.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    };
    SECTION("Empty pre-key batch") {
        expect_invalid(EngineConfig(0, 0, kMaxSkip, kMaxStoredSkippedKeys, week));
    }
    SECTION("Batch exhausts the id space") {
        expect_invalid(EngineConfig(kMaxPreKeyId, 10, kMaxSkip, kMaxStoredSkippedKeys, week));
    }
    SECTION("Low-water mark above batch") {
        expect_invalid(EngineConfig(10, 11, kMaxSkip, kMaxStoredSkippedKeys, week));
    }
    SECTION("Zero skip window") {
        expect_invalid(EngineConfig(100, 10, 0, kMaxStoredSkippedKeys, week));
    }
    SECTION("Store smaller than the skip window") {
        expect_invalid(EngineConfig(100, 10, 500, 499, week));
    }
    SECTION("Non-positive age") {
        expect_invalid(EngineConfig(100, 10, kMaxSkip, kMaxStoredSkippedKeys, std::chrono::seconds(0)));
    }
    SECTION("Tight but valid") {
        REQUIRE(EngineConfig(1, 1, 1, 1, std::chrono::seconds(1)).Validate().IsOk());
    }
}
