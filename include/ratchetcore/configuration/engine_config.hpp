#pragma once

#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include <chrono>
#include <cstdint>

namespace ratchetcore::protocol::configuration {

/**
 * @brief Tunables for ProtocolEngine
 *
 * **Pre-key pool**: RefillPreKeysIfNeeded() generates `pre_key_batch_size`
 * keys whenever fewer than `pre_key_low_water_mark` remain.
 *
 * **Skipped message keys** (per session):
 * - `max_skip`: largest gap a single message may open in one chain
 * - `max_stored_skipped_keys`: total keys retained; oldest are evicted
 * - `skipped_key_max_age`: keys older than this are dropped after each
 *   successful decrypt
 *
 * **Usage Example**:
 * ```cpp
 * auto engine = ProtocolEngine::Create(store, EngineConfig::Default());
 *
 * // Relay that tolerates deep reordering
 * auto relay_config = EngineConfig::HighThroughput();
 * ```
 */
class EngineConfig {
public:
    constexpr EngineConfig(
        uint32_t pre_key_batch_size,
        uint32_t pre_key_low_water_mark,
        uint32_t max_skip,
        size_t max_stored_skipped_keys,
        std::chrono::seconds skipped_key_max_age) noexcept
        : pre_key_batch_size_(pre_key_batch_size)
        , pre_key_low_water_mark_(pre_key_low_water_mark)
        , max_skip_(max_skip)
        , max_stored_skipped_keys_(max_stored_skipped_keys)
        , skipped_key_max_age_(skipped_key_max_age) {}

    /// 100-key batches, refill below 10, skip 1000, store 2000, 7 days.
    [[nodiscard]] static constexpr EngineConfig Default() noexcept {
        return EngineConfig(
            kPreKeyBatchSize,
            kPreKeyLowWaterMark,
            kMaxSkip,
            kMaxStoredSkippedKeys,
            std::chrono::seconds(kDefaultSkippedKeyMaxAgeSeconds));
    }

    /// Larger pre-key batches and a deeper skipped-key store.
    [[nodiscard]] static constexpr EngineConfig HighThroughput() noexcept {
        return EngineConfig(
            500,
            50,
            kMaxSkip,
            4 * kMaxStoredSkippedKeys,
            std::chrono::seconds(kDefaultSkippedKeyMaxAgeSeconds));
    }

    /// Small skip window and one-day retention of skipped keys.
    [[nodiscard]] static constexpr EngineConfig Strict() noexcept {
        return EngineConfig(
            kPreKeyBatchSize,
            kPreKeyLowWaterMark,
            100,
            200,
            std::chrono::hours(24));
    }

    /**
     * @brief Reject configurations the engine cannot honour
     *
     * The batch must fit the pre-key id space, the store must be able to
     * hold one full skip window, and the age must be positive.
     */
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (pre_key_batch_size_ == 0 || pre_key_batch_size_ >= kMaxPreKeyId) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Pre-key batch size out of range"));
        }
        if (pre_key_low_water_mark_ > pre_key_batch_size_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Pre-key low-water mark exceeds batch size"));
        }
        if (max_skip_ == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Maximum skip must be positive"));
        }
        if (max_stored_skipped_keys_ < max_skip_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Skipped-key capacity is smaller than the skip window"));
        }
        if (skipped_key_max_age_ <= std::chrono::seconds::zero()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Skipped-key maximum age must be positive"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    [[nodiscard]] constexpr uint32_t GetPreKeyBatchSize() const noexcept { return pre_key_batch_size_; }
    [[nodiscard]] constexpr uint32_t GetPreKeyLowWaterMark() const noexcept { return pre_key_low_water_mark_; }
    [[nodiscard]] constexpr uint32_t GetMaxSkip() const noexcept { return max_skip_; }
    [[nodiscard]] constexpr size_t GetMaxStoredSkippedKeys() const noexcept { return max_stored_skipped_keys_; }
    [[nodiscard]] constexpr std::chrono::seconds GetSkippedKeyMaxAge() const noexcept { return skipped_key_max_age_; }

    [[nodiscard]] constexpr bool operator==(const EngineConfig& other) const noexcept = default;

private:
    uint32_t pre_key_batch_size_;
    uint32_t pre_key_low_water_mark_;
    uint32_t max_skip_;
    size_t max_stored_skipped_keys_;
    std::chrono::seconds skipped_key_max_age_;
};

}
