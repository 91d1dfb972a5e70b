#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/models/keys/dh_key_pair.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/protocol/ratchet/ratchet_message.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace ratchetcore::protocol {

enum class SessionPhase {
    /// Sending chain only; nothing received from the peer yet.
    InitiatorEstablished,
    /// No chains; waits for the peer's first ratchet message.
    ResponderPending,
    Bidirectional
};

struct SessionLimits {
    uint32_t max_skip = kMaxSkip;
    size_t max_stored_skipped_keys = kMaxStoredSkippedKeys;
};

struct SkippedKeyId {
    std::array<uint8_t, kX25519PublicKeyBytes> ratchet_key{};
    uint32_t counter = 0;

    auto operator<=>(const SkippedKeyId&) const = default;
};

struct SkippedKey {
    std::vector<uint8_t> cipher_key;
    std::vector<uint8_t> mac_key;
    std::vector<uint8_t> iv;
    std::chrono::system_clock::time_point created_at;
    /// Insertion order; the lowest value is evicted first.
    uint64_t sequence = 0;

    SkippedKey() = default;
    SkippedKey(const SkippedKey&) = default;
    SkippedKey& operator=(const SkippedKey&) = default;
    SkippedKey(SkippedKey&&) noexcept = default;
    SkippedKey& operator=(SkippedKey&&) noexcept = default;
    ~SkippedKey();
};

/**
 * @brief Double Ratchet state for one peer
 *
 * Encrypt and Decrypt are all-or-nothing: on any failure the state is left
 * exactly as it was before the call. Decrypt works on a clone and commits it
 * only after the AEAD tag verifies.
 *
 * Skipped message keys are bounded twice. A single message may not skip more
 * than SessionLimits::max_skip keys of one chain (TooManySkippedMessages), and
 * the total store never holds more than max_stored_skipped_keys entries; the
 * oldest insertions are evicted to make room.
 *
 * Not thread-safe. ProtocolEngine serializes access per address.
 */
class SessionState {
public:
    /**
     * Initiator side after X3DH. Performs the first DH ratchet step against
     * the responder's signed pre-key so the sending chain is ready.
     */
    [[nodiscard]] static Result<SessionState, ProtocolFailure> InitializeAsInitiator(
        std::span<const uint8_t> shared_secret,
        models::DhKeyPair our_ratchet_key,
        std::span<const uint8_t> their_ratchet_key,
        SessionLimits limits = {});

    /**
     * Responder side after X3DH. @p our_ratchet_key is the signed pre-key
     * pair the initiator ratcheted against.
     */
    [[nodiscard]] static Result<SessionState, ProtocolFailure> InitializeAsResponder(
        std::span<const uint8_t> shared_secret,
        models::DhKeyPair our_ratchet_key,
        SessionLimits limits = {});

    SessionState(SessionState&&) noexcept = default;
    SessionState& operator=(SessionState&& other) noexcept;
    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;
    ~SessionState();

    [[nodiscard]] Result<ratchet::RatchetMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const ratchet::RatchetMessage& message);

    /// Removes skipped keys older than @p max_age. Returns how many were removed.
    size_t CleanupSkippedKeys(
        std::chrono::seconds max_age,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] SessionPhase GetPhase() const noexcept;
    [[nodiscard]] bool HasSendingChain() const noexcept { return sending_chain_key_.has_value(); }
    [[nodiscard]] bool HasReceivingChain() const noexcept { return receiving_chain_key_.has_value(); }
    [[nodiscard]] bool IsInitiator() const noexcept { return initiator_; }
    [[nodiscard]] uint32_t GetSendingCounter() const noexcept { return sending_counter_; }
    [[nodiscard]] uint32_t GetReceivingCounter() const noexcept { return receiving_counter_; }
    [[nodiscard]] uint32_t GetPreviousCounter() const noexcept { return previous_counter_; }
    [[nodiscard]] size_t GetSkippedKeyCount() const noexcept { return skipped_keys_.size(); }
    [[nodiscard]] bool HasSkippedKey(std::span<const uint8_t> ratchet_key, uint32_t counter) const;
    [[nodiscard]] const std::vector<uint8_t>& GetOurRatchetPublicKey() const noexcept {
        return dh_self_.GetPublicKey();
    }
    [[nodiscard]] const std::optional<std::vector<uint8_t>>& GetRemoteRatchetPublicKey() const noexcept {
        return dh_remote_;
    }
    [[nodiscard]] const SessionLimits& GetLimits() const noexcept { return limits_; }
    void SetLimits(SessionLimits limits) noexcept { limits_ = limits; }

    [[nodiscard]] Result<SessionState, ProtocolFailure> Clone() const;

    /// Deterministic protobuf record authenticated with a key derived from the root key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<SessionState, ProtocolFailure> Deserialize(
        std::span<const uint8_t> data,
        SessionLimits limits = {});

private:
    SessionState(models::DhKeyPair dh_self, std::vector<uint8_t> root_key, bool initiator, SessionLimits limits);

    Result<std::vector<uint8_t>, ProtocolFailure> DecryptInPlace(const ratchet::RatchetMessage& message);
    Result<std::vector<uint8_t>, ProtocolFailure> DecryptWithSkippedKey(
        std::map<SkippedKeyId, SkippedKey>::iterator entry,
        const ratchet::RatchetMessage& message);
    Result<Unit, ProtocolFailure> SkipMessageKeys(uint32_t until);
    Result<Unit, ProtocolFailure> DhRatchet(std::span<const uint8_t> their_ratchet_key);
    void EnforceSkippedKeyCapacity();
    void WipeSecrets() noexcept;

    models::DhKeyPair dh_self_;
    std::optional<std::vector<uint8_t>> dh_remote_;
    std::vector<uint8_t> root_key_;
    std::optional<std::vector<uint8_t>> sending_chain_key_;
    std::optional<std::vector<uint8_t>> receiving_chain_key_;
    uint32_t sending_counter_ = 0;
    uint32_t receiving_counter_ = 0;
    uint32_t previous_counter_ = 0;
    std::map<SkippedKeyId, SkippedKey> skipped_keys_;
    uint64_t next_skipped_sequence_ = 0;
    bool initiator_ = false;
    SessionLimits limits_;
};
}
