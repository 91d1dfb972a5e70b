#pragma once
#include "ratchetcore/models/keys/dh_key_pair.hpp"
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace ratchetcore::protocol::models {
class IdentityKeyPair;

/**
 * One-time pre-key. Consumed by the first initial message that names it.
 *
 * Record layout: id (4, BE) || private (32) || public (32).
 */
class PreKey {
public:
    static constexpr size_t SERIALIZED_SIZE = 4 + 32 + 32;
    static Result<PreKey, ProtocolFailure> Generate(uint32_t id);
    static Result<PreKey, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
    PreKey(uint32_t id, DhKeyPair key_pair);
    PreKey(PreKey&&) noexcept = default;
    PreKey& operator=(PreKey&&) noexcept = default;
    PreKey(const PreKey&) = delete;
    PreKey& operator=(const PreKey&) = delete;
    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] const DhKeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return key_pair_.GetPublicKey();
    }
    /// Contains private key material; the caller wipes the result.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] Result<PreKey, ProtocolFailure> Clone() const;
private:
    uint32_t id_;
    DhKeyPair key_pair_;
};

/**
 * Medium-term pre-key whose public half is signed by the identity key.
 *
 * Record layout: id (4) || private (32) || public (32) || signature (64) ||
 * timestamp (8, BE, Unix seconds).
 */
class SignedPreKey {
public:
    static constexpr size_t SERIALIZED_SIZE = 4 + 32 + 32 + 64 + 8;
    static Result<SignedPreKey, ProtocolFailure> Generate(uint32_t id, const IdentityKeyPair& identity);
    static Result<SignedPreKey, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
    SignedPreKey(uint32_t id, DhKeyPair key_pair, std::vector<uint8_t> signature, int64_t timestamp);
    SignedPreKey(SignedPreKey&&) noexcept = default;
    SignedPreKey& operator=(SignedPreKey&&) noexcept = default;
    SignedPreKey(const SignedPreKey&) = delete;
    SignedPreKey& operator=(const SignedPreKey&) = delete;
    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] const DhKeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return key_pair_.GetPublicKey();
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
    [[nodiscard]] int64_t GetTimestamp() const noexcept {
        return timestamp_;
    }
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] Result<SignedPreKey, ProtocolFailure> Clone() const;
private:
    uint32_t id_;
    DhKeyPair key_pair_;
    std::vector<uint8_t> signature_;
    int64_t timestamp_;
};
}
