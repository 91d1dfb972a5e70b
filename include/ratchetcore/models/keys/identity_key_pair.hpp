#pragma once
#include "ratchetcore/crypto/sodium_secure_memory_handle.hpp"
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace ratchetcore::protocol::models {

/**
 * Ed25519 identity public key as published in bundles and initial messages.
 *
 * Construction validates that the point maps onto Curve25519, so ToX25519()
 * cannot fail for an instance that exists.
 */
class IdentityPublicKey {
public:
    static Result<IdentityPublicKey, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] const std::vector<uint8_t>& Serialize() const noexcept {
        return key_;
    }
    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return std::span<const uint8_t>(key_);
    }
    [[nodiscard]] const std::vector<uint8_t>& ToX25519() const noexcept {
        return dh_key_;
    }
    [[nodiscard]] Result<Unit, ProtocolFailure> Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const;
    bool operator==(const IdentityPublicKey& other) const noexcept {
        return key_ == other.key_;
    }
private:
    IdentityPublicKey(std::vector<uint8_t> key, std::vector<uint8_t> dh_key)
        : key_(std::move(key)), dh_key_(std::move(dh_key)) {}
    std::vector<uint8_t> key_;
    std::vector<uint8_t> dh_key_;
};

/**
 * Long-term Ed25519 identity.
 *
 * The same key signs pre-keys and takes part in X3DH: its X25519 form is the
 * clamped SHA-512(seed) scalar, which libsodium pairs with the
 * Edwards-to-Montgomery map of the public key.
 */
class IdentityKeyPair {
public:
    static Result<IdentityKeyPair, ProtocolFailure> Generate();
    /// Rebuild from the 32-byte seed returned by GetPrivateKeyBytes().
    static Result<IdentityKeyPair, ProtocolFailure> FromPrivateKey(std::span<const uint8_t> seed);
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;
    ~IdentityKeyPair() = default;
    [[nodiscard]] const IdentityPublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetDhPublicKey() const noexcept {
        return public_key_.ToX25519();
    }
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetPrivateKeyBytes() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::span<const uint8_t> message) const;
    /// X25519 agreement between our converted identity scalar and @p their_public_key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Agree(
        std::span<const uint8_t> their_public_key) const;
private:
    IdentityKeyPair(
        crypto::SecureMemoryHandle signing_key,
        crypto::SecureMemoryHandle dh_private_key,
        IdentityPublicKey public_key);
    static Result<IdentityKeyPair, ProtocolFailure> FromSodiumKeyPair(
        crypto::SecureMemoryHandle signing_key,
        std::vector<uint8_t> public_key);
    crypto::SecureMemoryHandle signing_key_;
    crypto::SecureMemoryHandle dh_private_key_;
    IdentityPublicKey public_key_;
};
}
