#pragma once
#include "ratchetcore/crypto/sodium_secure_memory_handle.hpp"
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
#include <string_view>
namespace ratchetcore::protocol::models {

/**
 * X25519 key pair used for ratchet keys, one-time pre-keys and signed
 * pre-keys. The scalar lives in sodium_malloc memory and is zeroed when the
 * pair is destroyed.
 */
class DhKeyPair {
public:
    static Result<DhKeyPair, ProtocolFailure> Generate(std::string_view purpose = "ratchet");
    static Result<DhKeyPair, ProtocolFailure> FromPrivateKey(std::span<const uint8_t> private_key);
    DhKeyPair(DhKeyPair&&) noexcept = default;
    DhKeyPair& operator=(DhKeyPair&&) noexcept = default;
    DhKeyPair(const DhKeyPair&) = delete;
    DhKeyPair& operator=(const DhKeyPair&) = delete;
    ~DhKeyPair() = default;
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return std::span<const uint8_t>(public_key_);
    }
    /// Copy of the scalar; the caller wipes it.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetPrivateKeyBytes() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Agree(
        std::span<const uint8_t> their_public_key) const;
    [[nodiscard]] Result<DhKeyPair, ProtocolFailure> Clone() const;
private:
    DhKeyPair(crypto::SecureMemoryHandle private_key_handle, std::vector<uint8_t> public_key);
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
