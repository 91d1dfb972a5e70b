#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace ratchetcore::protocol::crypto {

/// AES-256-GCM via OpenSSL EVP. Output is ciphertext followed by the 16-byte tag.
/// A message key is never reused, so its derived nonce never repeats under it.
class AesGcm {
public:
    /// InvalidInput on a key that is not 32 bytes or a nonce that is not 12.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// DecryptionFailure when the tag does not authenticate.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> associated_data = {});

    AesGcm() = delete;
};

}
