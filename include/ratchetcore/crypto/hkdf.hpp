#pragma once

#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ratchetcore::protocol::crypto {

/**
 * HKDF-SHA256 (RFC 5869) through OpenSSL's EVP_KDF "HKDF" provider.
 *
 * Every derivation in the protocol (X3DH output, root step, message keys,
 * the state MAC key) runs extract-and-expand in a single call. An empty
 * salt means HASH_LEN zero bytes.
 */
class Hkdf {
public:
    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

    /// Fills output; InvalidInput for empty ikm or an output outside 1..MAX_OUTPUT_LEN.
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    Hkdf() = delete;
};

}
