#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <cstdint>
#include <vector>
#include <span>
namespace ratchetcore::protocol::chain_step {

/**
 * Keys for exactly one message plus the chain key that replaces the one they
 * were derived from. All buffers are wiped on destruction.
 */
struct MessageKeys {
    std::vector<uint8_t> cipher_key;
    std::vector<uint8_t> mac_key;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> next_chain_key;

    MessageKeys() = default;
    MessageKeys(MessageKeys&&) noexcept = default;
    MessageKeys& operator=(MessageKeys&&) noexcept = default;
    MessageKeys(const MessageKeys&) = delete;
    MessageKeys& operator=(const MessageKeys&) = delete;
    ~MessageKeys();

    /// First 12 bytes of the IV.
    [[nodiscard]] std::span<const uint8_t> Nonce() const noexcept;
};

struct RootStep {
    std::vector<uint8_t> root_key;
    std::vector<uint8_t> chain_key;

    RootStep() = default;
    RootStep(RootStep&&) noexcept = default;
    RootStep& operator=(RootStep&&) noexcept = default;
    RootStep(const RootStep&) = delete;
    RootStep& operator=(const RootStep&) = delete;
    ~RootStep();
};

/**
 * @brief Key derivation steps of the Double Ratchet
 *
 * Symmetric step:
 * ```
 * next_chain_key = HMAC-SHA256(chain_key, 0x02)
 * seed           = HMAC-SHA256(chain_key, 0x01)
 * cipher_key || mac_key || iv = HKDF(seed, salt = none, info = "WhisperMessageKeys", 80)
 * ```
 *
 * DH step:
 * ```
 * root_key' || chain_key = HKDF(dh_output, salt = root_key, info = "WhisperRatchet", 64)
 * ```
 */
class ChainStep {
public:
    [[nodiscard]] static Result<MessageKeys, ProtocolFailure> DeriveMessageKeys(
        std::span<const uint8_t> chain_key);
    [[nodiscard]] static Result<RootStep, ProtocolFailure> DeriveRootKey(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output);
private:
    ChainStep() = delete;
};
}
