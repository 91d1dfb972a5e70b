#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetcore::protocol::ratchet {

/**
 * ratchet key (32) || previous_counter (4, BE) || message_counter (4, BE)
 *
 * The serialized header is the AEAD associated data of the message.
 */
struct MessageHeader {
    std::vector<uint8_t> dh_ratchet_key;
    uint32_t previous_counter = 0;
    uint32_t message_counter = 0;

    [[nodiscard]] std::vector<uint8_t> Serialize() const;
    /// Rejects wrong length and invalid ratchet keys with MalformedMessage.
    [[nodiscard]] static Result<MessageHeader, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
};

/**
 * header length (4, BE) || header || ciphertext
 */
struct RatchetMessage {
    MessageHeader header;
    std::vector<uint8_t> ciphertext;

    [[nodiscard]] std::vector<uint8_t> Serialize() const;
    [[nodiscard]] static Result<RatchetMessage, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
};
}
