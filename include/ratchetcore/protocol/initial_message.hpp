#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace ratchetcore::protocol {

/**
 * First message of a conversation direction: the X3DH public parameters
 * wrapped around a serialized RatchetMessage.
 *
 * version (1) || identity_key (32) || ephemeral_key (32) || has_pre_key (1)
 * [|| pre_key_id (4)] || signed_pre_key_id (4) || length (4) || ratchet message
 */
struct InitialMessage {
    uint8_t version = kInitialMessageVersion;
    std::vector<uint8_t> identity_key;
    std::vector<uint8_t> ephemeral_key;
    std::optional<uint32_t> pre_key_id;
    uint32_t signed_pre_key_id = 0;
    std::vector<uint8_t> encrypted_message;

    [[nodiscard]] std::vector<uint8_t> Serialize() const;
    [[nodiscard]] static Result<InitialMessage, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
};
}
