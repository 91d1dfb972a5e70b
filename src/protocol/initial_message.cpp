#include "ratchetcore/protocol/initial_message.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/core/format.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/utilities/byte_codec.hpp"

namespace ratchetcore::protocol {
    using security::DhValidator;
    using utilities::ByteReader;
    using utilities::ByteWriter;

    std::vector<uint8_t> InitialMessage::Serialize() const {
        ByteWriter writer;
        writer.WriteU8(version);
        writer.WriteBytes(identity_key);
        writer.WriteBytes(ephemeral_key);
        writer.WriteU8(pre_key_id.has_value() ? 1 : 0);
        if (pre_key_id.has_value()) {
            writer.WriteU32(*pre_key_id);
        }
        writer.WriteU32(signed_pre_key_id);
        writer.WriteU32(static_cast<uint32_t>(encrypted_message.size()));
        writer.WriteBytes(encrypted_message);
        return std::move(writer).Take();
    }

    Result<InitialMessage, ProtocolFailure> InitialMessage::Deserialize(std::span<const uint8_t> data) {
        auto malformed = [](const std::string& what) {
            return Result<InitialMessage, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Initial message: " + what));
        };
        if (data.size() > kMaxMessageBytes) {
            return malformed("exceeds maximum size");
        }

        ByteReader reader(data);
        InitialMessage message;
        std::span<const uint8_t> identity_key;
        std::span<const uint8_t> ephemeral_key;
        uint8_t has_pre_key = 0;
        if (!reader.ReadU8(message.version) ||
            !reader.ReadBytes(kEd25519PublicKeyBytes, identity_key) ||
            !reader.ReadBytes(kX25519PublicKeyBytes, ephemeral_key) ||
            !reader.ReadU8(has_pre_key)) {
            return malformed(std::string(ErrorMessages::TRUNCATED));
        }
        if (message.version != kInitialMessageVersion) {
            return malformed(compat::format("unsupported version {}", message.version));
        }
        if (has_pre_key > 1) {
            return malformed("invalid pre-key flag");
        }
        if (has_pre_key == 1) {
            uint32_t pre_key_id = 0;
            if (!reader.ReadU32(pre_key_id)) {
                return malformed(std::string(ErrorMessages::TRUNCATED));
            }
            message.pre_key_id = pre_key_id;
        }
        uint32_t ciphertext_length = 0;
        std::span<const uint8_t> ciphertext;
        if (!reader.ReadU32(message.signed_pre_key_id) ||
            !reader.ReadU32(ciphertext_length) ||
            !reader.ReadBytes(ciphertext_length, ciphertext)) {
            return malformed(std::string(ErrorMessages::TRUNCATED));
        }
        if (!reader.AtEnd()) {
            return malformed("trailing bytes");
        }
        if (models::IdentityPublicKey::FromBytes(identity_key).IsErr()) {
            return malformed("invalid identity key");
        }
        if (DhValidator::ValidateX25519PublicKey(ephemeral_key).IsErr()) {
            return malformed("invalid ephemeral key");
        }
        message.identity_key.assign(identity_key.begin(), identity_key.end());
        message.ephemeral_key.assign(ephemeral_key.begin(), ephemeral_key.end());
        message.encrypted_message.assign(ciphertext.begin(), ciphertext.end());
        return Result<InitialMessage, ProtocolFailure>::Ok(std::move(message));
    }
}
