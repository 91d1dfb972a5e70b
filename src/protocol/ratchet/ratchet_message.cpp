#include "ratchetcore/protocol/ratchet/ratchet_message.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/core/format.hpp"
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/utilities/byte_codec.hpp"

namespace ratchetcore::protocol::ratchet {
    using security::DhValidator;
    using utilities::ByteReader;
    using utilities::ByteWriter;

    std::vector<uint8_t> MessageHeader::Serialize() const {
        ByteWriter writer(kMessageHeaderBytes);
        writer.WriteBytes(dh_ratchet_key);
        writer.WriteU32(previous_counter);
        writer.WriteU32(message_counter);
        return std::move(writer).Take();
    }

    Result<MessageHeader, ProtocolFailure> MessageHeader::Deserialize(std::span<const uint8_t> data) {
        if (data.size() != kMessageHeaderBytes) {
            return Result<MessageHeader, ProtocolFailure>::Err(ProtocolFailure::MalformedMessage(
                compat::format("Message header must be {} bytes, got {}", kMessageHeaderBytes, data.size())));
        }
        ByteReader reader(data);
        std::span<const uint8_t> ratchet_key;
        MessageHeader header;
        if (!reader.ReadBytes(kX25519PublicKeyBytes, ratchet_key) ||
            !reader.ReadU32(header.previous_counter) ||
            !reader.ReadU32(header.message_counter)) {
            return Result<MessageHeader, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage(std::string(ErrorMessages::TRUNCATED)));
        }
        auto key_check = DhValidator::ValidateX25519PublicKey(ratchet_key);
        if (key_check.IsErr()) {
            return Result<MessageHeader, ProtocolFailure>::Err(ProtocolFailure::MalformedMessage(
                "Message header ratchet key rejected: " + key_check.UnwrapErr().message));
        }
        header.dh_ratchet_key.assign(ratchet_key.begin(), ratchet_key.end());
        return Result<MessageHeader, ProtocolFailure>::Ok(std::move(header));
    }

    std::vector<uint8_t> RatchetMessage::Serialize() const {
        const auto header_bytes = header.Serialize();
        ByteWriter writer(4 + header_bytes.size() + ciphertext.size());
        writer.WriteU32(static_cast<uint32_t>(header_bytes.size()));
        writer.WriteBytes(header_bytes);
        writer.WriteBytes(ciphertext);
        return std::move(writer).Take();
    }

    Result<RatchetMessage, ProtocolFailure> RatchetMessage::Deserialize(std::span<const uint8_t> data) {
        if (data.size() > kMaxMessageBytes) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Ratchet message exceeds maximum size"));
        }
        ByteReader reader(data);
        uint32_t header_length = 0;
        std::span<const uint8_t> header_bytes;
        if (!reader.ReadU32(header_length) || !reader.ReadBytes(header_length, header_bytes)) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage(std::string(ErrorMessages::TRUNCATED)));
        }
        auto header_result = MessageHeader::Deserialize(header_bytes);
        if (header_result.IsErr()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(header_result.UnwrapErr());
        }
        const auto rest = reader.Rest();
        if (rest.size() < kAesGcmTagBytes) {
            return Result<RatchetMessage, ProtocolFailure>::Err(ProtocolFailure::MalformedMessage(
                std::string(ErrorMessages::CIPHERTEXT_TOO_SMALL)));
        }
        return Result<RatchetMessage, ProtocolFailure>::Ok(RatchetMessage{
            std::move(header_result).Unwrap(),
            std::vector<uint8_t>(rest.begin(), rest.end())});
    }
}
