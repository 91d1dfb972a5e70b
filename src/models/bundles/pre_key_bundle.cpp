#include "ratchetcore/models/bundles/pre_key_bundle.hpp"
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/utilities/byte_codec.hpp"

namespace ratchetcore::protocol::models {
    using security::DhValidator;
    using utilities::ByteReader;
    using utilities::ByteWriter;

    PreKeyBundle::PreKeyBundle(
        const uint32_t registration_id,
        const uint32_t device_id,
        std::optional<BundlePreKey> pre_key,
        const uint32_t signed_pre_key_id,
        std::vector<uint8_t> signed_pre_key_public,
        std::vector<uint8_t> signed_pre_key_signature,
        IdentityPublicKey identity_key)
        : registration_id_(registration_id)
          , device_id_(device_id)
          , pre_key_(std::move(pre_key))
          , signed_pre_key_id_(signed_pre_key_id)
          , signed_pre_key_public_(std::move(signed_pre_key_public))
          , signed_pre_key_signature_(std::move(signed_pre_key_signature))
          , identity_key_(std::move(identity_key)) {
    }

    std::vector<uint8_t> PreKeyBundle::Serialize() const {
        ByteWriter writer;
        writer.WriteU32(registration_id_);
        writer.WriteU32(device_id_);
        writer.WriteU8(pre_key_.has_value() ? 1 : 0);
        if (pre_key_.has_value()) {
            writer.WriteU32(pre_key_->id);
            writer.WriteBytes(pre_key_->public_key);
        }
        writer.WriteU32(signed_pre_key_id_);
        writer.WriteBytes(signed_pre_key_public_);
        writer.WriteBytes(signed_pre_key_signature_);
        writer.WriteBytes(identity_key_.Serialize());
        return std::move(writer).Take();
    }

    Result<PreKeyBundle, ProtocolFailure> PreKeyBundle::Deserialize(std::span<const uint8_t> data) {
        auto malformed = [](const std::string& what) {
            return Result<PreKeyBundle, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Pre-key bundle: " + what));
        };

        ByteReader reader(data);
        uint32_t registration_id = 0;
        uint32_t device_id = 0;
        uint8_t has_pre_key = 0;
        if (!reader.ReadU32(registration_id) || !reader.ReadU32(device_id) || !reader.ReadU8(has_pre_key)) {
            return malformed(std::string(ErrorMessages::TRUNCATED));
        }
        if (has_pre_key > 1) {
            return malformed("invalid pre-key flag");
        }

        std::optional<BundlePreKey> pre_key;
        if (has_pre_key == 1) {
            uint32_t pre_key_id = 0;
            std::span<const uint8_t> pre_key_public;
            if (!reader.ReadU32(pre_key_id) || !reader.ReadBytes(kX25519PublicKeyBytes, pre_key_public)) {
                return malformed(std::string(ErrorMessages::TRUNCATED));
            }
            if (DhValidator::ValidateX25519PublicKey(pre_key_public).IsErr()) {
                return malformed("invalid one-time pre-key");
            }
            pre_key = BundlePreKey{pre_key_id, {pre_key_public.begin(), pre_key_public.end()}};
        }

        uint32_t signed_pre_key_id = 0;
        std::span<const uint8_t> signed_pre_key_public;
        std::span<const uint8_t> signature;
        std::span<const uint8_t> identity_bytes;
        if (!reader.ReadU32(signed_pre_key_id) ||
            !reader.ReadBytes(kX25519PublicKeyBytes, signed_pre_key_public) ||
            !reader.ReadBytes(kEd25519SignatureBytes, signature) ||
            !reader.ReadBytes(kEd25519PublicKeyBytes, identity_bytes)) {
            return malformed(std::string(ErrorMessages::TRUNCATED));
        }
        if (!reader.AtEnd()) {
            return malformed("trailing bytes");
        }
        if (DhValidator::ValidateX25519PublicKey(signed_pre_key_public).IsErr()) {
            return malformed("invalid signed pre-key");
        }
        auto identity_result = IdentityPublicKey::FromBytes(identity_bytes);
        if (identity_result.IsErr()) {
            return malformed("invalid identity key");
        }

        return Result<PreKeyBundle, ProtocolFailure>::Ok(PreKeyBundle(
            registration_id,
            device_id,
            std::move(pre_key),
            signed_pre_key_id,
            {signed_pre_key_public.begin(), signed_pre_key_public.end()},
            {signature.begin(), signature.end()},
            std::move(identity_result).Unwrap()));
    }

    Result<Unit, ProtocolFailure> PreKeyBundle::Verify() const {
        auto spk_check = DhValidator::ValidateX25519PublicKey(signed_pre_key_public_);
        if (spk_check.IsErr()) {
            return spk_check;
        }
        if (pre_key_.has_value()) {
            auto opk_check = DhValidator::ValidateX25519PublicKey(pre_key_->public_key);
            if (opk_check.IsErr()) {
                return opk_check;
            }
        }
        auto verify_result = identity_key_.Verify(signed_pre_key_public_, signed_pre_key_signature_);
        if (verify_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::VerificationFailure(
                std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
