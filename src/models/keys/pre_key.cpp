#include "ratchetcore/models/keys/pre_key.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/utilities/byte_codec.hpp"
#include <algorithm>
#include <chrono>

namespace ratchetcore::protocol::models {
    using crypto::SodiumInterop;
    using utilities::ByteReader;
    using utilities::ByteWriter;

    namespace {
        Result<Unit, ProtocolFailure> WriteKeyRecord(
            const uint32_t id,
            const DhKeyPair& key_pair,
            ByteWriter& writer) {
            auto private_result = key_pair.GetPrivateKeyBytes();
            if (private_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(private_result.UnwrapErr());
            }
            auto private_key = std::move(private_result).Unwrap();
            writer.WriteU32(id);
            writer.WriteBytes(private_key);
            writer.WriteBytes(key_pair.GetPublicKey());
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(private_key));
            (void)_wipe;
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<DhKeyPair, ProtocolFailure> ReadKeyRecord(ByteReader& reader, uint32_t& id) {
            std::span<const uint8_t> private_key;
            std::span<const uint8_t> public_key;
            if (!reader.ReadU32(id) ||
                !reader.ReadBytes(kX25519PrivateKeyBytes, private_key) ||
                !reader.ReadBytes(kX25519PublicKeyBytes, public_key)) {
                return Result<DhKeyPair, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Pre-key record is truncated"));
            }
            auto key_pair_result = DhKeyPair::FromPrivateKey(private_key);
            if (key_pair_result.IsErr()) {
                return key_pair_result;
            }
            auto key_pair = std::move(key_pair_result).Unwrap();
            if (!std::equal(public_key.begin(), public_key.end(),
                            key_pair.GetPublicKey().begin(), key_pair.GetPublicKey().end())) {
                return Result<DhKeyPair, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Pre-key record public key does not match private key"));
            }
            return Result<DhKeyPair, ProtocolFailure>::Ok(std::move(key_pair));
        }
    }

    PreKey::PreKey(const uint32_t id, DhKeyPair key_pair)
        : id_(id), key_pair_(std::move(key_pair)) {
    }

    Result<PreKey, ProtocolFailure> PreKey::Generate(const uint32_t id) {
        auto key_pair_result = DhKeyPair::Generate("one-time pre-key");
        if (key_pair_result.IsErr()) {
            return Result<PreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        return Result<PreKey, ProtocolFailure>::Ok(PreKey(id, std::move(key_pair_result).Unwrap()));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> PreKey::Serialize() const {
        ByteWriter writer(SERIALIZED_SIZE);
        auto write_result = WriteKeyRecord(id_, key_pair_, writer);
        if (write_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(write_result.UnwrapErr());
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(writer).Take());
    }

    Result<PreKey, ProtocolFailure> PreKey::Deserialize(std::span<const uint8_t> data) {
        if (data.size() != SERIALIZED_SIZE) {
            return Result<PreKey, ProtocolFailure>::Err(ProtocolFailure::Decode(
                "Pre-key record must be " + std::to_string(SERIALIZED_SIZE) + " bytes"));
        }
        ByteReader reader(data);
        uint32_t id = 0;
        auto key_pair_result = ReadKeyRecord(reader, id);
        if (key_pair_result.IsErr()) {
            return Result<PreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        return Result<PreKey, ProtocolFailure>::Ok(PreKey(id, std::move(key_pair_result).Unwrap()));
    }

    Result<PreKey, ProtocolFailure> PreKey::Clone() const {
        auto key_pair_result = key_pair_.Clone();
        if (key_pair_result.IsErr()) {
            return Result<PreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        return Result<PreKey, ProtocolFailure>::Ok(PreKey(id_, std::move(key_pair_result).Unwrap()));
    }

    SignedPreKey::SignedPreKey(
        const uint32_t id,
        DhKeyPair key_pair,
        std::vector<uint8_t> signature,
        const int64_t timestamp)
        : id_(id)
          , key_pair_(std::move(key_pair))
          , signature_(std::move(signature))
          , timestamp_(timestamp) {
    }

    Result<SignedPreKey, ProtocolFailure> SignedPreKey::Generate(
        const uint32_t id,
        const IdentityKeyPair& identity) {
        auto key_pair_result = DhKeyPair::Generate("signed pre-key");
        if (key_pair_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        auto key_pair = std::move(key_pair_result).Unwrap();
        auto signature_result = identity.Sign(key_pair.GetPublicKey());
        if (signature_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(signature_result.UnwrapErr());
        }
        const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return Result<SignedPreKey, ProtocolFailure>::Ok(SignedPreKey(
            id, std::move(key_pair), std::move(signature_result).Unwrap(), timestamp));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SignedPreKey::Serialize() const {
        ByteWriter writer(SERIALIZED_SIZE);
        auto write_result = WriteKeyRecord(id_, key_pair_, writer);
        if (write_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(write_result.UnwrapErr());
        }
        writer.WriteBytes(signature_);
        writer.WriteI64(timestamp_);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(writer).Take());
    }

    Result<SignedPreKey, ProtocolFailure> SignedPreKey::Deserialize(std::span<const uint8_t> data) {
        if (data.size() != SERIALIZED_SIZE) {
            return Result<SignedPreKey, ProtocolFailure>::Err(ProtocolFailure::Decode(
                "Signed pre-key record must be " + std::to_string(SERIALIZED_SIZE) + " bytes"));
        }
        ByteReader reader(data);
        uint32_t id = 0;
        auto key_pair_result = ReadKeyRecord(reader, id);
        if (key_pair_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        std::span<const uint8_t> signature;
        int64_t timestamp = 0;
        if (!reader.ReadBytes(kEd25519SignatureBytes, signature) || !reader.ReadI64(timestamp)) {
            return Result<SignedPreKey, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Signed pre-key record is truncated"));
        }
        return Result<SignedPreKey, ProtocolFailure>::Ok(SignedPreKey(
            id,
            std::move(key_pair_result).Unwrap(),
            std::vector<uint8_t>(signature.begin(), signature.end()),
            timestamp));
    }

    Result<SignedPreKey, ProtocolFailure> SignedPreKey::Clone() const {
        auto key_pair_result = key_pair_.Clone();
        if (key_pair_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        return Result<SignedPreKey, ProtocolFailure>::Ok(SignedPreKey(
            id_, std::move(key_pair_result).Unwrap(), signature_, timestamp_));
    }
}
