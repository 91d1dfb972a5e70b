#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"

namespace ratchetcore::protocol::models {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;

    Result<IdentityPublicKey, ProtocolFailure> IdentityPublicKey::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != kEd25519PublicKeyBytes) {
            return Result<IdentityPublicKey, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey("Identity key must be 32 bytes"));
        }
        auto dh_result = SodiumInterop::ConvertEd25519PublicToX25519(bytes);
        if (dh_result.IsErr()) {
            return Result<IdentityPublicKey, ProtocolFailure>::Err(dh_result.UnwrapErr());
        }
        return Result<IdentityPublicKey, ProtocolFailure>::Ok(IdentityPublicKey(
            std::vector<uint8_t>(bytes.begin(), bytes.end()),
            std::move(dh_result).Unwrap()));
    }

    Result<Unit, ProtocolFailure> IdentityPublicKey::Verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const {
        return SodiumInterop::VerifyEd25519(key_, message, signature);
    }

    IdentityKeyPair::IdentityKeyPair(
        SecureMemoryHandle signing_key,
        SecureMemoryHandle dh_private_key,
        IdentityPublicKey public_key)
        : signing_key_(std::move(signing_key))
          , dh_private_key_(std::move(dh_private_key))
          , public_key_(std::move(public_key)) {
    }

    Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::FromSodiumKeyPair(
        SecureMemoryHandle signing_key,
        std::vector<uint8_t> public_key) {
        auto public_result = IdentityPublicKey::FromBytes(public_key);
        if (public_result.IsErr()) {
            return Result<IdentityKeyPair, ProtocolFailure>::Err(public_result.UnwrapErr());
        }
        auto dh_result = SodiumInterop::ConvertEd25519SecretToX25519(signing_key);
        if (dh_result.IsErr()) {
            return Result<IdentityKeyPair, ProtocolFailure>::Err(dh_result.UnwrapErr());
        }
        return Result<IdentityKeyPair, ProtocolFailure>::Ok(IdentityKeyPair(
            std::move(signing_key),
            std::move(dh_result).Unwrap(),
            std::move(public_result).Unwrap()));
    }

    Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::Generate() {
        auto key_pair_result = SodiumInterop::GenerateEd25519KeyPair();
        if (key_pair_result.IsErr()) {
            return Result<IdentityKeyPair, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        auto [signing_key, public_key] = std::move(key_pair_result).Unwrap();
        return FromSodiumKeyPair(std::move(signing_key), std::move(public_key));
    }

    Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::FromPrivateKey(std::span<const uint8_t> seed) {
        auto key_pair_result = SodiumInterop::Ed25519KeyPairFromSeed(seed);
        if (key_pair_result.IsErr()) {
            return Result<IdentityKeyPair, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        auto [signing_key, public_key] = std::move(key_pair_result).Unwrap();
        return FromSodiumKeyPair(std::move(signing_key), std::move(public_key));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::GetPrivateKeyBytes() const {
        // libsodium secret keys are seed || public key
        auto read_result = signing_key_.ReadBytes(kEd25519SeedBytes);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::Sign(
        std::span<const uint8_t> message) const {
        return SodiumInterop::SignEd25519(signing_key_, message);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::Agree(
        std::span<const uint8_t> their_public_key) const {
        auto agree_result = dh_private_key_.WithReadAccess(
            [&](std::span<const uint8_t> private_key) {
                return SodiumInterop::ComputeX25519(private_key, their_public_key);
            });
        if (agree_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(agree_result.UnwrapErr()));
        }
        return std::move(agree_result).Unwrap();
    }
}
