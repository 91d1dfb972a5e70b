#include "ratchetcore/models/keys/dh_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"

namespace ratchetcore::protocol::models {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;

    DhKeyPair::DhKeyPair(SecureMemoryHandle private_key_handle, std::vector<uint8_t> public_key)
        : private_key_handle_(std::move(private_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<DhKeyPair, ProtocolFailure> DhKeyPair::Generate(std::string_view purpose) {
        auto key_pair_result = SodiumInterop::GenerateX25519KeyPair(purpose);
        if (key_pair_result.IsErr()) {
            return Result<DhKeyPair, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
        }
        auto [handle, public_key] = std::move(key_pair_result).Unwrap();
        return Result<DhKeyPair, ProtocolFailure>::Ok(
            DhKeyPair(std::move(handle), std::move(public_key)));
    }

    Result<DhKeyPair, ProtocolFailure> DhKeyPair::FromPrivateKey(std::span<const uint8_t> private_key) {
        if (private_key.size() != kX25519PrivateKeyBytes) {
            return Result<DhKeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey("X25519 private key must be 32 bytes"));
        }
        auto public_result = SodiumInterop::DeriveX25519PublicKey(private_key);
        if (public_result.IsErr()) {
            return Result<DhKeyPair, ProtocolFailure>::Err(public_result.UnwrapErr());
        }
        auto handle_result = SecureMemoryHandle::FromBytes(private_key);
        if (handle_result.IsErr()) {
            return Result<DhKeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<DhKeyPair, ProtocolFailure>::Ok(
            DhKeyPair(std::move(handle_result).Unwrap(), std::move(public_result).Unwrap()));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> DhKeyPair::GetPrivateKeyBytes() const {
        auto read_result = private_key_handle_.ReadBytes(kX25519PrivateKeyBytes);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> DhKeyPair::Agree(
        std::span<const uint8_t> their_public_key) const {
        auto agree_result = private_key_handle_.WithReadAccess(
            [&](std::span<const uint8_t> private_key) {
                return SodiumInterop::ComputeX25519(private_key, their_public_key);
            });
        if (agree_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(agree_result.UnwrapErr()));
        }
        return std::move(agree_result).Unwrap();
    }

    Result<DhKeyPair, ProtocolFailure> DhKeyPair::Clone() const {
        auto handle_result = private_key_handle_.Clone();
        if (handle_result.IsErr()) {
            return Result<DhKeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<DhKeyPair, ProtocolFailure>::Ok(
            DhKeyPair(std::move(handle_result).Unwrap(), public_key_));
    }
}
