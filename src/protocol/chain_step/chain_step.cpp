#include "ratchetcore/protocol/chain_step/chain_step.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/crypto/hkdf.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include <array>

namespace ratchetcore::protocol::chain_step {
    using crypto::Hkdf;
    using crypto::SodiumInterop;

    namespace {
        void Wipe(std::vector<uint8_t>& buffer) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
            (void)_wipe;
        }
    }

    MessageKeys::~MessageKeys() {
        Wipe(cipher_key);
        Wipe(mac_key);
        Wipe(iv);
        Wipe(next_chain_key);
    }

    std::span<const uint8_t> MessageKeys::Nonce() const noexcept {
        return std::span<const uint8_t>(iv).first(kAesGcmNonceBytes);
    }

    RootStep::~RootStep() {
        Wipe(root_key);
        Wipe(chain_key);
    }

    Result<MessageKeys, ProtocolFailure> ChainStep::DeriveMessageKeys(std::span<const uint8_t> chain_key) {
        if (chain_key.size() != kChainKeyBytes) {
            return Result<MessageKeys, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey("Chain key must be 32 bytes"));
        }
        constexpr std::array<uint8_t, 1> message_seed_input{kMessageKeySeedByte};
        constexpr std::array<uint8_t, 1> chain_seed_input{kChainKeySeedByte};

        auto next_chain_result = SodiumInterop::HmacSha256(chain_key, chain_seed_input);
        if (next_chain_result.IsErr()) {
            return Result<MessageKeys, ProtocolFailure>::Err(next_chain_result.UnwrapErr());
        }
        auto seed_result = SodiumInterop::HmacSha256(chain_key, message_seed_input);
        if (seed_result.IsErr()) {
            return Result<MessageKeys, ProtocolFailure>::Err(seed_result.UnwrapErr());
        }
        auto seed = std::move(seed_result).Unwrap();
        auto material_result = Hkdf::DeriveKeyBytes(seed, kMessageKeyMaterialBytes, {}, kMessageKeysInfo);
        Wipe(seed);
        if (material_result.IsErr()) {
            return Result<MessageKeys, ProtocolFailure>::Err(material_result.UnwrapErr());
        }
        auto material = std::move(material_result).Unwrap();

        MessageKeys keys;
        keys.cipher_key.assign(material.begin(), material.begin() + kMessageKeyBytes);
        keys.mac_key.assign(material.begin() + kMessageKeyBytes,
                            material.begin() + kMessageKeyBytes + kMacKeyBytes);
        keys.iv.assign(material.begin() + kMessageKeyBytes + kMacKeyBytes, material.end());
        keys.next_chain_key = std::move(next_chain_result).Unwrap();
        Wipe(material);
        return Result<MessageKeys, ProtocolFailure>::Ok(std::move(keys));
    }

    Result<RootStep, ProtocolFailure> ChainStep::DeriveRootKey(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output) {
        if (root_key.size() != kRootKeyBytes) {
            return Result<RootStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey("Root key must be 32 bytes"));
        }
        if (dh_output.size() != kX25519SharedSecretBytes) {
            return Result<RootStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey("DH output must be 32 bytes"));
        }
        auto derived_result = Hkdf::DeriveKeyBytes(
            dh_output, kRootKeyBytes + kChainKeyBytes, root_key, kRootRatchetInfo);
        if (derived_result.IsErr()) {
            return Result<RootStep, ProtocolFailure>::Err(derived_result.UnwrapErr());
        }
        auto derived = std::move(derived_result).Unwrap();
        RootStep step;
        step.root_key.assign(derived.begin(), derived.begin() + kRootKeyBytes);
        step.chain_key.assign(derived.begin() + kRootKeyBytes, derived.end());
        Wipe(derived);
        return Result<RootStep, ProtocolFailure>::Ok(std::move(step));
    }
}
