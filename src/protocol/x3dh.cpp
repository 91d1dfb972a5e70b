#include "ratchetcore/protocol/x3dh.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/crypto/hkdf.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/debug/key_logger.hpp"
#include <array>

namespace ratchetcore::protocol {
    using crypto::Hkdf;
    using crypto::SodiumInterop;
    using security::DhValidator;

    namespace {
        void Wipe(std::vector<uint8_t>& buffer) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
            (void)_wipe;
        }

        /// Appends one DH output to the IKM buffer and wipes the temporary.
        Result<Unit, ProtocolFailure> AppendDh(
            Result<std::vector<uint8_t>, ProtocolFailure> dh_result,
            std::vector<uint8_t>& ikm,
            const debug::Side side,
            const int dh_number) {
            if (dh_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(dh_result.UnwrapErr());
            }
            auto dh = std::move(dh_result).Unwrap();
            debug::LogX3DHDH(side, dh_number, dh);
            ikm.insert(ikm.end(), dh.begin(), dh.end());
            Wipe(dh);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        std::vector<uint8_t> NewIkm() {
            std::vector<uint8_t> ikm;
            ikm.reserve(kX3dhPaddingBytes + 4 * kX25519SharedSecretBytes);
            ikm.assign(kX3dhPaddingBytes, kX3dhPaddingByte);
            return ikm;
        }
    }

    X3dhResult::~X3dhResult() {
        Wipe(shared_secret);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X3dh::DeriveSharedSecret(
        std::span<const uint8_t> dh_concatenation) {
        constexpr std::array<uint8_t, kX3dhSaltBytes> salt{};
        return Hkdf::DeriveKeyBytes(dh_concatenation, kSharedSecretBytes, salt, kX3dhInfo);
    }

    Result<X3dhResult, ProtocolFailure> X3dh::Initiate(
        const models::IdentityKeyPair& our_identity,
        const models::PreKeyBundle& their_bundle) {
        auto ephemeral_result = models::DhKeyPair::Generate("X3DH ephemeral");
        if (ephemeral_result.IsErr()) {
            return Result<X3dhResult, ProtocolFailure>::Err(ephemeral_result.UnwrapErr());
        }
        return Initiate(our_identity, their_bundle, ephemeral_result.Unwrap());
    }

    Result<X3dhResult, ProtocolFailure> X3dh::Initiate(
        const models::IdentityKeyPair& our_identity,
        const models::PreKeyBundle& their_bundle,
        const models::DhKeyPair& ephemeral) {
        auto verify_result = their_bundle.Verify();
        if (verify_result.IsErr()) {
            return Result<X3dhResult, ProtocolFailure>::Err(verify_result.UnwrapErr());
        }

        const auto& pre_key = their_bundle.GetPreKey();
        std::optional<uint32_t> used_pre_key_id;
        if (pre_key.has_value()) {
            used_pre_key_id = pre_key->id;
        }
        constexpr auto side = debug::Side::Initiator;
        debug::LogX3DHStart(side, used_pre_key_id);

        const auto& their_spk = their_bundle.GetSignedPreKeyPublic();
        const auto& their_identity_dh = their_bundle.GetIdentityKey().ToX25519();
        auto ikm = NewIkm();
        auto fail = [&ikm](const ProtocolFailure& failure) {
            Wipe(ikm);
            return Result<X3dhResult, ProtocolFailure>::Err(failure);
        };

        if (auto r = AppendDh(our_identity.Agree(their_spk), ikm, side, 1); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (auto r = AppendDh(ephemeral.Agree(their_identity_dh), ikm, side, 2); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (auto r = AppendDh(ephemeral.Agree(their_spk), ikm, side, 3); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (pre_key.has_value()) {
            if (auto r = AppendDh(ephemeral.Agree(pre_key->public_key), ikm, side, 4); r.IsErr()) {
                return fail(r.UnwrapErr());
            }
        }

        auto secret_result = DeriveSharedSecret(ikm);
        Wipe(ikm);
        if (secret_result.IsErr()) {
            return Result<X3dhResult, ProtocolFailure>::Err(secret_result.UnwrapErr());
        }

        X3dhResult result;
        result.shared_secret = std::move(secret_result).Unwrap();
        result.ephemeral_public_key = ephemeral.GetPublicKey();
        result.used_pre_key_id = used_pre_key_id;
        debug::LogX3DHSharedSecret(side, result.shared_secret);
        return Result<X3dhResult, ProtocolFailure>::Ok(std::move(result));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X3dh::Respond(
        const models::IdentityKeyPair& our_identity,
        const models::SignedPreKey& our_signed_pre_key,
        const models::PreKey* our_one_time_pre_key,
        const models::IdentityPublicKey& their_identity,
        std::span<const uint8_t> their_ephemeral) {
        auto ephemeral_check = DhValidator::ValidateX25519PublicKey(their_ephemeral);
        if (ephemeral_check.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ephemeral_check.UnwrapErr());
        }

        std::optional<uint32_t> used_pre_key_id;
        if (our_one_time_pre_key != nullptr) {
            used_pre_key_id = our_one_time_pre_key->GetId();
        }
        constexpr auto side = debug::Side::Responder;
        debug::LogX3DHStart(side, used_pre_key_id);

        const auto& spk = our_signed_pre_key.GetKeyPair();
        auto ikm = NewIkm();
        auto fail = [&ikm](const ProtocolFailure& failure) {
            Wipe(ikm);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(failure);
        };

        if (auto r = AppendDh(spk.Agree(their_identity.ToX25519()), ikm, side, 1); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (auto r = AppendDh(our_identity.Agree(their_ephemeral), ikm, side, 2); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (auto r = AppendDh(spk.Agree(their_ephemeral), ikm, side, 3); r.IsErr()) {
            return fail(r.UnwrapErr());
        }
        if (our_one_time_pre_key != nullptr) {
            if (auto r = AppendDh(our_one_time_pre_key->GetKeyPair().Agree(their_ephemeral), ikm, side, 4);
                r.IsErr()) {
                return fail(r.UnwrapErr());
            }
        }

        auto secret_result = DeriveSharedSecret(ikm);
        Wipe(ikm);
        if (secret_result.IsOk()) {
            debug::LogX3DHSharedSecret(side, secret_result.Unwrap());
        }
        return secret_result;
    }
}
