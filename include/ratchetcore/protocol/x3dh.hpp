#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/models/keys/dh_key_pair.hpp"
#include "ratchetcore/models/keys/pre_key.hpp"
#include "ratchetcore/models/bundles/pre_key_bundle.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace ratchetcore::protocol {

/// Output of the initiating side. The shared secret is wiped on destruction.
struct X3dhResult {
    std::vector<uint8_t> shared_secret;
    std::vector<uint8_t> ephemeral_public_key;
    std::optional<uint32_t> used_pre_key_id;

    X3dhResult() = default;
    X3dhResult(X3dhResult&&) noexcept = default;
    X3dhResult& operator=(X3dhResult&&) noexcept = default;
    X3dhResult(const X3dhResult&) = delete;
    X3dhResult& operator=(const X3dhResult&) = delete;
    ~X3dhResult();
};

/**
 * @brief Extended Triple Diffie-Hellman key agreement
 *
 * Initiator (A) against responder (B):
 * ```
 * DH1 = DH(IK_A, SPK_B)    DH2 = DH(EK_A, IK_B)
 * DH3 = DH(EK_A, SPK_B)    DH4 = DH(EK_A, OPK_B)   (only with a one-time pre-key)
 * SK  = HKDF(0xFF * 32 || DH1 || DH2 || DH3 [|| DH4], salt = 0x00 * 32, info = "X3DH")
 * ```
 * Identity keys enter DH through their X25519 form.
 */
class X3dh {
public:
    /**
     * @brief Run the initiating side against a published bundle
     *
     * The bundle is verified before any DH is computed.
     */
    [[nodiscard]] static Result<X3dhResult, ProtocolFailure> Initiate(
        const models::IdentityKeyPair& our_identity,
        const models::PreKeyBundle& their_bundle);

    /// Same as above with a caller-supplied ephemeral key.
    [[nodiscard]] static Result<X3dhResult, ProtocolFailure> Initiate(
        const models::IdentityKeyPair& our_identity,
        const models::PreKeyBundle& their_bundle,
        const models::DhKeyPair& ephemeral);

    /**
     * @brief Mirror of Initiate on the bundle owner's side
     *
     * @param our_one_time_pre_key nullptr when the initiator used no one-time pre-key
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Respond(
        const models::IdentityKeyPair& our_identity,
        const models::SignedPreKey& our_signed_pre_key,
        const models::PreKey* our_one_time_pre_key,
        const models::IdentityPublicKey& their_identity,
        std::span<const uint8_t> their_ephemeral);

private:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DeriveSharedSecret(
        std::span<const uint8_t> dh_concatenation);
    X3dh() = delete;
};
}
