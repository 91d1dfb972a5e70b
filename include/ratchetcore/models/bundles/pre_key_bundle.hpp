#pragma once
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <optional>
#include <span>
namespace ratchetcore::protocol::models {

struct BundlePreKey {
    uint32_t id;
    std::vector<uint8_t> public_key;
};

/**
 * Publishable key snapshot of one device.
 *
 * Wire layout (big-endian):
 *   registration_id (4) || device_id (4) || has_pre_key (1)
 *   [|| pre_key_id (4) || pre_key_public (32)]
 *   || signed_pre_key_id (4) || signed_pre_key_public (32)
 *   || signed_pre_key_signature (64) || identity_key (32)
 */
class PreKeyBundle {
public:
    PreKeyBundle(
        uint32_t registration_id,
        uint32_t device_id,
        std::optional<BundlePreKey> pre_key,
        uint32_t signed_pre_key_id,
        std::vector<uint8_t> signed_pre_key_public,
        std::vector<uint8_t> signed_pre_key_signature,
        IdentityPublicKey identity_key);

    [[nodiscard]] static Result<PreKeyBundle, ProtocolFailure> Deserialize(std::span<const uint8_t> data);
    [[nodiscard]] std::vector<uint8_t> Serialize() const;

    /**
     * @brief Check the signed pre-key signature against the bundle's own identity key
     *
     * Needs no private material. Also rejects structurally invalid DH keys.
     */
    [[nodiscard]] Result<Unit, ProtocolFailure> Verify() const;

    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }
    [[nodiscard]] uint32_t GetDeviceId() const noexcept { return device_id_; }
    [[nodiscard]] const std::optional<BundlePreKey>& GetPreKey() const noexcept { return pre_key_; }
    [[nodiscard]] uint32_t GetSignedPreKeyId() const noexcept { return signed_pre_key_id_; }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeyPublic() const noexcept {
        return signed_pre_key_public_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignedPreKeySignature() const noexcept {
        return signed_pre_key_signature_;
    }
    [[nodiscard]] const IdentityPublicKey& GetIdentityKey() const noexcept { return identity_key_; }

private:
    uint32_t registration_id_;
    uint32_t device_id_;
    std::optional<BundlePreKey> pre_key_;
    uint32_t signed_pre_key_id_;
    std::vector<uint8_t> signed_pre_key_public_;
    std::vector<uint8_t> signed_pre_key_signature_;
    IdentityPublicKey identity_key_;
};
}
