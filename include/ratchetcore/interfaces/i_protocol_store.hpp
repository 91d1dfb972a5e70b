#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ratchetcore::protocol::interfaces {

struct LocalIdentityRecord {
    std::vector<uint8_t> public_key;
    /// Ed25519 seed.
    std::vector<uint8_t> private_key;
    uint32_t registration_id = 0;
};

using TrustedIdentity = std::pair<std::string, std::vector<uint8_t>>;

/**
 * @brief Persistent key-value store consumed by ProtocolEngine
 *
 * Pre-key and signed pre-key records are the byte encodings produced by
 * PreKey::Serialize and SignedPreKey::Serialize. Sessions are keyed by the
 * address string `name.device_id`. Implementations report I/O problems as
 * ProtocolFailure::Storage; a missing entry is an empty optional, not an error.
 *
 * Implementations must be safe to call from several threads.
 */
class IProtocolStore {
public:
    virtual ~IProtocolStore() = default;

    [[nodiscard]] virtual Result<std::optional<LocalIdentityRecord>, ProtocolFailure> GetLocalIdentity() = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutLocalIdentity(const LocalIdentityRecord& identity) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutPreKey(
        uint32_t id, std::span<const uint8_t> record) = 0;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetPreKey(uint32_t id) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> DeletePreKey(uint32_t id) = 0;
    [[nodiscard]] virtual Result<std::vector<uint32_t>, ProtocolFailure> ListPreKeyIds() = 0;

    /// Next id the engine will hand out; survives consumption of the highest pre-key.
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutNextPreKeyId(uint32_t id) = 0;
    [[nodiscard]] virtual Result<std::optional<uint32_t>, ProtocolFailure> GetNextPreKeyId() = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutSignedPreKey(std::span<const uint8_t> record) = 0;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSignedPreKey() = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutSession(
        const std::string& address, std::span<const uint8_t> blob) = 0;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSession(
        const std::string& address) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> DeleteSession(const std::string& address) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> PutTrustedIdentity(
        const std::string& name, std::span<const uint8_t> identity_key) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> DeleteTrustedIdentity(const std::string& name) = 0;
    [[nodiscard]] virtual Result<std::vector<TrustedIdentity>, ProtocolFailure> ListTrustedIdentities() = 0;
};
}
