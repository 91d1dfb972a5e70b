#pragma once
#include "ratchetcore/interfaces/i_protocol_store.hpp"
#include <map>
#include <mutex>

namespace ratchetcore::protocol::storage {

/**
 * Process-local IProtocolStore. Private material is wiped when it is
 * overwritten, deleted, or when the store is destroyed.
 */
class InMemoryProtocolStore final : public interfaces::IProtocolStore {
public:
    InMemoryProtocolStore() = default;
    InMemoryProtocolStore(const InMemoryProtocolStore&) = delete;
    InMemoryProtocolStore& operator=(const InMemoryProtocolStore&) = delete;
    ~InMemoryProtocolStore() override;

    Result<std::optional<interfaces::LocalIdentityRecord>, ProtocolFailure> GetLocalIdentity() override;
    Result<Unit, ProtocolFailure> PutLocalIdentity(const interfaces::LocalIdentityRecord& identity) override;

    Result<Unit, ProtocolFailure> PutPreKey(uint32_t id, std::span<const uint8_t> record) override;
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetPreKey(uint32_t id) override;
    Result<Unit, ProtocolFailure> DeletePreKey(uint32_t id) override;
    Result<std::vector<uint32_t>, ProtocolFailure> ListPreKeyIds() override;

    Result<Unit, ProtocolFailure> PutNextPreKeyId(uint32_t id) override;
    Result<std::optional<uint32_t>, ProtocolFailure> GetNextPreKeyId() override;

    Result<Unit, ProtocolFailure> PutSignedPreKey(std::span<const uint8_t> record) override;
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSignedPreKey() override;

    Result<Unit, ProtocolFailure> PutSession(const std::string& address, std::span<const uint8_t> blob) override;
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSession(const std::string& address) override;
    Result<Unit, ProtocolFailure> DeleteSession(const std::string& address) override;

    Result<Unit, ProtocolFailure> PutTrustedIdentity(
        const std::string& name, std::span<const uint8_t> identity_key) override;
    Result<Unit, ProtocolFailure> DeleteTrustedIdentity(const std::string& name) override;
    Result<std::vector<interfaces::TrustedIdentity>, ProtocolFailure> ListTrustedIdentities() override;

    [[nodiscard]] size_t SessionCount() const;

private:
    mutable std::mutex lock_;
    std::optional<interfaces::LocalIdentityRecord> local_identity_;
    std::map<uint32_t, std::vector<uint8_t>> pre_keys_;
    std::optional<uint32_t> next_pre_key_id_;
    std::optional<std::vector<uint8_t>> signed_pre_key_;
    std::map<std::string, std::vector<uint8_t>> sessions_;
    std::map<std::string, std::vector<uint8_t>> trusted_identities_;
};
}
