#pragma once
#include "ratchetcore/storage/in_memory_protocol_store.hpp"
#include <atomic>
#include <functional>

namespace ratchetcore::protocol::test {

/// InMemoryProtocolStore whose writes can be switched to fail with Storage or paused by a hook.
class FailingProtocolStore final : public interfaces::IProtocolStore {
public:
    std::atomic<bool> fail_session_writes{false};
    std::atomic<bool> fail_pre_key_writes{false};
    std::atomic<bool> fail_trust_writes{false};
    /// Fails DeletePreKey only, leaving pre-key generation working.
    std::atomic<bool> fail_pre_key_deletes{false};
    /// Runs at the start of every PutSession; set it before other threads use the store.
    std::function<void()> on_session_write;

    Result<std::optional<interfaces::LocalIdentityRecord>, ProtocolFailure> GetLocalIdentity() override {
        return inner_.GetLocalIdentity();
    }
    Result<Unit, ProtocolFailure> PutLocalIdentity(const interfaces::LocalIdentityRecord& identity) override {
        return inner_.PutLocalIdentity(identity);
    }
    Result<Unit, ProtocolFailure> PutPreKey(uint32_t id, std::span<const uint8_t> record) override {
        if (fail_pre_key_writes) {
            return Refuse();
        }
        return inner_.PutPreKey(id, record);
    }
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetPreKey(uint32_t id) override {
        return inner_.GetPreKey(id);
    }
    Result<Unit, ProtocolFailure> DeletePreKey(uint32_t id) override {
        if (fail_pre_key_writes || fail_pre_key_deletes) {
            return Refuse();
        }
        return inner_.DeletePreKey(id);
    }
    Result<std::vector<uint32_t>, ProtocolFailure> ListPreKeyIds() override {
        return inner_.ListPreKeyIds();
    }
    Result<Unit, ProtocolFailure> PutNextPreKeyId(uint32_t id) override {
        if (fail_pre_key_writes) {
            return Refuse();
        }
        return inner_.PutNextPreKeyId(id);
    }
    Result<std::optional<uint32_t>, ProtocolFailure> GetNextPreKeyId() override {
        return inner_.GetNextPreKeyId();
    }
    Result<Unit, ProtocolFailure> PutSignedPreKey(std::span<const uint8_t> record) override {
        return inner_.PutSignedPreKey(record);
    }
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSignedPreKey() override {
        return inner_.GetSignedPreKey();
    }
    Result<Unit, ProtocolFailure> PutSession(const std::string& address, std::span<const uint8_t> blob) override {
        if (on_session_write) {
            on_session_write();
        }
        if (fail_session_writes) {
            return Refuse();
        }
        return inner_.PutSession(address, blob);
    }
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSession(const std::string& address) override {
        return inner_.GetSession(address);
    }
    Result<Unit, ProtocolFailure> DeleteSession(const std::string& address) override {
        if (fail_session_writes) {
            return Refuse();
        }
        return inner_.DeleteSession(address);
    }
    Result<Unit, ProtocolFailure> PutTrustedIdentity(
        const std::string& name, std::span<const uint8_t> identity_key) override {
        if (fail_trust_writes) {
            return Refuse();
        }
        return inner_.PutTrustedIdentity(name, identity_key);
    }
    Result<Unit, ProtocolFailure> DeleteTrustedIdentity(const std::string& name) override {
        if (fail_trust_writes) {
            return Refuse();
        }
        return inner_.DeleteTrustedIdentity(name);
    }
    Result<std::vector<interfaces::TrustedIdentity>, ProtocolFailure> ListTrustedIdentities() override {
        return inner_.ListTrustedIdentities();
    }

private:
    static Result<Unit, ProtocolFailure> Refuse() {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Storage("Injected write failure"));
    }

    storage::InMemoryProtocolStore inner_;
};

}
