#include "ratchetcore/storage/in_memory_protocol_store.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"

namespace ratchetcore::protocol::storage {
    using crypto::SodiumInterop;
    using interfaces::LocalIdentityRecord;
    using interfaces::TrustedIdentity;

    namespace {
        void Wipe(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
        }

        template<typename Key>
        void WipeAll(std::map<Key, std::vector<uint8_t>>& entries) {
            for (auto& [_, bytes] : entries) {
                Wipe(bytes);
            }
            entries.clear();
        }

        template<typename Key>
        void Replace(std::map<Key, std::vector<uint8_t>>& entries, const Key& key, std::span<const uint8_t> bytes) {
            auto& slot = entries[key];
            Wipe(slot);
            slot.assign(bytes.begin(), bytes.end());
        }

        template<typename Key>
        void Erase(std::map<Key, std::vector<uint8_t>>& entries, const Key& key) {
            if (auto it = entries.find(key); it != entries.end()) {
                Wipe(it->second);
                entries.erase(it);
            }
        }

        template<typename Key>
        std::optional<std::vector<uint8_t>> Find(const std::map<Key, std::vector<uint8_t>>& entries, const Key& key) {
            if (auto it = entries.find(key); it != entries.end()) {
                return it->second;
            }
            return std::nullopt;
        }
    }

    InMemoryProtocolStore::~InMemoryProtocolStore() {
        if (local_identity_.has_value()) {
            Wipe(local_identity_->private_key);
        }
        if (signed_pre_key_.has_value()) {
            Wipe(*signed_pre_key_);
        }
        WipeAll(pre_keys_);
        WipeAll(sessions_);
    }

    Result<std::optional<LocalIdentityRecord>, ProtocolFailure> InMemoryProtocolStore::GetLocalIdentity() {
        std::lock_guard guard(lock_);
        return Result<std::optional<LocalIdentityRecord>, ProtocolFailure>::Ok(local_identity_);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutLocalIdentity(const LocalIdentityRecord& identity) {
        std::lock_guard guard(lock_);
        if (local_identity_.has_value()) {
            Wipe(local_identity_->private_key);
        }
        local_identity_ = identity;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutPreKey(
        const uint32_t id, std::span<const uint8_t> record) {
        std::lock_guard guard(lock_);
        Replace(pre_keys_, id, record);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> InMemoryProtocolStore::GetPreKey(const uint32_t id) {
        std::lock_guard guard(lock_);
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(Find(pre_keys_, id));
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::DeletePreKey(const uint32_t id) {
        std::lock_guard guard(lock_);
        Erase(pre_keys_, id);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint32_t>, ProtocolFailure> InMemoryProtocolStore::ListPreKeyIds() {
        std::lock_guard guard(lock_);
        std::vector<uint32_t> ids;
        ids.reserve(pre_keys_.size());
        for (const auto& [id, _] : pre_keys_) {
            ids.push_back(id);
        }
        return Result<std::vector<uint32_t>, ProtocolFailure>::Ok(std::move(ids));
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutNextPreKeyId(const uint32_t id) {
        std::lock_guard guard(lock_);
        next_pre_key_id_ = id;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<uint32_t>, ProtocolFailure> InMemoryProtocolStore::GetNextPreKeyId() {
        std::lock_guard guard(lock_);
        return Result<std::optional<uint32_t>, ProtocolFailure>::Ok(next_pre_key_id_);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutSignedPreKey(std::span<const uint8_t> record) {
        std::lock_guard guard(lock_);
        if (signed_pre_key_.has_value()) {
            Wipe(*signed_pre_key_);
        }
        signed_pre_key_ = std::vector<uint8_t>(record.begin(), record.end());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> InMemoryProtocolStore::GetSignedPreKey() {
        std::lock_guard guard(lock_);
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(signed_pre_key_);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutSession(
        const std::string& address, std::span<const uint8_t> blob) {
        std::lock_guard guard(lock_);
        Replace(sessions_, address, blob);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> InMemoryProtocolStore::GetSession(
        const std::string& address) {
        std::lock_guard guard(lock_);
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(Find(sessions_, address));
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::DeleteSession(const std::string& address) {
        std::lock_guard guard(lock_);
        Erase(sessions_, address);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::PutTrustedIdentity(
        const std::string& name, std::span<const uint8_t> identity_key) {
        std::lock_guard guard(lock_);
        trusted_identities_[name].assign(identity_key.begin(), identity_key.end());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> InMemoryProtocolStore::DeleteTrustedIdentity(const std::string& name) {
        std::lock_guard guard(lock_);
        trusted_identities_.erase(name);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<TrustedIdentity>, ProtocolFailure> InMemoryProtocolStore::ListTrustedIdentities() {
        std::lock_guard guard(lock_);
        std::vector<TrustedIdentity> identities(trusted_identities_.begin(), trusted_identities_.end());
        return Result<std::vector<TrustedIdentity>, ProtocolFailure>::Ok(std::move(identities));
    }

    size_t InMemoryProtocolStore::SessionCount() const {
        std::lock_guard guard(lock_);
        return sessions_.size();
    }
}
