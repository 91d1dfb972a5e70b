#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/configuration/engine_config.hpp"
#include "ratchetcore/interfaces/i_protocol_store.hpp"
#include "ratchetcore/models/bundles/pre_key_bundle.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/models/keys/pre_key.hpp"
#include "ratchetcore/models/protocol_address.hpp"
#include "ratchetcore/protocol/initial_message.hpp"
#include "ratchetcore/protocol/ratchet/ratchet_message.hpp"
#include "ratchetcore/protocol/session_state.hpp"
#include "ratchetcore/protocol/x3dh.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ratchetcore::protocol {

struct GeneratedPreKey {
    uint32_t id;
    std::vector<uint8_t> public_key;
};

struct SignedPreKeyPublic {
    uint32_t id;
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> signature;
};

/**
 * @brief Session registry, pre-key pool and trust store for one local identity
 *
 * Every mutation follows the same transaction: compute the new state on a
 * copy, persist it through IProtocolStore, then publish it in memory. A
 * failed persist is returned as Storage and leaves the in-memory state
 * untouched.
 *
 * DecryptInitial persists trust, then the session, then deletes the one-time
 * pre-key. A failure at any step undoes the earlier ones, so the same
 * initial message can be delivered again.
 *
 * Locking:
 * - `sessions_lock_` (shared) guards the registry map only. Entries that end
 *   an operation without a session are dropped from it.
 * - each SessionEntry has its own mutex held for the whole transition
 * - `pre_key_lock_` guards the one-time pool, its reservations, the signed
 *   pre-key and the id cursor. DecryptInitial reserves its pre-key under it
 *   and takes it again only to delete the key, so a pre-key is consumed at
 *   most once.
 * - `trust_lock_` (shared) guards trusted identities
 *
 * Lock order is session entry, then pre-key pool, then trust, then registry.
 */
class ProtocolEngine {
public:
    /// Generates and persists a new identity with a random 14-bit registration id.
    [[nodiscard]] static Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> Create(
        std::shared_ptr<interfaces::IProtocolStore> store,
        configuration::EngineConfig config = configuration::EngineConfig::Default());

    /// Rebuilds the identity from its 32-byte seed and persists it.
    [[nodiscard]] static Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> FromIdentity(
        std::span<const uint8_t> identity_seed,
        uint32_t registration_id,
        std::shared_ptr<interfaces::IProtocolStore> store,
        configuration::EngineConfig config = configuration::EngineConfig::Default());

    /**
     * Restores identity, signed pre-key, pre-key pool and trusted identities
     * from @p store. Sessions are loaded on first use. InvalidState when the
     * store holds no identity.
     */
    [[nodiscard]] static Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> Open(
        std::shared_ptr<interfaces::IProtocolStore> store,
        configuration::EngineConfig config = configuration::EngineConfig::Default());

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;
    ~ProtocolEngine() = default;

    [[nodiscard]] const models::IdentityPublicKey& GetIdentityPublicKey() const noexcept {
        return identity_.GetPublicKey();
    }
    /// Identity seed for backup; the caller wipes it.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetIdentityPrivateKey() const;
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }
    [[nodiscard]] const configuration::EngineConfig& GetConfig() const noexcept { return config_; }

    [[nodiscard]] Result<std::vector<GeneratedPreKey>, ProtocolFailure> GeneratePreKeys(uint32_t count);
    /// Replaces the active signed pre-key.
    [[nodiscard]] Result<SignedPreKeyPublic, ProtocolFailure> GenerateSignedPreKey(uint32_t id);

    /**
     * Publishable bundle carrying the lowest-id one-time pre-key. An empty
     * pool yields a bundle without one. NoSignedPreKey when none was generated.
     */
    [[nodiscard]] Result<models::PreKeyBundle, ProtocolFailure> CreatePreKeyBundle(uint32_t device_id) const;

    [[nodiscard]] Result<Unit, ProtocolFailure> ProcessPreKeyBundle(
        const models::ProtocolAddress& address,
        const models::PreKeyBundle& bundle);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> plaintext);

    /// Establishes a session from @p bundle and returns a serialized InitialMessage.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncryptInitial(
        const models::ProtocolAddress& address,
        const models::PreKeyBundle& bundle,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> ciphertext);

    /**
     * Accepts a serialized InitialMessage. On success the session replaces
     * any existing one for @p address, the sender's identity becomes trusted
     * under the address name, and the referenced one-time pre-key is deleted.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptInitial(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> ciphertext);

    [[nodiscard]] Result<bool, ProtocolFailure> HasSession(const models::ProtocolAddress& address);
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetSession(
        const models::ProtocolAddress& address);
    [[nodiscard]] Result<Unit, ProtocolFailure> RestoreSession(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> serialized);
    [[nodiscard]] Result<Unit, ProtocolFailure> DeleteSession(const models::ProtocolAddress& address);

    /// UntrustedIdentity when no identity is trusted under @p remote_id.
    [[nodiscard]] Result<std::string, ProtocolFailure> GetSafetyNumber(
        std::string_view local_id,
        std::string_view remote_id) const;

    [[nodiscard]] Result<Unit, ProtocolFailure> TrustIdentity(
        const std::string& name,
        const models::IdentityPublicKey& identity_key);
    [[nodiscard]] bool IsIdentityTrusted(
        const std::string& name,
        const models::IdentityPublicKey& identity_key) const;

    [[nodiscard]] size_t PreKeyCount() const;
    /// Generates one batch when the pool is below the low-water mark. Returns how many were added.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> RefillPreKeysIfNeeded();

    /// Addresses currently held in the in-memory session registry.
    [[nodiscard]] size_t GetCachedSessionCount() const;

private:
    struct SessionEntry {
        std::mutex lock;
        std::optional<SessionState> state;
        bool loaded = false;
        bool retired = false;
    };

    /// Registry entry locked for one operation; dropped from the registry on release when it holds no session.
    class LockedEntry {
    public:
        LockedEntry(ProtocolEngine& engine, const models::ProtocolAddress& address);
        ~LockedEntry();
        LockedEntry(const LockedEntry&) = delete;
        LockedEntry& operator=(const LockedEntry&) = delete;

        SessionEntry& operator*() const noexcept { return *entry_; }
        SessionEntry* operator->() const noexcept { return entry_.get(); }

    private:
        ProtocolEngine& engine_;
        const models::ProtocolAddress& address_;
        std::shared_ptr<SessionEntry> entry_;
        std::unique_lock<std::mutex> guard_;
    };

    struct ResponderKeys {
        models::SignedPreKey signed_pre_key;
        std::optional<models::PreKey> one_time_pre_key;
    };

    ProtocolEngine(
        models::IdentityKeyPair identity,
        uint32_t registration_id,
        std::shared_ptr<interfaces::IProtocolStore> store,
        configuration::EngineConfig config);

    static Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> CreateWithIdentity(
        models::IdentityKeyPair identity,
        uint32_t registration_id,
        std::shared_ptr<interfaces::IProtocolStore> store,
        configuration::EngineConfig config);

    [[nodiscard]] SessionLimits GetSessionLimits() const noexcept;
    std::shared_ptr<SessionEntry> GetEntry(const models::ProtocolAddress& address);
    void RetireEntry(const models::ProtocolAddress& address, SessionEntry& entry);
    Result<Unit, ProtocolFailure> EnsureLoaded(SessionEntry& entry, const models::ProtocolAddress& address);
    Result<Unit, ProtocolFailure> CommitSession(
        SessionEntry& entry,
        const models::ProtocolAddress& address,
        SessionState state);
    void UndoSessionCommit(
        SessionEntry& entry,
        const models::ProtocolAddress& address,
        const std::optional<std::vector<uint8_t>>& previous_blob,
        std::optional<SessionState> previous_state,
        bool previous_loaded);
    Result<Unit, ProtocolFailure> CheckTrust(
        const std::string& name,
        const models::IdentityPublicKey& identity_key) const;
    /// Records @p identity_key when @p name has no trusted key yet. Ok(true) when a record was added.
    Result<bool, ProtocolFailure> CompareAndTrust(
        const std::string& name,
        const models::IdentityPublicKey& identity_key);
    void ForgetTrust(const std::string& name);
    Result<ResponderKeys, ProtocolFailure> ReserveResponderKeys(
        uint32_t signed_pre_key_id,
        std::optional<uint32_t> pre_key_id);
    void ReleasePreKeyReservation(uint32_t id);
    Result<Unit, ProtocolFailure> ConsumePreKey(uint32_t id);
    Result<std::vector<uint8_t>, ProtocolFailure> AcceptInitialMessage(
        SessionEntry& entry,
        const models::ProtocolAddress& address,
        const InitialMessage& initial,
        const ratchet::RatchetMessage& message,
        const models::IdentityPublicKey& their_identity,
        const ResponderKeys& keys);
    Result<std::pair<SessionState, X3dhResult>, ProtocolFailure> EstablishInitiatorSession(
        const models::ProtocolAddress& address,
        const models::PreKeyBundle& bundle);
    Result<std::vector<GeneratedPreKey>, ProtocolFailure> GeneratePreKeysLocked(uint32_t count);
    Result<std::optional<models::PreKey>, ProtocolFailure> FindPreKeyLocked(uint32_t id);
    /// KeyExhaustion when the pool is empty.
    [[nodiscard]] Result<models::BundlePreKey, ProtocolFailure> LowestPreKeyLocked() const;

    models::IdentityKeyPair identity_;
    uint32_t registration_id_;
    std::shared_ptr<interfaces::IProtocolStore> store_;
    configuration::EngineConfig config_;

    mutable std::shared_mutex sessions_lock_;
    std::map<models::ProtocolAddress, std::shared_ptr<SessionEntry>> sessions_;

    mutable std::mutex pre_key_lock_;
    std::map<uint32_t, models::PreKey> pre_keys_;
    std::set<uint32_t> reserved_pre_keys_;
    std::optional<models::SignedPreKey> signed_pre_key_;
    uint32_t next_pre_key_id_ = kFirstPreKeyId;

    mutable std::shared_mutex trust_lock_;
    std::map<std::string, models::IdentityPublicKey, std::less<>> trusted_identities_;
};
}
