#include "ratchetcore/protocol/protocol_engine.hpp"
#include "ratchetcore/protocol/initial_message.hpp"
#include "ratchetcore/protocol/ratchet/ratchet_message.hpp"
#include "ratchetcore/identity/fingerprint_calculator.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/debug/key_logger.hpp"
#include "ratchetcore/core/format.hpp"
#include <algorithm>

namespace ratchetcore::protocol {
    using crypto::SodiumInterop;
    using configuration::EngineConfig;
    using interfaces::IProtocolStore;
    using interfaces::LocalIdentityRecord;
    using models::IdentityKeyPair;
    using models::IdentityPublicKey;
    using models::PreKey;
    using models::PreKeyBundle;
    using models::ProtocolAddress;
    using models::SignedPreKey;
    using ratchet::RatchetMessage;

    namespace {
        constexpr auto kSide = debug::Side::Engine;

        void Wipe(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
        }

        Result<Unit, ProtocolFailure> InitializeCrypto(const EngineConfig& config) {
            if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
            }
            return config.Validate();
        }

        Result<Unit, ProtocolFailure> RequireStore(const std::shared_ptr<IProtocolStore>& store) {
            if (!store) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Protocol store must not be null"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    ProtocolEngine::ProtocolEngine(
        IdentityKeyPair identity,
        const uint32_t registration_id,
        std::shared_ptr<IProtocolStore> store,
        const EngineConfig config)
        : identity_(std::move(identity))
        , registration_id_(registration_id)
        , store_(std::move(store))
        , config_(config) {
    }

    Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> ProtocolEngine::Create(
        std::shared_ptr<IProtocolStore> store,
        const EngineConfig config) {
        if (auto ready = InitializeCrypto(config); ready.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(ready.UnwrapErr());
        }
        auto identity_result = IdentityKeyPair::Generate();
        if (identity_result.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(identity_result.UnwrapErr());
        }
        const uint32_t registration_id = SodiumInterop::GenerateRandomUInt32() & kRegistrationIdMask;
        return CreateWithIdentity(std::move(identity_result).Unwrap(), registration_id, std::move(store), config);
    }

    Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> ProtocolEngine::FromIdentity(
        std::span<const uint8_t> identity_seed,
        const uint32_t registration_id,
        std::shared_ptr<IProtocolStore> store,
        const EngineConfig config) {
        if (auto ready = InitializeCrypto(config); ready.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(ready.UnwrapErr());
        }
        auto identity_result = IdentityKeyPair::FromPrivateKey(identity_seed);
        if (identity_result.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(identity_result.UnwrapErr());
        }
        return CreateWithIdentity(std::move(identity_result).Unwrap(), registration_id, std::move(store), config);
    }

    Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> ProtocolEngine::CreateWithIdentity(
        IdentityKeyPair identity,
        const uint32_t registration_id,
        std::shared_ptr<IProtocolStore> store,
        const EngineConfig config) {
        if (auto check = RequireStore(store); check.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(check.UnwrapErr());
        }
        auto seed_result = identity.GetPrivateKeyBytes();
        if (seed_result.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(seed_result.UnwrapErr());
        }
        LocalIdentityRecord record;
        record.public_key = identity.GetPublicKey().Serialize();
        record.private_key = std::move(seed_result).Unwrap();
        record.registration_id = registration_id;
        auto put_result = store->PutLocalIdentity(record);
        Wipe(record.private_key);
        if (put_result.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(put_result.UnwrapErr());
        }
        if (auto cursor = store->PutNextPreKeyId(kFirstPreKeyId); cursor.IsErr()) {
            return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Err(cursor.UnwrapErr());
        }

        debug::LogIdentityCreated(kSide, identity.GetPublicKey().AsSpan(), identity.GetDhPublicKey(),
                                  registration_id);
        auto engine = std::unique_ptr<ProtocolEngine>(
            new ProtocolEngine(std::move(identity), registration_id, std::move(store), config));
        return Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>::Ok(std::move(engine));
    }

    Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure> ProtocolEngine::Open(
        std::shared_ptr<IProtocolStore> store,
        const EngineConfig config) {
        using EngineResult = Result<std::unique_ptr<ProtocolEngine>, ProtocolFailure>;
        if (auto ready = InitializeCrypto(config); ready.IsErr()) {
            return EngineResult::Err(ready.UnwrapErr());
        }
        if (auto check = RequireStore(store); check.IsErr()) {
            return EngineResult::Err(check.UnwrapErr());
        }

        auto record_result = store->GetLocalIdentity();
        if (record_result.IsErr()) {
            return EngineResult::Err(record_result.UnwrapErr());
        }
        auto record = std::move(record_result).Unwrap();
        if (!record.has_value()) {
            return EngineResult::Err(ProtocolFailure::InvalidState("Store holds no local identity"));
        }
        auto identity_result = IdentityKeyPair::FromPrivateKey(record->private_key);
        Wipe(record->private_key);
        if (identity_result.IsErr()) {
            return EngineResult::Err(ProtocolFailure::InvalidState(
                compat::format("Stored identity is unusable: {}", identity_result.UnwrapErr().message)));
        }
        auto identity = std::move(identity_result).Unwrap();
        if (identity.GetPublicKey().Serialize() != record->public_key) {
            return EngineResult::Err(
                ProtocolFailure::InvalidState("Stored identity public key does not match its private key"));
        }

        auto engine = std::unique_ptr<ProtocolEngine>(
            new ProtocolEngine(std::move(identity), record->registration_id, store, config));

        auto signed_result = store->GetSignedPreKey();
        if (signed_result.IsErr()) {
            return EngineResult::Err(signed_result.UnwrapErr());
        }
        if (auto signed_bytes = std::move(signed_result).Unwrap(); signed_bytes.has_value()) {
            auto signed_pre_key = SignedPreKey::Deserialize(*signed_bytes);
            Wipe(*signed_bytes);
            if (signed_pre_key.IsErr()) {
                return EngineResult::Err(signed_pre_key.UnwrapErr());
            }
            engine->signed_pre_key_.emplace(std::move(signed_pre_key).Unwrap());
        }

        auto ids_result = store->ListPreKeyIds();
        if (ids_result.IsErr()) {
            return EngineResult::Err(ids_result.UnwrapErr());
        }
        for (const uint32_t id : ids_result.Unwrap()) {
            auto bytes_result = store->GetPreKey(id);
            if (bytes_result.IsErr()) {
                return EngineResult::Err(bytes_result.UnwrapErr());
            }
            auto bytes = std::move(bytes_result).Unwrap();
            if (!bytes.has_value()) {
                continue;
            }
            auto pre_key = PreKey::Deserialize(*bytes);
            Wipe(*bytes);
            if (pre_key.IsErr()) {
                return EngineResult::Err(pre_key.UnwrapErr());
            }
            engine->pre_keys_.emplace(id, std::move(pre_key).Unwrap());
        }

        auto cursor_result = store->GetNextPreKeyId();
        if (cursor_result.IsErr()) {
            return EngineResult::Err(cursor_result.UnwrapErr());
        }
        if (auto cursor = cursor_result.Unwrap(); cursor.has_value()) {
            engine->next_pre_key_id_ = *cursor;
        } else if (!engine->pre_keys_.empty()) {
            engine->next_pre_key_id_ = (engine->pre_keys_.rbegin()->first + 1) % kMaxPreKeyId;
        }

        auto trusted_result = store->ListTrustedIdentities();
        if (trusted_result.IsErr()) {
            return EngineResult::Err(trusted_result.UnwrapErr());
        }
        for (const auto& [name, key_bytes] : trusted_result.Unwrap()) {
            auto key = IdentityPublicKey::FromBytes(key_bytes);
            if (key.IsErr()) {
                return EngineResult::Err(ProtocolFailure::Decode(
                    compat::format("Stored trusted identity for {} is invalid", name)));
            }
            engine->trusted_identities_.insert_or_assign(name, std::move(key).Unwrap());
        }

        RC_LOG_VALUE(kSide, "OPEN", "pre_keys", engine->pre_keys_.size());
        RC_LOG_VALUE(kSide, "OPEN", "trusted_identities", engine->trusted_identities_.size());
        return EngineResult::Ok(std::move(engine));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::GetIdentityPrivateKey() const {
        return identity_.GetPrivateKeyBytes();
    }

    SessionLimits ProtocolEngine::GetSessionLimits() const noexcept {
        SessionLimits limits;
        limits.max_skip = config_.GetMaxSkip();
        limits.max_stored_skipped_keys = config_.GetMaxStoredSkippedKeys();
        return limits;
    }

    // ========================================================================
    // Pre-keys
    // ========================================================================

    Result<std::vector<GeneratedPreKey>, ProtocolFailure> ProtocolEngine::GeneratePreKeys(const uint32_t count) {
        std::lock_guard guard(pre_key_lock_);
        return GeneratePreKeysLocked(count);
    }

    Result<std::vector<GeneratedPreKey>, ProtocolFailure> ProtocolEngine::GeneratePreKeysLocked(const uint32_t count) {
        using GenerateResult = Result<std::vector<GeneratedPreKey>, ProtocolFailure>;
        if (count == 0 || count >= kMaxPreKeyId) {
            return GenerateResult::Err(ProtocolFailure::InvalidInput("Pre-key count out of range"));
        }

        // Ids still live in the pool after the cursor wraps are skipped, never overwritten.
        std::vector<PreKey> generated;
        generated.reserve(count);
        uint32_t cursor = next_pre_key_id_;
        for (uint32_t scanned = 0; generated.size() < count; ++scanned) {
            if (scanned == kMaxPreKeyId) {
                return GenerateResult::Err(ProtocolFailure::KeyExhaustion("No free one-time pre-key ids"));
            }
            const uint32_t id = cursor;
            cursor = (cursor + 1) % kMaxPreKeyId;
            if (pre_keys_.contains(id) || reserved_pre_keys_.contains(id)) {
                continue;
            }
            auto pre_key = PreKey::Generate(id);
            if (pre_key.IsErr()) {
                return GenerateResult::Err(pre_key.UnwrapErr());
            }
            generated.push_back(std::move(pre_key).Unwrap());
        }

        for (const auto& pre_key : generated) {
            auto record_result = pre_key.Serialize();
            if (record_result.IsErr()) {
                return GenerateResult::Err(record_result.UnwrapErr());
            }
            auto record = std::move(record_result).Unwrap();
            auto put_result = store_->PutPreKey(pre_key.GetId(), record);
            Wipe(record);
            if (put_result.IsErr()) {
                return GenerateResult::Err(put_result.UnwrapErr());
            }
        }
        const uint32_t next_id = cursor;
        if (auto cursor = store_->PutNextPreKeyId(next_id); cursor.IsErr()) {
            return GenerateResult::Err(cursor.UnwrapErr());
        }

        std::vector<GeneratedPreKey> published;
        published.reserve(count);
        for (auto& pre_key : generated) {
            const uint32_t id = pre_key.GetId();
            published.push_back(GeneratedPreKey{id, pre_key.GetPublicKey()});
            debug::LogPreKey(kSide, id, pre_key.GetPublicKey());
            pre_keys_.emplace(id, std::move(pre_key));
        }
        next_pre_key_id_ = next_id;
        RC_LOG_VALUE(kSide, "PREKEY", "generated", count);
        return GenerateResult::Ok(std::move(published));
    }

    Result<SignedPreKeyPublic, ProtocolFailure> ProtocolEngine::GenerateSignedPreKey(const uint32_t id) {
        auto signed_result = SignedPreKey::Generate(id, identity_);
        if (signed_result.IsErr()) {
            return Result<SignedPreKeyPublic, ProtocolFailure>::Err(signed_result.UnwrapErr());
        }
        auto signed_pre_key = std::move(signed_result).Unwrap();
        auto record_result = signed_pre_key.Serialize();
        if (record_result.IsErr()) {
            return Result<SignedPreKeyPublic, ProtocolFailure>::Err(record_result.UnwrapErr());
        }
        auto record = std::move(record_result).Unwrap();

        std::lock_guard guard(pre_key_lock_);
        auto put_result = store_->PutSignedPreKey(record);
        Wipe(record);
        if (put_result.IsErr()) {
            return Result<SignedPreKeyPublic, ProtocolFailure>::Err(put_result.UnwrapErr());
        }
        SignedPreKeyPublic published{id, signed_pre_key.GetPublicKey(), signed_pre_key.GetSignature()};
        debug::LogSignedPreKey(kSide, id, signed_pre_key.GetPublicKey(), signed_pre_key.GetSignature());
        signed_pre_key_.emplace(std::move(signed_pre_key));
        return Result<SignedPreKeyPublic, ProtocolFailure>::Ok(std::move(published));
    }

    Result<PreKeyBundle, ProtocolFailure> ProtocolEngine::CreatePreKeyBundle(const uint32_t device_id) const {
        std::lock_guard guard(pre_key_lock_);
        if (!signed_pre_key_.has_value()) {
            return Result<PreKeyBundle, ProtocolFailure>::Err(
                ProtocolFailure::NoSignedPreKey("No signed pre-key has been generated"));
        }

        std::optional<models::BundlePreKey> one_time;
        if (auto lowest = LowestPreKeyLocked(); lowest.IsOk()) {
            one_time = std::move(lowest).Unwrap();
        } else {
            RC_LOG_MSG(kSide, "BUNDLE", lowest.UnwrapErr().message + "; publishing signed pre-key only");
        }

        return Result<PreKeyBundle, ProtocolFailure>::Ok(PreKeyBundle(
            registration_id_,
            device_id,
            std::move(one_time),
            signed_pre_key_->GetId(),
            signed_pre_key_->GetPublicKey(),
            signed_pre_key_->GetSignature(),
            identity_.GetPublicKey()));
    }

    Result<models::BundlePreKey, ProtocolFailure> ProtocolEngine::LowestPreKeyLocked() const {
        for (const auto& [id, pre_key] : pre_keys_) {
            if (!reserved_pre_keys_.contains(id)) {
                return Result<models::BundlePreKey, ProtocolFailure>::Ok(
                    models::BundlePreKey{id, pre_key.GetPublicKey()});
            }
        }
        return Result<models::BundlePreKey, ProtocolFailure>::Err(
            ProtocolFailure::KeyExhaustion("One-time pre-key pool is empty"));
    }

    size_t ProtocolEngine::PreKeyCount() const {
        std::lock_guard guard(pre_key_lock_);
        return pre_keys_.size();
    }

    Result<uint32_t, ProtocolFailure> ProtocolEngine::RefillPreKeysIfNeeded() {
        std::lock_guard guard(pre_key_lock_);
        if (pre_keys_.size() >= config_.GetPreKeyLowWaterMark()) {
            return Result<uint32_t, ProtocolFailure>::Ok(0);
        }
        auto generated = GeneratePreKeysLocked(config_.GetPreKeyBatchSize());
        if (generated.IsErr()) {
            return Result<uint32_t, ProtocolFailure>::Err(generated.UnwrapErr());
        }
        return Result<uint32_t, ProtocolFailure>::Ok(static_cast<uint32_t>(generated.Unwrap().size()));
    }

    Result<std::optional<PreKey>, ProtocolFailure> ProtocolEngine::FindPreKeyLocked(const uint32_t id) {
        using FindResult = Result<std::optional<PreKey>, ProtocolFailure>;
        if (auto it = pre_keys_.find(id); it != pre_keys_.end()) {
            auto clone = it->second.Clone();
            if (clone.IsErr()) {
                return FindResult::Err(clone.UnwrapErr());
            }
            return FindResult::Ok(std::optional<PreKey>(std::move(clone).Unwrap()));
        }
        auto stored_result = store_->GetPreKey(id);
        if (stored_result.IsErr()) {
            return FindResult::Err(stored_result.UnwrapErr());
        }
        auto stored = std::move(stored_result).Unwrap();
        if (!stored.has_value()) {
            return FindResult::Ok(std::nullopt);
        }
        auto pre_key = PreKey::Deserialize(*stored);
        Wipe(*stored);
        if (pre_key.IsErr()) {
            return FindResult::Err(pre_key.UnwrapErr());
        }
        return FindResult::Ok(std::optional<PreKey>(std::move(pre_key).Unwrap()));
    }

    Result<ProtocolEngine::ResponderKeys, ProtocolFailure> ProtocolEngine::ReserveResponderKeys(
        const uint32_t signed_pre_key_id,
        const std::optional<uint32_t> pre_key_id) {
        using ReserveResult = Result<ResponderKeys, ProtocolFailure>;
        std::lock_guard guard(pre_key_lock_);
        if (!signed_pre_key_.has_value()) {
            return ReserveResult::Err(ProtocolFailure::NoSignedPreKey("No signed pre-key to answer with"));
        }
        if (signed_pre_key_->GetId() != signed_pre_key_id) {
            return ReserveResult::Err(ProtocolFailure::UnknownSignedPreKey(
                compat::format("Unknown signed pre-key id {}", signed_pre_key_id)));
        }
        auto signed_clone = signed_pre_key_->Clone();
        if (signed_clone.IsErr()) {
            return ReserveResult::Err(signed_clone.UnwrapErr());
        }

        std::optional<PreKey> one_time;
        if (pre_key_id.has_value()) {
            if (!reserved_pre_keys_.contains(*pre_key_id)) {
                auto found = FindPreKeyLocked(*pre_key_id);
                if (found.IsErr()) {
                    return ReserveResult::Err(found.UnwrapErr());
                }
                one_time = std::move(found).Unwrap();
            }
            if (!one_time.has_value()) {
                debug::LogRejected(kSide, "PREKEY", "unknown or consumed one-time pre-key");
                return ReserveResult::Err(ProtocolFailure::UnknownPreKey(
                    compat::format("Unknown one-time pre-key id {}", *pre_key_id)));
            }
            reserved_pre_keys_.insert(*pre_key_id);
        }
        return ReserveResult::Ok(ResponderKeys{std::move(signed_clone).Unwrap(), std::move(one_time)});
    }

    void ProtocolEngine::ReleasePreKeyReservation(const uint32_t id) {
        std::lock_guard guard(pre_key_lock_);
        reserved_pre_keys_.erase(id);
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::ConsumePreKey(const uint32_t id) {
        std::lock_guard guard(pre_key_lock_);
        if (auto deleted = store_->DeletePreKey(id); deleted.IsErr()) {
            return deleted;
        }
        pre_keys_.erase(id);
        reserved_pre_keys_.erase(id);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ========================================================================
    // Sessions
    // ========================================================================

    std::shared_ptr<ProtocolEngine::SessionEntry> ProtocolEngine::GetEntry(const ProtocolAddress& address) {
        {
            std::shared_lock read_guard(sessions_lock_);
            if (auto it = sessions_.find(address); it != sessions_.end()) {
                return it->second;
            }
        }
        std::unique_lock write_guard(sessions_lock_);
        auto [it, _] = sessions_.try_emplace(address, std::make_shared<SessionEntry>());
        return it->second;
    }

    void ProtocolEngine::RetireEntry(const ProtocolAddress& address, SessionEntry& entry) {
        std::unique_lock write_guard(sessions_lock_);
        if (auto it = sessions_.find(address); it != sessions_.end() && it->second.get() == &entry) {
            sessions_.erase(it);
            entry.retired = true;
        }
    }

    size_t ProtocolEngine::GetCachedSessionCount() const {
        std::shared_lock guard(sessions_lock_);
        return sessions_.size();
    }

    ProtocolEngine::LockedEntry::LockedEntry(ProtocolEngine& engine, const ProtocolAddress& address)
        : engine_(engine)
        , address_(address) {
        // A retired entry may still be handed out by a lookup that raced its removal.
        for (;;) {
            entry_ = engine_.GetEntry(address_);
            guard_ = std::unique_lock<std::mutex>(entry_->lock);
            if (!entry_->retired) {
                break;
            }
            guard_.unlock();
        }
    }

    ProtocolEngine::LockedEntry::~LockedEntry() {
        if (!entry_->state.has_value()) {
            engine_.RetireEntry(address_, *entry_);
        }
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::EnsureLoaded(SessionEntry& entry, const ProtocolAddress& address) {
        if (entry.loaded) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        auto stored_result = store_->GetSession(address.ToString());
        if (stored_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(stored_result.UnwrapErr());
        }
        auto stored = std::move(stored_result).Unwrap();
        if (stored.has_value()) {
            auto state = SessionState::Deserialize(*stored, GetSessionLimits());
            Wipe(*stored);
            if (state.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(state.UnwrapErr());
            }
            entry.state.emplace(std::move(state).Unwrap());
        }
        entry.loaded = true;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::CommitSession(
        SessionEntry& entry,
        const ProtocolAddress& address,
        SessionState state) {
        auto blob_result = state.Serialize();
        if (blob_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(blob_result.UnwrapErr());
        }
        auto blob = std::move(blob_result).Unwrap();
        auto put_result = store_->PutSession(address.ToString(), blob);
        Wipe(blob);
        if (put_result.IsErr()) {
            debug::LogRejected(kSide, "PERSIST", put_result.UnwrapErr().message);
            return put_result;
        }
        entry.state = std::move(state);
        entry.loaded = true;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void ProtocolEngine::UndoSessionCommit(
        SessionEntry& entry,
        const ProtocolAddress& address,
        const std::optional<std::vector<uint8_t>>& previous_blob,
        std::optional<SessionState> previous_state,
        const bool previous_loaded) {
        const std::string key = address.ToString();
        auto restored = previous_blob.has_value()
            ? store_->PutSession(key, *previous_blob)
            : store_->DeleteSession(key);
        if (restored.IsErr()) {
            // Whatever the store kept is reloaded on next use.
            debug::LogRejected(kSide, "ROLLBACK", restored.UnwrapErr().message);
            entry.state.reset();
            entry.loaded = false;
            return;
        }
        entry.state = std::move(previous_state);
        entry.loaded = previous_loaded;
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::CheckTrust(
        const std::string& name,
        const IdentityPublicKey& identity_key) const {
        std::shared_lock guard(trust_lock_);
        if (auto it = trusted_identities_.find(name);
            it != trusted_identities_.end() && !(it->second == identity_key)) {
            debug::LogRejected(kSide, "TRUST", name);
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::IdentityMismatch(
                compat::format("Identity key for {} differs from the trusted one", name)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::pair<SessionState, X3dhResult>, ProtocolFailure> ProtocolEngine::EstablishInitiatorSession(
        const ProtocolAddress& address,
        const PreKeyBundle& bundle) {
        using EstablishResult = Result<std::pair<SessionState, X3dhResult>, ProtocolFailure>;
        if (auto verified = bundle.Verify(); verified.IsErr()) {
            return EstablishResult::Err(verified.UnwrapErr());
        }
        if (auto trusted = CheckTrust(address.GetName(), bundle.GetIdentityKey()); trusted.IsErr()) {
            return EstablishResult::Err(trusted.UnwrapErr());
        }

        auto x3dh_result = X3dh::Initiate(identity_, bundle);
        if (x3dh_result.IsErr()) {
            return EstablishResult::Err(x3dh_result.UnwrapErr());
        }
        auto agreement = std::move(x3dh_result).Unwrap();

        auto ratchet_key = models::DhKeyPair::Generate("ratchet");
        if (ratchet_key.IsErr()) {
            return EstablishResult::Err(ratchet_key.UnwrapErr());
        }
        auto state = SessionState::InitializeAsInitiator(
            agreement.shared_secret,
            std::move(ratchet_key).Unwrap(),
            bundle.GetSignedPreKeyPublic(),
            GetSessionLimits());
        if (state.IsErr()) {
            return EstablishResult::Err(state.UnwrapErr());
        }
        return EstablishResult::Ok(std::make_pair(std::move(state).Unwrap(), std::move(agreement)));
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::ProcessPreKeyBundle(
        const ProtocolAddress& address,
        const PreKeyBundle& bundle) {
        auto established = EstablishInitiatorSession(address, bundle);
        if (established.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(established.UnwrapErr());
        }
        auto [state, agreement] = std::move(established).Unwrap();

        LockedEntry entry(*this, address);
        auto committed = CommitSession(*entry, address, std::move(state));
        if (committed.IsOk()) {
            RC_LOG_MSG(kSide, "SESSION", "established with " + address.ToString());
        }
        return committed;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::Encrypt(
        const ProtocolAddress& address,
        std::span<const uint8_t> plaintext) {
        using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        LockedEntry entry(*this, address);
        if (auto loaded = EnsureLoaded(*entry, address); loaded.IsErr()) {
            return BytesResult::Err(loaded.UnwrapErr());
        }
        if (!entry->state.has_value()) {
            return BytesResult::Err(ProtocolFailure::UnknownSession(
                compat::format("No session for {}", address.ToString())));
        }

        auto working_result = entry->state->Clone();
        if (working_result.IsErr()) {
            return BytesResult::Err(working_result.UnwrapErr());
        }
        auto working = std::move(working_result).Unwrap();
        auto message = working.Encrypt(plaintext);
        if (message.IsErr()) {
            return BytesResult::Err(message.UnwrapErr());
        }
        if (auto committed = CommitSession(*entry, address, std::move(working)); committed.IsErr()) {
            return BytesResult::Err(committed.UnwrapErr());
        }
        return BytesResult::Ok(message.Unwrap().Serialize());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::EncryptInitial(
        const ProtocolAddress& address,
        const PreKeyBundle& bundle,
        std::span<const uint8_t> plaintext) {
        using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        auto established = EstablishInitiatorSession(address, bundle);
        if (established.IsErr()) {
            return BytesResult::Err(established.UnwrapErr());
        }
        auto [state, agreement] = std::move(established).Unwrap();

        auto message = state.Encrypt(plaintext);
        if (message.IsErr()) {
            return BytesResult::Err(message.UnwrapErr());
        }

        InitialMessage initial;
        initial.identity_key = identity_.GetPublicKey().Serialize();
        initial.ephemeral_key = agreement.ephemeral_public_key;
        initial.pre_key_id = agreement.used_pre_key_id;
        initial.signed_pre_key_id = bundle.GetSignedPreKeyId();
        initial.encrypted_message = message.Unwrap().Serialize();

        LockedEntry entry(*this, address);
        if (auto committed = CommitSession(*entry, address, std::move(state)); committed.IsErr()) {
            return BytesResult::Err(committed.UnwrapErr());
        }
        return BytesResult::Ok(initial.Serialize());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::Decrypt(
        const ProtocolAddress& address,
        std::span<const uint8_t> ciphertext) {
        using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        auto message = RatchetMessage::Deserialize(ciphertext);
        if (message.IsErr()) {
            return BytesResult::Err(message.UnwrapErr());
        }

        LockedEntry entry(*this, address);
        if (auto loaded = EnsureLoaded(*entry, address); loaded.IsErr()) {
            return BytesResult::Err(loaded.UnwrapErr());
        }
        if (!entry->state.has_value()) {
            return BytesResult::Err(ProtocolFailure::UnknownSession(
                compat::format("No session for {}", address.ToString())));
        }

        auto working_result = entry->state->Clone();
        if (working_result.IsErr()) {
            return BytesResult::Err(working_result.UnwrapErr());
        }
        auto working = std::move(working_result).Unwrap();
        auto plaintext = working.Decrypt(message.Unwrap());
        if (plaintext.IsErr()) {
            return plaintext;
        }
        (void) working.CleanupSkippedKeys(config_.GetSkippedKeyMaxAge());
        if (auto committed = CommitSession(*entry, address, std::move(working)); committed.IsErr()) {
            auto bytes = std::move(plaintext).Unwrap();
            Wipe(bytes);
            return BytesResult::Err(committed.UnwrapErr());
        }
        return plaintext;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::DecryptInitial(
        const ProtocolAddress& address,
        std::span<const uint8_t> ciphertext) {
        using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        auto initial_result = InitialMessage::Deserialize(ciphertext);
        if (initial_result.IsErr()) {
            return BytesResult::Err(initial_result.UnwrapErr());
        }
        const auto initial = std::move(initial_result).Unwrap();
        auto message_result = RatchetMessage::Deserialize(initial.encrypted_message);
        if (message_result.IsErr()) {
            return BytesResult::Err(message_result.UnwrapErr());
        }
        const auto message = std::move(message_result).Unwrap();
        auto their_identity_result = IdentityPublicKey::FromBytes(initial.identity_key);
        if (their_identity_result.IsErr()) {
            return BytesResult::Err(ProtocolFailure::MalformedMessage(their_identity_result.UnwrapErr().message));
        }
        const auto their_identity = std::move(their_identity_result).Unwrap();
        if (auto trusted = CheckTrust(address.GetName(), their_identity); trusted.IsErr()) {
            return BytesResult::Err(trusted.UnwrapErr());
        }

        LockedEntry entry(*this, address);
        auto keys_result = ReserveResponderKeys(initial.signed_pre_key_id, initial.pre_key_id);
        if (keys_result.IsErr()) {
            return BytesResult::Err(keys_result.UnwrapErr());
        }
        const auto keys = std::move(keys_result).Unwrap();

        auto accepted = AcceptInitialMessage(*entry, address, initial, message, their_identity, keys);
        if (keys.one_time_pre_key.has_value()) {
            ReleasePreKeyReservation(keys.one_time_pre_key->GetId());
        }
        if (accepted.IsOk()) {
            RC_LOG_MSG(kSide, "SESSION", "accepted initial message from " + address.ToString());
        }
        return accepted;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ProtocolEngine::AcceptInitialMessage(
        SessionEntry& entry,
        const ProtocolAddress& address,
        const InitialMessage& initial,
        const RatchetMessage& message,
        const IdentityPublicKey& their_identity,
        const ResponderKeys& keys) {
        using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        auto shared_result = X3dh::Respond(
            identity_,
            keys.signed_pre_key,
            keys.one_time_pre_key.has_value() ? &*keys.one_time_pre_key : nullptr,
            their_identity,
            initial.ephemeral_key);
        if (shared_result.IsErr()) {
            return BytesResult::Err(shared_result.UnwrapErr());
        }
        auto shared_secret = std::move(shared_result).Unwrap();

        auto ratchet_key = keys.signed_pre_key.GetKeyPair().Clone();
        if (ratchet_key.IsErr()) {
            Wipe(shared_secret);
            return BytesResult::Err(ratchet_key.UnwrapErr());
        }
        auto state_result = SessionState::InitializeAsResponder(
            shared_secret, std::move(ratchet_key).Unwrap(), GetSessionLimits());
        Wipe(shared_secret);
        if (state_result.IsErr()) {
            return BytesResult::Err(state_result.UnwrapErr());
        }
        auto state = std::move(state_result).Unwrap();

        auto plaintext_result = state.Decrypt(message);
        if (plaintext_result.IsErr()) {
            return plaintext_result;
        }
        auto plaintext = std::move(plaintext_result).Unwrap();
        (void) state.CleanupSkippedKeys(config_.GetSkippedKeyMaxAge());

        const std::string& name = address.GetName();
        auto previous_result = store_->GetSession(address.ToString());
        if (previous_result.IsErr()) {
            Wipe(plaintext);
            return BytesResult::Err(previous_result.UnwrapErr());
        }
        auto previous_blob = std::move(previous_result).Unwrap();
        auto fail = [&](ProtocolFailure failure) {
            Wipe(plaintext);
            if (previous_blob.has_value()) {
                Wipe(*previous_blob);
            }
            return BytesResult::Err(std::move(failure));
        };

        auto trusted = CompareAndTrust(name, their_identity);
        if (trusted.IsErr()) {
            return fail(trusted.UnwrapErr());
        }
        const bool newly_trusted = trusted.Unwrap();

        auto previous_state = std::exchange(entry.state, std::nullopt);
        const bool previous_loaded = entry.loaded;
        if (auto committed = CommitSession(entry, address, std::move(state)); committed.IsErr()) {
            entry.state = std::move(previous_state);
            if (newly_trusted) {
                ForgetTrust(name);
            }
            return fail(committed.UnwrapErr());
        }

        if (keys.one_time_pre_key.has_value()) {
            if (auto consumed = ConsumePreKey(keys.one_time_pre_key->GetId()); consumed.IsErr()) {
                UndoSessionCommit(entry, address, previous_blob, std::move(previous_state), previous_loaded);
                if (newly_trusted) {
                    ForgetTrust(name);
                }
                return fail(consumed.UnwrapErr());
            }
        }
        if (previous_blob.has_value()) {
            Wipe(*previous_blob);
        }
        return BytesResult::Ok(std::move(plaintext));
    }

    Result<bool, ProtocolFailure> ProtocolEngine::HasSession(const ProtocolAddress& address) {
        LockedEntry entry(*this, address);
        if (auto loaded = EnsureLoaded(*entry, address); loaded.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(loaded.UnwrapErr());
        }
        return Result<bool, ProtocolFailure>::Ok(entry->state.has_value());
    }

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> ProtocolEngine::GetSession(
        const ProtocolAddress& address) {
        using BlobResult = Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>;
        LockedEntry entry(*this, address);
        if (auto loaded = EnsureLoaded(*entry, address); loaded.IsErr()) {
            return BlobResult::Err(loaded.UnwrapErr());
        }
        if (!entry->state.has_value()) {
            return BlobResult::Ok(std::nullopt);
        }
        auto blob = entry->state->Serialize();
        if (blob.IsErr()) {
            return BlobResult::Err(blob.UnwrapErr());
        }
        return BlobResult::Ok(std::optional<std::vector<uint8_t>>(std::move(blob).Unwrap()));
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::RestoreSession(
        const ProtocolAddress& address,
        std::span<const uint8_t> serialized) {
        auto state = SessionState::Deserialize(serialized, GetSessionLimits());
        if (state.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(state.UnwrapErr());
        }
        LockedEntry entry(*this, address);
        return CommitSession(*entry, address, std::move(state).Unwrap());
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::DeleteSession(const ProtocolAddress& address) {
        LockedEntry entry(*this, address);
        if (auto deleted = store_->DeleteSession(address.ToString()); deleted.IsErr()) {
            return deleted;
        }
        entry->state.reset();
        entry->loaded = true;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ========================================================================
    // Trust
    // ========================================================================

    Result<std::string, ProtocolFailure> ProtocolEngine::GetSafetyNumber(
        std::string_view local_id,
        std::string_view remote_id) const {
        std::shared_lock guard(trust_lock_);
        auto it = trusted_identities_.find(remote_id);
        if (it == trusted_identities_.end()) {
            return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::UntrustedIdentity(
                compat::format("No trusted identity for {}", remote_id)));
        }
        return Result<std::string, ProtocolFailure>::Ok(identity::FingerprintCalculator::Calculate(
            identity_.GetPublicKey(), local_id, it->second, remote_id));
    }

    Result<Unit, ProtocolFailure> ProtocolEngine::TrustIdentity(
        const std::string& name,
        const IdentityPublicKey& identity_key) {
        std::unique_lock guard(trust_lock_);
        if (auto stored = store_->PutTrustedIdentity(name, identity_key.AsSpan()); stored.IsErr()) {
            return stored;
        }
        trusted_identities_.insert_or_assign(name, identity_key);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<bool, ProtocolFailure> ProtocolEngine::CompareAndTrust(
        const std::string& name,
        const IdentityPublicKey& identity_key) {
        std::unique_lock guard(trust_lock_);
        if (auto it = trusted_identities_.find(name); it != trusted_identities_.end()) {
            if (it->second == identity_key) {
                return Result<bool, ProtocolFailure>::Ok(false);
            }
            debug::LogRejected(kSide, "TRUST", name);
            return Result<bool, ProtocolFailure>::Err(ProtocolFailure::IdentityMismatch(
                compat::format("Identity key for {} differs from the trusted one", name)));
        }
        if (auto stored = store_->PutTrustedIdentity(name, identity_key.AsSpan()); stored.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(stored.UnwrapErr());
        }
        trusted_identities_.emplace(name, identity_key);
        return Result<bool, ProtocolFailure>::Ok(true);
    }

    void ProtocolEngine::ForgetTrust(const std::string& name) {
        std::unique_lock guard(trust_lock_);
        if (auto removed = store_->DeleteTrustedIdentity(name); removed.IsErr()) {
            // The stored record stays authoritative, so memory keeps it too.
            debug::LogRejected(kSide, "ROLLBACK", removed.UnwrapErr().message);
            return;
        }
        trusted_identities_.erase(name);
    }

    bool ProtocolEngine::IsIdentityTrusted(
        const std::string& name,
        const IdentityPublicKey& identity_key) const {
        std::shared_lock guard(trust_lock_);
        auto it = trusted_identities_.find(name);
        return it != trusted_identities_.end() && it->second == identity_key;
    }
}
