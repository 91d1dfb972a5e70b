#include "ratchetcore/protocol/session_state.hpp"
#include "ratchetcore/protocol/chain_step/chain_step.hpp"
#include "ratchetcore/crypto/aes_gcm.hpp"
#include "ratchetcore/crypto/hkdf.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/debug/key_logger.hpp"
#include "ratchetcore/core/format.hpp"
#include "session/session_state.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/timestamp.pb.h>
#include <sodium.h>
#include <algorithm>
#include <limits>
#include <string>

namespace ratchetcore::protocol {
    using chain_step::ChainStep;
    using crypto::AesGcm;
    using crypto::Hkdf;
    using crypto::SodiumInterop;
    using security::DhValidator;
    using ratchet::RatchetMessage;
    using SessionRecord = proto::session::SessionRecord;

    namespace {
        void Wipe(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
        }

        void Wipe(std::optional<std::vector<uint8_t>>& bytes) {
            if (bytes.has_value()) {
                Wipe(*bytes);
            }
        }

        void WipeString(std::string& bytes) {
            if (!bytes.empty()) {
                sodium_memzero(bytes.data(), bytes.size());
            }
        }

        std::span<const uint8_t> AsSpan(const std::string& bytes) {
            return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
        }

        std::vector<uint8_t> ToBytes(const std::string& bytes) {
            return {bytes.begin(), bytes.end()};
        }

        bool IsAllZero(std::span<const uint8_t> bytes) {
            return std::all_of(bytes.begin(), bytes.end(),
                               [](const uint8_t value) { return value == 0; });
        }

        SkippedKeyId MakeSkippedKeyId(std::span<const uint8_t> ratchet_key, uint32_t counter) {
            SkippedKeyId id;
            std::copy_n(ratchet_key.begin(),
                        std::min(ratchet_key.size(), id.ratchet_key.size()),
                        id.ratchet_key.begin());
            id.counter = counter;
            return id;
        }

        debug::Side SideOf(bool initiator) {
            return initiator ? debug::Side::Initiator : debug::Side::Responder;
        }

        Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(
            const google::protobuf::Message& message) {
            std::string output;
            {
                google::protobuf::io::StringOutputStream stream(&output);
                google::protobuf::io::CodedOutputStream coded_out(&stream);
                coded_out.SetSerializationDeterministic(true);
                if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                    WipeString(output);
                    return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                        ProtocolFailure::Encode("Failed to serialize protobuf deterministically"));
                }
            }
            std::vector<uint8_t> bytes(output.begin(), output.end());
            WipeString(output);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
        }

        /// HMAC over the deterministic encoding of @p record with state_hmac cleared.
        Result<std::vector<uint8_t>, ProtocolFailure> ComputeStateHmac(const SessionRecord& record) {
            auto mac_key_result = Hkdf::DeriveKeyBytes(
                AsSpan(record.root_key()), kHmacBytes, {}, kStateHmacInfo);
            if (mac_key_result.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(mac_key_result.UnwrapErr());
            }
            auto mac_key = std::move(mac_key_result).Unwrap();

            SessionRecord unsigned_record = record;
            unsigned_record.clear_state_hmac();
            auto serialized_result = SerializeDeterministic(unsigned_record);
            unsigned_record.Clear();
            if (serialized_result.IsErr()) {
                Wipe(mac_key);
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(serialized_result.UnwrapErr());
            }
            auto serialized = std::move(serialized_result).Unwrap();

            auto mac_result = SodiumInterop::HmacSha256(mac_key, serialized);
            Wipe(serialized);
            Wipe(mac_key);
            return mac_result;
        }

        void ToTimestamp(std::chrono::system_clock::time_point time, google::protobuf::Timestamp* out) {
            const auto since_epoch = time.time_since_epoch();
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
            const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
            out->set_seconds(seconds.count());
            out->set_nanos(static_cast<int32_t>(nanos.count()));
        }

        std::chrono::system_clock::time_point FromTimestamp(const google::protobuf::Timestamp& timestamp) {
            const auto since_epoch = std::chrono::seconds(timestamp.seconds()) +
                std::chrono::nanoseconds(timestamp.nanos());
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
        }

        Result<Unit, ProtocolFailure> ValidateOptionalKey(
            const std::string& key,
            size_t expected_size,
            const char* name) {
            if (!key.empty() && key.size() != expected_size) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(compat::format("Invalid {} size in session record", name)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    SkippedKey::~SkippedKey() {
        Wipe(cipher_key);
        Wipe(mac_key);
        Wipe(iv);
    }

    SessionState::SessionState(
        models::DhKeyPair dh_self,
        std::vector<uint8_t> root_key,
        const bool initiator,
        const SessionLimits limits)
        : dh_self_(std::move(dh_self))
        , root_key_(std::move(root_key))
        , initiator_(initiator)
        , limits_(limits) {
    }

    SessionState& SessionState::operator=(SessionState&& other) noexcept {
        if (this != &other) {
            WipeSecrets();
            dh_self_ = std::move(other.dh_self_);
            dh_remote_ = std::move(other.dh_remote_);
            root_key_ = std::move(other.root_key_);
            sending_chain_key_ = std::move(other.sending_chain_key_);
            receiving_chain_key_ = std::move(other.receiving_chain_key_);
            sending_counter_ = other.sending_counter_;
            receiving_counter_ = other.receiving_counter_;
            previous_counter_ = other.previous_counter_;
            skipped_keys_ = std::move(other.skipped_keys_);
            next_skipped_sequence_ = other.next_skipped_sequence_;
            initiator_ = other.initiator_;
            limits_ = other.limits_;
        }
        return *this;
    }

    SessionState::~SessionState() {
        WipeSecrets();
    }

    void SessionState::WipeSecrets() noexcept {
        Wipe(root_key_);
        Wipe(sending_chain_key_);
        Wipe(receiving_chain_key_);
    }

    Result<SessionState, ProtocolFailure> SessionState::InitializeAsInitiator(
        std::span<const uint8_t> shared_secret,
        models::DhKeyPair our_ratchet_key,
        std::span<const uint8_t> their_ratchet_key,
        const SessionLimits limits) {
        if (shared_secret.size() != kSharedSecretBytes) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Shared secret must be 32 bytes"));
        }
        if (auto check = DhValidator::ValidateX25519PublicKey(their_ratchet_key); check.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(check.UnwrapErr());
        }

        auto dh_result = our_ratchet_key.Agree(their_ratchet_key);
        if (dh_result.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(dh_result.UnwrapErr());
        }
        auto dh_output = std::move(dh_result).Unwrap();
        auto step_result = ChainStep::DeriveRootKey(shared_secret, dh_output);
        Wipe(dh_output);
        if (step_result.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(step_result.UnwrapErr());
        }
        auto step = std::move(step_result).Unwrap();

        SessionState state(std::move(our_ratchet_key), std::move(step.root_key), true, limits);
        state.dh_remote_ = std::vector<uint8_t>(their_ratchet_key.begin(), their_ratchet_key.end());
        state.sending_chain_key_ = std::move(step.chain_key);
        debug::LogDHRatchet(debug::Side::Initiator, true, state.root_key_, *state.sending_chain_key_,
                            state.dh_self_.GetPublicKeySpan(), their_ratchet_key);
        return Result<SessionState, ProtocolFailure>::Ok(std::move(state));
    }

    Result<SessionState, ProtocolFailure> SessionState::InitializeAsResponder(
        std::span<const uint8_t> shared_secret,
        models::DhKeyPair our_ratchet_key,
        const SessionLimits limits) {
        if (shared_secret.size() != kSharedSecretBytes) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Shared secret must be 32 bytes"));
        }
        SessionState state(
            std::move(our_ratchet_key),
            std::vector<uint8_t>(shared_secret.begin(), shared_secret.end()),
            false,
            limits);
        return Result<SessionState, ProtocolFailure>::Ok(std::move(state));
    }

    SessionPhase SessionState::GetPhase() const noexcept {
        if (!sending_chain_key_.has_value() && !receiving_chain_key_.has_value()) {
            return SessionPhase::ResponderPending;
        }
        if (sending_chain_key_.has_value() && !receiving_chain_key_.has_value()) {
            return SessionPhase::InitiatorEstablished;
        }
        return SessionPhase::Bidirectional;
    }

    bool SessionState::HasSkippedKey(std::span<const uint8_t> ratchet_key, const uint32_t counter) const {
        if (ratchet_key.size() != kX25519PublicKeyBytes) {
            return false;
        }
        return skipped_keys_.contains(MakeSkippedKeyId(ratchet_key, counter));
    }

    Result<RatchetMessage, ProtocolFailure> SessionState::Encrypt(std::span<const uint8_t> plaintext) {
        const auto side = SideOf(initiator_);
        if (!sending_chain_key_.has_value()) {
            debug::LogRejected(side, "ENCRYPT", "no sending chain");
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::NoSendingChain("Session has no sending chain yet"));
        }
        if (sending_counter_ == std::numeric_limits<uint32_t>::max()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Sending counter exhausted"));
        }

        auto keys_result = ChainStep::DeriveMessageKeys(*sending_chain_key_);
        if (keys_result.IsErr()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(keys_result.UnwrapErr());
        }
        auto keys = std::move(keys_result).Unwrap();
        debug::LogChainKeyDerivation(side, "sending", sending_counter_, *sending_chain_key_, keys.cipher_key);

        RatchetMessage message;
        message.header.dh_ratchet_key = dh_self_.GetPublicKey();
        message.header.previous_counter = previous_counter_;
        message.header.message_counter = sending_counter_;
        const auto associated_data = message.header.Serialize();

        auto ciphertext_result = AesGcm::Encrypt(keys.cipher_key, keys.Nonce(), plaintext, associated_data);
        if (ciphertext_result.IsErr()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(ciphertext_result.UnwrapErr());
        }
        message.ciphertext = std::move(ciphertext_result).Unwrap();
        debug::LogEncryption(side, sending_counter_, keys.cipher_key, keys.Nonce(), dh_self_.GetPublicKeySpan());

        Wipe(*sending_chain_key_);
        sending_chain_key_ = std::move(keys.next_chain_key);
        ++sending_counter_;
        return Result<RatchetMessage, ProtocolFailure>::Ok(std::move(message));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionState::Decrypt(const RatchetMessage& message) {
        auto working_result = Clone();
        if (working_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(working_result.UnwrapErr());
        }
        auto working = std::move(working_result).Unwrap();
        auto plaintext_result = working.DecryptInPlace(message);
        if (plaintext_result.IsErr()) {
            debug::LogRejected(SideOf(initiator_), "DECRYPT", plaintext_result.UnwrapErr().message);
            return plaintext_result;
        }
        *this = std::move(working);
        return plaintext_result;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionState::DecryptInPlace(const RatchetMessage& message) {
        const auto& header = message.header;
        if (header.dh_ratchet_key.size() != kX25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Ratchet key must be 32 bytes"));
        }

        if (auto it = skipped_keys_.find(MakeSkippedKeyId(header.dh_ratchet_key, header.message_counter));
            it != skipped_keys_.end()) {
            return DecryptWithSkippedKey(it, message);
        }

        const bool ratchet_needed = !dh_remote_.has_value() ||
            !std::equal(dh_remote_->begin(), dh_remote_->end(),
                        header.dh_ratchet_key.begin(), header.dh_ratchet_key.end());

        if (ratchet_needed) {
            if (receiving_chain_key_.has_value() &&
                header.previous_counter > receiving_counter_ &&
                header.previous_counter - receiving_counter_ > limits_.max_skip) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::TooManySkippedMessages(compat::format(
                        "Previous chain would skip {} messages (limit {})",
                        header.previous_counter - receiving_counter_, limits_.max_skip)));
            }
            if (header.message_counter > limits_.max_skip) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::TooManySkippedMessages(compat::format(
                        "New chain would skip {} messages (limit {})",
                        header.message_counter, limits_.max_skip)));
            }
            if (auto skipped = SkipMessageKeys(header.previous_counter); skipped.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(skipped.UnwrapErr());
            }
            if (auto ratcheted = DhRatchet(header.dh_ratchet_key); ratcheted.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ratcheted.UnwrapErr());
            }
        } else if (header.message_counter < receiving_counter_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::DecryptionFailure(compat::format(
                    "Message key {} was already used or discarded", header.message_counter)));
        }

        if (auto skipped = SkipMessageKeys(header.message_counter); skipped.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(skipped.UnwrapErr());
        }
        if (!receiving_chain_key_.has_value()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::NoReceivingChain("Session has no receiving chain"));
        }

        auto keys_result = ChainStep::DeriveMessageKeys(*receiving_chain_key_);
        if (keys_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(keys_result.UnwrapErr());
        }
        auto keys = std::move(keys_result).Unwrap();
        const auto side = SideOf(initiator_);
        debug::LogChainKeyDerivation(side, "receiving", header.message_counter, *receiving_chain_key_,
                                     keys.cipher_key);

        const auto associated_data = header.Serialize();
        auto plaintext_result = AesGcm::Decrypt(keys.cipher_key, keys.Nonce(), message.ciphertext, associated_data);
        if (plaintext_result.IsErr()) {
            return plaintext_result;
        }

        Wipe(*receiving_chain_key_);
        receiving_chain_key_ = std::move(keys.next_chain_key);
        receiving_counter_ = header.message_counter + 1;
        EnforceSkippedKeyCapacity();
        debug::LogDecryption(side, header.message_counter, header.dh_ratchet_key, ratchet_needed, false);
        return plaintext_result;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionState::DecryptWithSkippedKey(
        std::map<SkippedKeyId, SkippedKey>::iterator entry,
        const RatchetMessage& message) {
        const auto& key = entry->second;
        const auto associated_data = message.header.Serialize();
        auto plaintext_result = AesGcm::Decrypt(
            key.cipher_key,
            std::span<const uint8_t>(key.iv).first(kAesGcmNonceBytes),
            message.ciphertext,
            associated_data);
        if (plaintext_result.IsErr()) {
            return plaintext_result;
        }
        skipped_keys_.erase(entry);
        debug::LogDecryption(SideOf(initiator_), message.header.message_counter,
                             message.header.dh_ratchet_key, false, true);
        return plaintext_result;
    }

    Result<Unit, ProtocolFailure> SessionState::SkipMessageKeys(const uint32_t until) {
        if (!receiving_chain_key_.has_value() || until <= receiving_counter_) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        if (until - receiving_counter_ > limits_.max_skip) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::TooManySkippedMessages(compat::format(
                    "Message would skip {} keys (limit {})", until - receiving_counter_, limits_.max_skip)));
        }

        const uint32_t from = receiving_counter_;
        const auto now = std::chrono::system_clock::now();
        while (receiving_counter_ < until) {
            auto keys_result = ChainStep::DeriveMessageKeys(*receiving_chain_key_);
            if (keys_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(keys_result.UnwrapErr());
            }
            auto keys = std::move(keys_result).Unwrap();

            SkippedKey skipped;
            skipped.cipher_key = std::move(keys.cipher_key);
            skipped.mac_key = std::move(keys.mac_key);
            skipped.iv = std::move(keys.iv);
            skipped.created_at = now;
            skipped.sequence = next_skipped_sequence_++;
            skipped_keys_.insert_or_assign(MakeSkippedKeyId(*dh_remote_, receiving_counter_), std::move(skipped));

            Wipe(*receiving_chain_key_);
            receiving_chain_key_ = std::move(keys.next_chain_key);
            ++receiving_counter_;
        }
        debug::LogSkippedKeys(SideOf(initiator_), from, until, skipped_keys_.size());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> SessionState::DhRatchet(std::span<const uint8_t> their_ratchet_key) {
        if (auto check = DhValidator::ValidateX25519PublicKey(their_ratchet_key); check.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(check.UnwrapErr());
        }
        const auto side = SideOf(initiator_);

        previous_counter_ = sending_counter_;
        sending_counter_ = 0;
        receiving_counter_ = 0;
        dh_remote_ = std::vector<uint8_t>(their_ratchet_key.begin(), their_ratchet_key.end());

        auto receive_dh_result = dh_self_.Agree(their_ratchet_key);
        if (receive_dh_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(receive_dh_result.UnwrapErr());
        }
        auto receive_dh = std::move(receive_dh_result).Unwrap();
        auto receive_step_result = ChainStep::DeriveRootKey(root_key_, receive_dh);
        Wipe(receive_dh);
        if (receive_step_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(receive_step_result.UnwrapErr());
        }
        auto receive_step = std::move(receive_step_result).Unwrap();
        Wipe(root_key_);
        Wipe(receiving_chain_key_);
        root_key_ = std::move(receive_step.root_key);
        receiving_chain_key_ = std::move(receive_step.chain_key);
        debug::LogDHRatchet(side, false, root_key_, *receiving_chain_key_,
                            dh_self_.GetPublicKeySpan(), their_ratchet_key);

        auto new_key_result = models::DhKeyPair::Generate("ratchet");
        if (new_key_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(new_key_result.UnwrapErr());
        }
        dh_self_ = std::move(new_key_result).Unwrap();

        auto send_dh_result = dh_self_.Agree(their_ratchet_key);
        if (send_dh_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(send_dh_result.UnwrapErr());
        }
        auto send_dh = std::move(send_dh_result).Unwrap();
        auto send_step_result = ChainStep::DeriveRootKey(root_key_, send_dh);
        Wipe(send_dh);
        if (send_step_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(send_step_result.UnwrapErr());
        }
        auto send_step = std::move(send_step_result).Unwrap();
        Wipe(root_key_);
        Wipe(sending_chain_key_);
        root_key_ = std::move(send_step.root_key);
        sending_chain_key_ = std::move(send_step.chain_key);
        debug::LogDHRatchet(side, true, root_key_, *sending_chain_key_,
                            dh_self_.GetPublicKeySpan(), their_ratchet_key);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void SessionState::EnforceSkippedKeyCapacity() {
        size_t evicted = 0;
        while (skipped_keys_.size() > limits_.max_stored_skipped_keys) {
            auto oldest = std::min_element(
                skipped_keys_.begin(), skipped_keys_.end(),
                [](const auto& lhs, const auto& rhs) { return lhs.second.sequence < rhs.second.sequence; });
            skipped_keys_.erase(oldest);
            ++evicted;
        }
        if (evicted > 0) {
            debug::LogSkippedKeysEvicted(SideOf(initiator_), "capacity", evicted);
        }
    }

    size_t SessionState::CleanupSkippedKeys(
        const std::chrono::seconds max_age,
        const std::chrono::system_clock::time_point now) {
        const size_t removed = std::erase_if(skipped_keys_, [&](const auto& entry) {
            return now - entry.second.created_at >= max_age;
        });
        if (removed > 0) {
            debug::LogSkippedKeysEvicted(SideOf(initiator_), "age", removed);
        }
        return removed;
    }

    Result<SessionState, ProtocolFailure> SessionState::Clone() const {
        auto dh_self_result = dh_self_.Clone();
        if (dh_self_result.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(dh_self_result.UnwrapErr());
        }
        SessionState copy(std::move(dh_self_result).Unwrap(), root_key_, initiator_, limits_);
        copy.dh_remote_ = dh_remote_;
        copy.sending_chain_key_ = sending_chain_key_;
        copy.receiving_chain_key_ = receiving_chain_key_;
        copy.sending_counter_ = sending_counter_;
        copy.receiving_counter_ = receiving_counter_;
        copy.previous_counter_ = previous_counter_;
        copy.skipped_keys_ = skipped_keys_;
        copy.next_skipped_sequence_ = next_skipped_sequence_;
        return Result<SessionState, ProtocolFailure>::Ok(std::move(copy));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionState::Serialize() const {
        auto private_key_result = dh_self_.GetPrivateKeyBytes();
        if (private_key_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(private_key_result.UnwrapErr());
        }
        auto private_key = std::move(private_key_result).Unwrap();

        SessionRecord record;
        record.set_version(kSessionRecordVersion);
        record.set_dh_self_private(private_key.data(), private_key.size());
        Wipe(private_key);
        record.set_dh_self_public(dh_self_.GetPublicKey().data(), dh_self_.GetPublicKey().size());
        if (dh_remote_.has_value()) {
            record.set_dh_remote_public(dh_remote_->data(), dh_remote_->size());
        }
        record.set_root_key(root_key_.data(), root_key_.size());
        if (sending_chain_key_.has_value()) {
            record.set_sending_chain_key(sending_chain_key_->data(), sending_chain_key_->size());
        }
        if (receiving_chain_key_.has_value()) {
            record.set_receiving_chain_key(receiving_chain_key_->data(), receiving_chain_key_->size());
        }
        record.set_sending_counter(sending_counter_);
        record.set_receiving_counter(receiving_counter_);
        record.set_previous_counter(previous_counter_);
        for (const auto& [id, key] : skipped_keys_) {
            auto* entry = record.add_skipped_keys();
            entry->set_ratchet_key(id.ratchet_key.data(), id.ratchet_key.size());
            entry->set_counter(id.counter);
            entry->set_cipher_key(key.cipher_key.data(), key.cipher_key.size());
            entry->set_mac_key(key.mac_key.data(), key.mac_key.size());
            entry->set_iv(key.iv.data(), key.iv.size());
            ToTimestamp(key.created_at, entry->mutable_created_at());
            entry->set_sequence(key.sequence);
        }
        record.set_next_skipped_sequence(next_skipped_sequence_);
        record.set_initiator(initiator_);

        auto mac_result = ComputeStateHmac(record);
        if (mac_result.IsErr()) {
            record.Clear();
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(mac_result.UnwrapErr());
        }
        auto mac = std::move(mac_result).Unwrap();
        record.set_state_hmac(mac.data(), mac.size());
        auto serialized = SerializeDeterministic(record);
        WipeString(*record.mutable_dh_self_private());
        WipeString(*record.mutable_root_key());
        return serialized;
    }

    Result<SessionState, ProtocolFailure> SessionState::Deserialize(
        std::span<const uint8_t> data,
        const SessionLimits limits) {
        SessionRecord record;
        if (data.empty() || data.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
            !record.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Failed to parse session record"));
        }
        if (record.version() != kSessionRecordVersion) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode(compat::format("Unsupported session record version {}", record.version())));
        }
        if (record.root_key().size() != kRootKeyBytes || IsAllZero(AsSpan(record.root_key()))) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid root key in session record"));
        }
        if (record.state_hmac().size() != kHmacBytes) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Missing or invalid state HMAC"));
        }

        auto expected_result = ComputeStateHmac(record);
        if (expected_result.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(expected_result.UnwrapErr());
        }
        auto expected_mac = std::move(expected_result).Unwrap();
        auto mac_equal = SodiumInterop::ConstantTimeEquals(expected_mac, AsSpan(record.state_hmac()));
        Wipe(expected_mac);
        if (mac_equal.IsErr() || !mac_equal.Unwrap()) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("State HMAC verification failed"));
        }

        if (record.dh_self_private().size() != kX25519PrivateKeyBytes ||
            record.dh_self_public().size() != kX25519PublicKeyBytes) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid ratchet key pair in session record"));
        }
        if (auto r = ValidateOptionalKey(record.dh_remote_public(), kX25519PublicKeyBytes, "remote ratchet key");
            r.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(r.UnwrapErr());
        }
        if (auto r = ValidateOptionalKey(record.sending_chain_key(), kChainKeyBytes, "sending chain key");
            r.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(r.UnwrapErr());
        }
        if (auto r = ValidateOptionalKey(record.receiving_chain_key(), kChainKeyBytes, "receiving chain key");
            r.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(r.UnwrapErr());
        }
        if (record.dh_remote_public().empty() &&
            (!record.sending_chain_key().empty() || !record.receiving_chain_key().empty())) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Session record has chains but no remote ratchet key"));
        }

        auto dh_self_result = models::DhKeyPair::FromPrivateKey(AsSpan(record.dh_self_private()));
        WipeString(*record.mutable_dh_self_private());
        if (dh_self_result.IsErr()) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode(dh_self_result.UnwrapErr().message));
        }
        auto dh_self = std::move(dh_self_result).Unwrap();
        if (!std::equal(dh_self.GetPublicKey().begin(), dh_self.GetPublicKey().end(),
                        record.dh_self_public().begin(), record.dh_self_public().end(),
                        [](const uint8_t lhs, const char rhs) { return lhs == static_cast<uint8_t>(rhs); })) {
            return Result<SessionState, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Ratchet public key does not match private key"));
        }

        SessionState state(std::move(dh_self), ToBytes(record.root_key()), record.initiator(), limits);
        WipeString(*record.mutable_root_key());
        if (!record.dh_remote_public().empty()) {
            state.dh_remote_ = ToBytes(record.dh_remote_public());
        }
        if (!record.sending_chain_key().empty()) {
            state.sending_chain_key_ = ToBytes(record.sending_chain_key());
            WipeString(*record.mutable_sending_chain_key());
        }
        if (!record.receiving_chain_key().empty()) {
            state.receiving_chain_key_ = ToBytes(record.receiving_chain_key());
            WipeString(*record.mutable_receiving_chain_key());
        }
        state.sending_counter_ = record.sending_counter();
        state.receiving_counter_ = record.receiving_counter();
        state.previous_counter_ = record.previous_counter();
        state.next_skipped_sequence_ = record.next_skipped_sequence();

        for (auto& entry : *record.mutable_skipped_keys()) {
            if (entry.ratchet_key().size() != kX25519PublicKeyBytes ||
                entry.cipher_key().size() != kMessageKeyBytes ||
                entry.mac_key().size() != kMacKeyBytes ||
                entry.iv().size() != kMessageIvBytes) {
                return Result<SessionState, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Invalid skipped message key in session record"));
            }
            if (entry.sequence() >= state.next_skipped_sequence_) {
                return Result<SessionState, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Skipped key sequence out of range"));
            }
            SkippedKey key;
            key.cipher_key = ToBytes(entry.cipher_key());
            key.mac_key = ToBytes(entry.mac_key());
            key.iv = ToBytes(entry.iv());
            key.created_at = FromTimestamp(entry.created_at());
            key.sequence = entry.sequence();
            WipeString(*entry.mutable_cipher_key());
            WipeString(*entry.mutable_mac_key());
            WipeString(*entry.mutable_iv());
            const bool inserted = state.skipped_keys_.emplace(
                MakeSkippedKeyId(AsSpan(entry.ratchet_key()), entry.counter()), std::move(key)).second;
            if (!inserted) {
                return Result<SessionState, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Duplicate skipped message key"));
            }
        }
        state.EnforceSkippedKeyCapacity();
        return Result<SessionState, ProtocolFailure>::Ok(std::move(state));
    }
}
