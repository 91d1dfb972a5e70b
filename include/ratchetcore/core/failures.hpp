#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace ratchetcore::protocol {

/// Failures raised by the libsodium-backed memory and key primitives.
enum class SodiumFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    ReadOperationFailed,
    InvalidOperation
};

struct SodiumFailure {
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Every error kind the protocol layer reports to callers.
enum class ProtocolFailureType {
    // crypto plumbing
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    InvalidKey,
    VerificationFailure,
    // identity trust
    IdentityMismatch,
    UntrustedIdentity,
    // session and ratchet
    UnknownSession,
    NoSendingChain,
    NoReceivingChain,
    DecryptionFailure,
    TooManySkippedMessages,
    MalformedMessage,
    // pre-key pools
    KeyExhaustion,
    NoSignedPreKey,
    UnknownSignedPreKey,
    UnknownPreKey,
    // persistence
    Decode,
    Encode,
    Storage,
    InvalidState
};

struct ProtocolFailure {
    ProtocolFailureType type;
    std::string message;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

#define RC_PROTOCOL_FAILURE_FACTORY(Name) \
    static ProtocolFailure Name(std::string msg) { \
        return {ProtocolFailureType::Name, std::move(msg)}; \
    }

    RC_PROTOCOL_FAILURE_FACTORY(Generic)
    RC_PROTOCOL_FAILURE_FACTORY(KeyGeneration)
    RC_PROTOCOL_FAILURE_FACTORY(DeriveKey)
    RC_PROTOCOL_FAILURE_FACTORY(InvalidInput)
    RC_PROTOCOL_FAILURE_FACTORY(InvalidKey)
    RC_PROTOCOL_FAILURE_FACTORY(VerificationFailure)
    RC_PROTOCOL_FAILURE_FACTORY(IdentityMismatch)
    RC_PROTOCOL_FAILURE_FACTORY(UntrustedIdentity)
    RC_PROTOCOL_FAILURE_FACTORY(UnknownSession)
    RC_PROTOCOL_FAILURE_FACTORY(NoSendingChain)
    RC_PROTOCOL_FAILURE_FACTORY(NoReceivingChain)
    RC_PROTOCOL_FAILURE_FACTORY(DecryptionFailure)
    RC_PROTOCOL_FAILURE_FACTORY(TooManySkippedMessages)
    RC_PROTOCOL_FAILURE_FACTORY(MalformedMessage)
    RC_PROTOCOL_FAILURE_FACTORY(KeyExhaustion)
    RC_PROTOCOL_FAILURE_FACTORY(NoSignedPreKey)
    RC_PROTOCOL_FAILURE_FACTORY(UnknownSignedPreKey)
    RC_PROTOCOL_FAILURE_FACTORY(UnknownPreKey)
    RC_PROTOCOL_FAILURE_FACTORY(Decode)
    RC_PROTOCOL_FAILURE_FACTORY(Encode)
    RC_PROTOCOL_FAILURE_FACTORY(Storage)
    RC_PROTOCOL_FAILURE_FACTORY(InvalidState)

#undef RC_PROTOCOL_FAILURE_FACTORY

    /// Sodium-level failures surface to protocol callers as Generic.
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& failure) {
        return Generic(failure.message);
    }

    [[nodiscard]] bool Is(const ProtocolFailureType t) const noexcept {
        return type == t;
    }
};

[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    using enum ProtocolFailureType;
    switch (type) {
        case Generic: return "Generic";
        case KeyGeneration: return "KeyGeneration";
        case DeriveKey: return "DeriveKey";
        case InvalidInput: return "InvalidInput";
        case InvalidKey: return "InvalidKey";
        case VerificationFailure: return "VerificationFailure";
        case IdentityMismatch: return "IdentityMismatch";
        case UntrustedIdentity: return "UntrustedIdentity";
        case UnknownSession: return "UnknownSession";
        case NoSendingChain: return "NoSendingChain";
        case NoReceivingChain: return "NoReceivingChain";
        case DecryptionFailure: return "DecryptionFailure";
        case TooManySkippedMessages: return "TooManySkippedMessages";
        case MalformedMessage: return "MalformedMessage";
        case KeyExhaustion: return "KeyExhaustion";
        case NoSignedPreKey: return "NoSignedPreKey";
        case UnknownSignedPreKey: return "UnknownSignedPreKey";
        case UnknownPreKey: return "UnknownPreKey";
        case Decode: return "Decode";
        case Encode: return "Encode";
        case Storage: return "Storage";
        case InvalidState: return "InvalidState";
    }
    return "Unknown";
}

}
