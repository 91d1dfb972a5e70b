#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ratchetcore::protocol {

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SeedBytes = 32;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kMacKeyBytes = 32;
inline constexpr size_t kMessageIvBytes = 16;
inline constexpr size_t kMessageKeyMaterialBytes = kMessageKeyBytes + kMacKeyBytes + kMessageIvBytes;
inline constexpr size_t kHmacBytes = 32;
inline constexpr size_t kSharedSecretBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr std::string_view kX3dhInfo = "X3DH";
inline constexpr std::string_view kRootRatchetInfo = "WhisperRatchet";
inline constexpr std::string_view kMessageKeysInfo = "WhisperMessageKeys";
inline constexpr std::string_view kStateHmacInfo = "RatchetCore-State-HMAC";

inline constexpr uint8_t kX3dhPaddingByte = 0xFF;
inline constexpr size_t kX3dhPaddingBytes = 32;
inline constexpr size_t kX3dhSaltBytes = 32;

inline constexpr uint8_t kMessageKeySeedByte = 0x01;
inline constexpr uint8_t kChainKeySeedByte = 0x02;

inline constexpr uint32_t kMaxSkip = 1000;
inline constexpr size_t kMaxStoredSkippedKeys = 2000;

inline constexpr uint32_t kMaxPreKeyId = 0x00FFFFFF;
inline constexpr uint32_t kFirstPreKeyId = 1;
inline constexpr uint32_t kPreKeyBatchSize = 100;
inline constexpr uint32_t kPreKeyLowWaterMark = 10;
inline constexpr uint32_t kRegistrationIdMask = 0x3FFF;

inline constexpr uint8_t kInitialMessageVersion = 3;
inline constexpr uint32_t kSessionRecordVersion = 1;

inline constexpr size_t kMessageHeaderBytes = kX25519PublicKeyBytes + 4 + 4;
inline constexpr size_t kMaxMessageBytes = 10 * 1024 * 1024;

inline constexpr uint32_t kFingerprintIterations = 5199;
inline constexpr size_t kFingerprintGroups = 12;
inline constexpr size_t kFingerprintGroupBytes = 5;
inline constexpr size_t kFingerprintOffsetModulus = 30;
inline constexpr uint64_t kFingerprintGroupModulus = 100000;

inline constexpr int64_t kDefaultSkippedKeyMaxAgeSeconds = 7 * 24 * 60 * 60;

}
