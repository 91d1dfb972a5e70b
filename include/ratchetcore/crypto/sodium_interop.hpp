#pragma once

#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace ratchetcore::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Every primitive the protocol needs from libsodium goes through here:
 * X25519 agreement, Ed25519 signatures, the Ed25519 to X25519 conversions,
 * SHA-256 / HMAC-SHA-256, the CSPRNG and sodium_malloc backed memory.
 * Secret keys are handed out in SecureMemoryHandle, never in plain vectors.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium; thread-safe and idempotent
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// sodium_memzero; fails only before Initialize().
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison; buffers of different length are unequal
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Used only in error messages
     * @return (secret key handle, 32-byte public key)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Compute the X25519 public key for a 32-byte scalar
     */
    static Result<std::vector<uint8_t>, ProtocolFailure>
    DeriveX25519PublicKey(std::span<const uint8_t> private_key);

    /**
     * @brief X25519 agreement
     *
     * Fails with InvalidKey on wrong input lengths and with DeriveKey when
     * the peer key is a low-order point (all-zero shared value).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeX25519(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key);

    /**
     * @brief Generate an Ed25519 key pair
     *
     * @return (64-byte libsodium secret key handle, 32-byte public key)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Rebuild an Ed25519 key pair from its 32-byte seed
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    Ed25519KeyPairFromSeed(std::span<const uint8_t> seed);

    /**
     * @brief Detached Ed25519 signature over @p message
     *
     * @param secret_key Handle holding the 64-byte libsodium secret key
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> SignEd25519(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    /**
     * @brief Verify a detached signature
     *
     * @return Ok when valid, VerificationFailure on mismatch, InvalidKey on
     *         malformed key or signature length
     */
    static Result<Unit, ProtocolFailure> VerifyEd25519(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    /**
     * @brief Edwards to Montgomery map of an Ed25519 public key
     *
     * Rejects non-canonical encodings and small-order points.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure>
    ConvertEd25519PublicToX25519(std::span<const uint8_t> ed25519_public_key);

    /**
     * @brief Clamped SHA-512(seed) scalar matching ConvertEd25519PublicToX25519
     */
    static Result<SecureMemoryHandle, ProtocolFailure>
    ConvertEd25519SecretToX25519(const SecureMemoryHandle& ed25519_secret_key);

    static Result<std::vector<uint8_t>, ProtocolFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    /**
     * @brief SHA-256 over the concatenation of @p parts
     */
    static std::vector<uint8_t> Sha256(std::initializer_list<std::span<const uint8_t>> parts);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
