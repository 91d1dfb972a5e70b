#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/crypto/sodium_secure_memory_handle.hpp"

#include <string>

namespace ratchetcore::protocol::crypto {

namespace {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;
    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    void WipeQuietly(std::span<uint8_t> buffer) {
        auto _wipe = SodiumInterop::SecureWipe(buffer);
        (void)_wipe;
    }
}

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

KeyPairResult SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    std::vector<uint8_t> sk_bytes = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);

    auto pk_result = DeriveX25519PublicKey(sk_bytes);
    if (pk_result.IsErr()) {
        WipeQuietly(sk_bytes);
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to derive " + std::string(key_purpose) + " public key: " +
            pk_result.UnwrapErr().message));
    }

    auto sk_handle_result = SecureMemoryHandle::FromBytes(sk_bytes);
    WipeQuietly(sk_bytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }

    return KeyPairResult::Ok(std::make_pair(
        std::move(sk_handle_result).Unwrap(),
        std::move(pk_result).Unwrap()));
}

BytesResult SodiumInterop::DeriveX25519PublicKey(std::span<const uint8_t> private_key) {
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidKey(
            "X25519 private key must be " +
            std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> public_key(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::DeriveKey(
            "Failed to derive X25519 public key"));
    }
    return BytesResult::Ok(std::move(public_key));
}

BytesResult SodiumInterop::ComputeX25519(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> public_key) {
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE ||
        public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidKey(
            "X25519 agreement requires 32-byte private and public keys"));
    }
    std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
    if (crypto_scalarmult(shared.data(), private_key.data(), public_key.data()) != SodiumConstants::SUCCESS) {
        WipeQuietly(shared);
        return BytesResult::Err(ProtocolFailure::DeriveKey(
            "X25519 agreement produced a low-order result"));
    }
    return BytesResult::Ok(std::move(shared));
}

KeyPairResult SodiumInterop::GenerateEd25519KeyPair() {
    std::vector<uint8_t> seed = GetRandomBytes(Constants::ED_25519_SEED_SIZE);
    auto result = Ed25519KeyPairFromSeed(seed);
    WipeQuietly(seed);
    return result;
}

KeyPairResult SodiumInterop::Ed25519KeyPairFromSeed(std::span<const uint8_t> seed) {
    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        return KeyPairResult::Err(ProtocolFailure::InvalidKey(
            "Ed25519 seed must be " + std::to_string(Constants::ED_25519_SEED_SIZE) + " bytes"));
    }

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != SodiumConstants::SUCCESS) {
        WipeQuietly(sk);
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to generate Ed25519 key pair"));
    }
    auto write_result = sk_handle.Write(sk);
    WipeQuietly(sk);
    if (write_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

BytesResult SodiumInterop::SignEd25519(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> message) {
    if (secret_key.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidKey(
            "Ed25519 secret key handle has wrong size"));
    }

    auto sign_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
        const int rc = crypto_sign_detached(
            signature.data(), nullptr, message.data(), message.size(), sk.data());
        return std::make_pair(rc, std::move(signature));
    });
    if (sign_result.IsErr()) {
        return BytesResult::Err(ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    auto [rc, signature] = std::move(sign_result).Unwrap();
    if (rc != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::Generic("Ed25519 signing failed"));
    }
    return BytesResult::Ok(std::move(signature));
}

Result<Unit, ProtocolFailure> SodiumInterop::VerifyEd25519(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidKey(
            "Ed25519 public key must be " +
            std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidKey(
            "Ed25519 signature must be " +
            std::to_string(Constants::ED_25519_SIGNATURE_SIZE) + " bytes"));
    }
    if (crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                    public_key.data()) != SodiumConstants::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::VerificationFailure(
            "Ed25519 signature verification failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

BytesResult SodiumInterop::ConvertEd25519PublicToX25519(std::span<const uint8_t> ed25519_public_key) {
    if (ed25519_public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidKey(
            "Ed25519 public key must be " +
            std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> x25519_public(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_public.data(), ed25519_public_key.data()) !=
        SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::InvalidKey(
            "Ed25519 public key is not a valid curve point"));
    }
    return BytesResult::Ok(std::move(x25519_public));
}

Result<SecureMemoryHandle, ProtocolFailure> SodiumInterop::ConvertEd25519SecretToX25519(
    const SecureMemoryHandle& ed25519_secret_key) {
    if (ed25519_secret_key.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(ProtocolFailure::InvalidKey(
            "Ed25519 secret key handle has wrong size"));
    }

    auto convert_result = ed25519_secret_key.WithReadAccess([](std::span<const uint8_t> sk) {
        std::vector<uint8_t> x25519_secret(Constants::X_25519_PRIVATE_KEY_SIZE);
        const int rc = crypto_sign_ed25519_sk_to_curve25519(x25519_secret.data(), sk.data());
        return std::make_pair(rc, std::move(x25519_secret));
    });
    if (convert_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(convert_result.UnwrapErr()));
    }
    auto [rc, x25519_secret] = std::move(convert_result).Unwrap();
    if (rc != SodiumConstants::SUCCESS) {
        WipeQuietly(x25519_secret);
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(ProtocolFailure::DeriveKey(
            "Failed to convert Ed25519 secret key"));
    }

    auto handle_result = SecureMemoryHandle::FromBytes(x25519_secret);
    WipeQuietly(x25519_secret);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle_result).Unwrap());
}

BytesResult SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.empty()) {
        return BytesResult::Err(ProtocolFailure::InvalidKey("HMAC key cannot be empty"));
    }
    crypto_auth_hmacsha256_state state;
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_update(&state, data.data(), data.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_final(&state, mac.data()) != SodiumConstants::SUCCESS) {
        sodium_memzero(&state, sizeof(state));
        return BytesResult::Err(ProtocolFailure::DeriveKey("HMAC-SHA256 computation failed"));
    }
    sodium_memzero(&state, sizeof(state));
    return BytesResult::Ok(std::move(mac));
}

std::vector<uint8_t> SodiumInterop::Sha256(std::initializer_list<std::span<const uint8_t>> parts) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    for (const auto& part : parts) {
        crypto_hash_sha256_update(&state, part.data(), part.size());
    }
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, digest.data());
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);

    return value;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
