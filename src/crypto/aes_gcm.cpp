#include "ratchetcore/crypto/aes_gcm.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <string>

namespace ratchetcore::protocol::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct CipherCtxFree {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;
    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    enum class Direction : int { Decrypt = 0, Encrypt = 1 };

    std::string LastOpenSslError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        std::array<char, Constants::OPENSSL_ERROR_BUFFER_SIZE> text{};
        ERR_error_string_n(err, text.data(), text.size());
        return std::string(text.data());
    }

    ProtocolFailure OpenSslFailure(std::string_view step) {
        return ProtocolFailure::Generic(compat::format("{}: {}", step, LastOpenSslError()));
    }

    std::optional<ProtocolFailure> CheckKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return ProtocolFailure::InvalidInput(
                compat::format("AES-256-GCM key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return ProtocolFailure::InvalidInput(
                compat::format("AES-GCM nonce must be {} bytes, got {}", Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }

    /// Creates a context keyed for one direction with the associated data already absorbed.
    Result<CipherCtx, ProtocolFailure> OpenContext(
        const Direction direction,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        using R = Result<CipherCtx, ProtocolFailure>;
        const int enc = static_cast<int>(direction);

        CipherCtx ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return R::Err(OpenSslFailure("EVP_CIPHER_CTX_new"));
        }
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != OpenSSL::SUCCESS) {
            return R::Err(OpenSslFailure("AES-256-GCM init"));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
            return R::Err(OpenSslFailure("AES-256-GCM nonce length"));
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != OpenSSL::SUCCESS) {
            return R::Err(OpenSslFailure("AES-256-GCM key setup"));
        }
        if (!associated_data.empty()) {
            int absorbed = 0;
            if (EVP_CipherUpdate(ctx.get(), nullptr, &absorbed, associated_data.data(),
                                 static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
                return R::Err(OpenSslFailure("AES-256-GCM associated data"));
            }
        }
        return R::Ok(std::move(ctx));
    }

    BytesResult FailAndWipe(std::vector<uint8_t>& buffer, ProtocolFailure failure) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)_wipe;
        return BytesResult::Err(std::move(failure));
    }
}

Result<std::vector<uint8_t>, ProtocolFailure> AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = CheckKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    auto ctx_result = OpenContext(Direction::Encrypt, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> sealed(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int written = 0;
    if (!plaintext.empty() &&
        EVP_CipherUpdate(ctx.get(), sealed.data(), &written, plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        return FailAndWipe(sealed, OpenSslFailure(ErrorMessages::AES_GCM_ENCRYPTION_FAILED));
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), sealed.data() + written, &tail) != OpenSSL::SUCCESS) {
        return FailAndWipe(sealed, OpenSslFailure("AES-256-GCM finalize"));
    }
    written += tail;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, Constants::AES_GCM_TAG_SIZE,
                            sealed.data() + written) != OpenSSL::SUCCESS) {
        return FailAndWipe(sealed, OpenSslFailure("AES-256-GCM tag"));
    }
    sealed.resize(static_cast<size_t>(written) + Constants::AES_GCM_TAG_SIZE);
    return BytesResult::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, ProtocolFailure> AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = CheckKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (sealed.size() < Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidInput(
            compat::format("{}: {} bytes (minimum {} for tag)",
                ErrorMessages::CIPHERTEXT_TOO_SMALL, sealed.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const auto body = sealed.first(sealed.size() - Constants::AES_GCM_TAG_SIZE);
    std::array<uint8_t, Constants::AES_GCM_TAG_SIZE> tag{};
    std::copy(sealed.end() - Constants::AES_GCM_TAG_SIZE, sealed.end(), tag.begin());

    auto ctx_result = OpenContext(Direction::Decrypt, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> plaintext(body.size() + Constants::AES_GCM_TAG_SIZE);
    int written = 0;
    if (!body.empty() &&
        EVP_CipherUpdate(ctx.get(), plaintext.data(), &written, body.data(),
                         static_cast<int>(body.size())) != OpenSSL::SUCCESS) {
        return FailAndWipe(plaintext, OpenSslFailure("AES-256-GCM decrypt"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, Constants::AES_GCM_TAG_SIZE,
                            tag.data()) != OpenSSL::SUCCESS) {
        return FailAndWipe(plaintext, OpenSslFailure("AES-256-GCM set tag"));
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), plaintext.data() + written, &tail) != OpenSSL::SUCCESS) {
        ERR_clear_error();
        return FailAndWipe(plaintext, ProtocolFailure::DecryptionFailure(
            std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    written += tail;
    plaintext.resize(static_cast<size_t>(written));
    return BytesResult::Ok(std::move(plaintext));
}

}
