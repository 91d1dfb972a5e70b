#include "ratchetcore/crypto/hkdf.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <array>
#include <memory>

namespace ratchetcore::protocol::crypto {

namespace {
    using OpenSSL = OpenSSLConstants;

    struct KdfFree {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
    };
    struct KdfCtxFree {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };

    char kDigestName[] = OSSL_DIGEST_NAME_SHA2_256;

    OSSL_PARAM OctetParam(const char* name, std::span<const uint8_t> bytes) {
        return OSSL_PARAM_construct_octet_string(name, const_cast<uint8_t*>(bytes.data()), bytes.size());
    }

    /// One EVP_KDF derive call in extract-and-expand mode. Empty salt and info are omitted.
    Result<Unit, ProtocolFailure> RunKdf(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {
        using R = Result<Unit, ProtocolFailure>;
        const std::unique_ptr<EVP_KDF, KdfFree> kdf(EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_HKDF, nullptr));
        if (!kdf) {
            return R::Err(ProtocolFailure::DeriveKey("HKDF is not available from the OpenSSL provider"));
        }
        const std::unique_ptr<EVP_KDF_CTX, KdfCtxFree> ctx(EVP_KDF_CTX_new(kdf.get()));
        if (!ctx) {
            return R::Err(ProtocolFailure::DeriveKey("EVP_KDF_CTX_new failed"));
        }

        std::array<OSSL_PARAM, 5> params{};
        size_t n = 0;
        params[n++] = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, kDigestName, 0);
        params[n++] = OctetParam(OSSL_KDF_PARAM_KEY, ikm);
        if (!salt.empty()) {
            params[n++] = OctetParam(OSSL_KDF_PARAM_SALT, salt);
        }
        if (!info.empty()) {
            params[n++] = OctetParam(OSSL_KDF_PARAM_INFO, info);
        }
        params[n] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params.data()) != OpenSSL::SUCCESS) {
            return R::Err(ProtocolFailure::DeriveKey("EVP_KDF_derive (HKDF-SHA256) failed"));
        }
        return R::Ok(unit);
    }
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("HKDF output size {} outside 1..{}", output.size(), MAX_OUTPUT_LEN)));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("HKDF requires input key material"));
    }

    return RunKdf(ikm, output, salt, info);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> okm(output_size);
    if (auto derived = DeriveKey(ikm, okm, salt, info); derived.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(derived).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(okm));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view info) {
    return DeriveKeyBytes(ikm, output_size, salt,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(info.data()), info.size()));
}

}
