#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/crypto/aes_gcm.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        std::vector<uint8_t> ad = {'a', 'd'};
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();
        REQUIRE(ciphertext.size() == plaintext.size() + kAesGcmTagBytes);
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext, ad).Unwrap() == plaintext);
    }
    SECTION("Empty plaintext still carries a tag") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x11);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x22);
        auto ciphertext = AesGcm::Encrypt(key, nonce, {}).Unwrap();
        REQUIRE(ciphertext.size() == kAesGcmTagBytes);
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext).Unwrap().empty());
    }
    SECTION("Large plaintext") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x33);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x44);
        std::vector<uint8_t> plaintext(10000, 0x55);
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext).Unwrap() == plaintext);
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    std::vector<uint8_t> ad = {'c', 'o', 'n', 't', 'e', 'x', 't'};
    auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();
    auto expect_auth_failure = [](const Result<std::vector<uint8_t>, ProtocolFailure>& result) {
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DecryptionFailure);
    };
    SECTION("Wrong key") {
        std::vector<uint8_t> wrong_key(kAesKeyBytes, 0x99);
        expect_auth_failure(AesGcm::Decrypt(wrong_key, nonce, ciphertext, ad));
    }
    SECTION("Wrong nonce") {
        std::vector<uint8_t> wrong_nonce(kAesGcmNonceBytes, 0x00);
        expect_auth_failure(AesGcm::Decrypt(key, wrong_nonce, ciphertext, ad));
    }
    SECTION("Wrong associated data") {
        std::vector<uint8_t> wrong_ad = {'o', 't', 'h', 'e', 'r'};
        expect_auth_failure(AesGcm::Decrypt(key, nonce, ciphertext, wrong_ad));
    }
    SECTION("Missing associated data") {
        expect_auth_failure(AesGcm::Decrypt(key, nonce, ciphertext));
    }
    SECTION("Tampered ciphertext") {
        ciphertext[0] ^= 0x01;
        expect_auth_failure(AesGcm::Decrypt(key, nonce, ciphertext, ad));
    }
    SECTION("Tampered tag") {
        ciphertext.back() ^= 0x80;
        expect_auth_failure(AesGcm::Decrypt(key, nonce, ciphertext, ad));
    }
}
TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0x01);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
    SECTION("Short key") {
        std::vector<uint8_t> short_key(16, 0x01);
        auto result = AesGcm::Encrypt(short_key, nonce, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Short nonce") {
        std::vector<uint8_t> short_nonce(8, 0x02);
        REQUIRE(AesGcm::Encrypt(key, short_nonce, key).IsErr());
        REQUIRE(AesGcm::Decrypt(key, short_nonce, std::vector<uint8_t>(32, 0)).IsErr());
    }
    SECTION("Ciphertext shorter than the tag") {
        auto result = AesGcm::Decrypt(key, nonce, std::vector<uint8_t>(kAesGcmTagBytes - 1, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
