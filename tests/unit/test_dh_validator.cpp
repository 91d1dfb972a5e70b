#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include <array>
#include <vector>

using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::security;
using ratchetcore::protocol::crypto::SodiumInterop;

namespace {
    std::array<uint8_t, 32> Filled(uint8_t low, uint8_t middle, uint8_t high) {
        std::array<uint8_t, 32> key{};
        key.fill(middle);
        key[0] = low;
        key[31] = high;
        return key;
    }
}

TEST_CASE("DhValidator - Valid X25519 public keys", "[dh_validator][security]") {
    SECTION("Known valid public key") {
        std::array<uint8_t, 32> valid_key = {
            0x85, 0x20, 0xf0, 0x09, 0x89, 0x30, 0xa7, 0x54,
            0x74, 0x8b, 0x7d, 0xdc, 0xb4, 0x3e, 0xf7, 0x5a,
            0x0d, 0xbf, 0x3a, 0x0d, 0x26, 0x38, 0x1a, 0xf4,
            0xeb, 0xa4, 0xa9, 0x8e, 0xaa, 0x9b, 0x4e, 0x6a
        };
        REQUIRE(DhValidator::ValidateX25519PublicKey(valid_key).IsOk());
    }

    SECTION("Freshly generated keys are accepted") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        for (int i = 0; i < 16; ++i) {
            auto [secret, public_key] = SodiumInterop::GenerateX25519KeyPair("validator").Unwrap();
            REQUIRE(DhValidator::ValidateX25519PublicKey(public_key).IsOk());
        }
    }
}

TEST_CASE("DhValidator - Invalid key size", "[dh_validator][security]") {
    SECTION("Too short") {
        std::vector<uint8_t> short_key(31, 0x42);
        auto result = DhValidator::ValidateX25519PublicKey(short_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }

    SECTION("Too long") {
        std::vector<uint8_t> long_key(33, 0x42);
        REQUIRE(DhValidator::ValidateX25519PublicKey(long_key).IsErr());
    }

    SECTION("Empty") {
        REQUIRE(DhValidator::ValidateX25519PublicKey({}).IsErr());
    }
}

TEST_CASE("DhValidator - Small-order points", "[dh_validator][security]") {
    SECTION("Zero point") {
        const auto zero = Filled(0x00, 0x00, 0x00);
        REQUIRE(DhValidator::HasSmallOrder(zero));
        auto result = DhValidator::ValidateX25519PublicKey(zero);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }

    SECTION("Point of order one") {
        REQUIRE(DhValidator::ValidateX25519PublicKey(Filled(0x01, 0x00, 0x00)).IsErr());
    }

    SECTION("p - 1 and p + 1") {
        REQUIRE(DhValidator::HasSmallOrder(Filled(0xec, 0xff, 0x7f)));
        REQUIRE(DhValidator::HasSmallOrder(Filled(0xee, 0xff, 0x7f)));
    }

    SECTION("High bit does not hide a small-order point") {
        REQUIRE(DhValidator::HasSmallOrder(Filled(0x00, 0x00, 0x80)));
        REQUIRE(DhValidator::ValidateX25519PublicKey(Filled(0x01, 0x00, 0x80)).IsErr());
    }
}

TEST_CASE("DhValidator - Field element encoding", "[dh_validator][security]") {
    SECTION("Values at or above p are not canonical") {
        REQUIRE_FALSE(DhValidator::IsCanonicalFieldElement(Filled(0xef, 0xff, 0x7f)));
        REQUIRE_FALSE(DhValidator::IsCanonicalFieldElement(Filled(0xff, 0xff, 0x7f)));
        auto result = DhValidator::ValidateX25519PublicKey(Filled(0xef, 0xff, 0x7f));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }

    SECTION("Values below p are canonical") {
        REQUIRE(DhValidator::IsCanonicalFieldElement(Filled(0x09, 0x00, 0x00)));
        REQUIRE(DhValidator::IsCanonicalFieldElement(Filled(0xeb, 0xff, 0x7f)));
    }
}
