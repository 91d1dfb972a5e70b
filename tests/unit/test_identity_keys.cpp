#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/models/keys/dh_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::models;
using ratchetcore::protocol::crypto::SodiumInterop;
TEST_CASE("IdentityKeyPair - Generation and restore", "[identity][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    SECTION("Key sizes") {
        REQUIRE(identity.GetPublicKey().Serialize().size() == kEd25519PublicKeyBytes);
        REQUIRE(identity.GetDhPublicKey().size() == kX25519PublicKeyBytes);
        REQUIRE(identity.GetPrivateKeyBytes().Unwrap().size() == kEd25519SeedBytes);
    }
    SECTION("Seed restores the same identity") {
        auto seed = identity.GetPrivateKeyBytes().Unwrap();
        auto restored = IdentityKeyPair::FromPrivateKey(seed).Unwrap();
        REQUIRE(restored.GetPublicKey() == identity.GetPublicKey());
        REQUIRE(restored.GetDhPublicKey() == identity.GetDhPublicKey());
    }
    SECTION("Wrong seed length is rejected") {
        std::vector<uint8_t> short_seed(16, 0x01);
        REQUIRE(IdentityKeyPair::FromPrivateKey(short_seed).IsErr());
    }
    SECTION("Two identities differ") {
        auto other = IdentityKeyPair::Generate().Unwrap();
        REQUIRE_FALSE(other.GetPublicKey() == identity.GetPublicKey());
    }
}
TEST_CASE("IdentityKeyPair - Signatures", "[identity][keys][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    auto signed_key = DhKeyPair::Generate().Unwrap();
    auto signature = identity.Sign(signed_key.GetPublicKey()).Unwrap();
    SECTION("Public key verifies its own signature") {
        REQUIRE(identity.GetPublicKey().Verify(signed_key.GetPublicKey(), signature).IsOk());
    }
    SECTION("Other identity rejects the signature") {
        auto other = IdentityKeyPair::Generate().Unwrap();
        auto result = other.GetPublicKey().Verify(signed_key.GetPublicKey(), signature);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::VerificationFailure);
    }
}
TEST_CASE("IdentityKeyPair - Montgomery form agrees with Edwards form", "[identity][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeyPair::Generate().Unwrap();
    auto bob = IdentityKeyPair::Generate().Unwrap();
    SECTION("Identity DH is symmetric") {
        auto alice_shared = alice.Agree(bob.GetDhPublicKey()).Unwrap();
        auto bob_shared = bob.Agree(alice.GetDhPublicKey()).Unwrap();
        REQUIRE(alice_shared == bob_shared);
    }
    SECTION("Public conversion matches the identity's DH key") {
        auto converted = SodiumInterop::ConvertEd25519PublicToX25519(alice.GetPublicKey().Serialize()).Unwrap();
        REQUIRE(converted == alice.GetDhPublicKey());
        REQUIRE(IdentityPublicKey::FromBytes(alice.GetPublicKey().Serialize()).Unwrap().ToX25519() == converted);
    }
    SECTION("Identity agrees with an ephemeral key") {
        auto ephemeral = DhKeyPair::Generate().Unwrap();
        REQUIRE(alice.Agree(ephemeral.GetPublicKey()).Unwrap() ==
                ephemeral.Agree(alice.GetDhPublicKey()).Unwrap());
    }
}
TEST_CASE("IdentityPublicKey - Parsing", "[identity][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wrong length") {
        std::vector<uint8_t> bytes(31, 0x01);
        auto result = IdentityPublicKey::FromBytes(bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }
}
TEST_CASE("DhKeyPair - Generation, restore and clone", "[keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key_pair = DhKeyPair::Generate().Unwrap();
    SECTION("Private key restores the same public key") {
        auto private_key = key_pair.GetPrivateKeyBytes().Unwrap();
        REQUIRE(private_key.size() == kX25519PrivateKeyBytes);
        auto restored = DhKeyPair::FromPrivateKey(private_key).Unwrap();
        REQUIRE(restored.GetPublicKey() == key_pair.GetPublicKey());
    }
    SECTION("Clone shares key material") {
        auto clone = key_pair.Clone().Unwrap();
        REQUIRE(clone.GetPublicKey() == key_pair.GetPublicKey());
        REQUIRE(clone.GetPrivateKeyBytes().Unwrap() == key_pair.GetPrivateKeyBytes().Unwrap());
    }
    SECTION("Wrong private key length") {
        std::vector<uint8_t> bad(12, 0x01);
        REQUIRE(DhKeyPair::FromPrivateKey(bad).IsErr());
    }
}
