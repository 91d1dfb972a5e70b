#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/models/bundles/pre_key_bundle.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/models/keys/pre_key.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::models;
using ratchetcore::protocol::crypto::SodiumInterop;
namespace {
PreKeyBundle MakeBundle(const IdentityKeyPair& identity, const SignedPreKey& signed_pre_key, const PreKey* pre_key) {
    std::optional<BundlePreKey> one_time;
    if (pre_key != nullptr) {
        one_time = BundlePreKey{pre_key->GetId(), pre_key->GetPublicKey()};
    }
    return PreKeyBundle(
        1234,
        2,
        std::move(one_time),
        signed_pre_key.GetId(),
        signed_pre_key.GetPublicKey(),
        signed_pre_key.GetSignature(),
        identity.GetPublicKey());
}
}
TEST_CASE("PreKeyBundle - Verification", "[bundle][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    auto signed_pre_key = SignedPreKey::Generate(1, identity).Unwrap();
    auto pre_key = PreKey::Generate(10).Unwrap();
    SECTION("Genuine bundle verifies") {
        REQUIRE(MakeBundle(identity, signed_pre_key, &pre_key).Verify().IsOk());
        REQUIRE(MakeBundle(identity, signed_pre_key, nullptr).Verify().IsOk());
    }
    SECTION("Flipped signature bit fails") {
        auto signature = signed_pre_key.GetSignature();
        signature[0] ^= 0x01;
        PreKeyBundle bundle(1234, 2, std::nullopt, 1, signed_pre_key.GetPublicKey(), signature,
                            identity.GetPublicKey());
        auto result = bundle.Verify();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::VerificationFailure);
    }
    SECTION("Any flipped bit in the signed pre-key fails") {
        const auto& original = signed_pre_key.GetPublicKey();
        for (size_t bit = 0; bit < original.size() * 8; ++bit) {
            auto tampered = original;
            tampered[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            PreKeyBundle bundle(1234, 2, std::nullopt, 1, tampered, signed_pre_key.GetSignature(),
                                identity.GetPublicKey());
            INFO("bit " << bit);
            REQUIRE(bundle.Verify().IsErr());
        }
    }
    SECTION("Signed pre-key swapped for another key fails") {
        auto other = PreKey::Generate(11).Unwrap();
        PreKeyBundle bundle(1234, 2, std::nullopt, 1, other.GetPublicKey(), signed_pre_key.GetSignature(),
                            identity.GetPublicKey());
        REQUIRE(bundle.Verify().UnwrapErr().type == ProtocolFailureType::VerificationFailure);
    }
    SECTION("Signature by a different identity fails") {
        auto impostor = IdentityKeyPair::Generate().Unwrap();
        PreKeyBundle bundle(1234, 2, std::nullopt, 1, signed_pre_key.GetPublicKey(),
                            signed_pre_key.GetSignature(), impostor.GetPublicKey());
        REQUIRE(bundle.Verify().IsErr());
    }
    SECTION("Small-order signed pre-key is rejected before the signature check") {
        PreKeyBundle bundle(1234, 2, std::nullopt, 1, std::vector<uint8_t>(32, 0),
                            signed_pre_key.GetSignature(), identity.GetPublicKey());
        REQUIRE(bundle.Verify().UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }
}
TEST_CASE("PreKeyBundle - Wire format", "[bundle][wire]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    auto signed_pre_key = SignedPreKey::Generate(5, identity).Unwrap();
    auto pre_key = PreKey::Generate(99).Unwrap();
    const auto bytes = MakeBundle(identity, signed_pre_key, &pre_key).Serialize();
    SECTION("Fields survive a round trip") {
        auto parsed = PreKeyBundle::Deserialize(bytes).Unwrap();
        REQUIRE(parsed.GetRegistrationId() == 1234);
        REQUIRE(parsed.GetDeviceId() == 2);
        REQUIRE(parsed.GetPreKey().has_value());
        REQUIRE(parsed.GetPreKey()->id == 99);
        REQUIRE(parsed.GetPreKey()->public_key == pre_key.GetPublicKey());
        REQUIRE(parsed.GetSignedPreKeyId() == 5);
        REQUIRE(parsed.GetIdentityKey() == identity.GetPublicKey());
        REQUIRE(parsed.Verify().IsOk());
    }
    SECTION("Bundle without a one-time pre-key") {
        auto parsed = PreKeyBundle::Deserialize(MakeBundle(identity, signed_pre_key, nullptr).Serialize()).Unwrap();
        REQUIRE_FALSE(parsed.GetPreKey().has_value());
    }
    SECTION("Truncated input") {
        auto truncated = bytes;
        truncated.resize(truncated.size() - 1);
        auto result = PreKeyBundle::Deserialize(truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::MalformedMessage);
    }
    SECTION("Trailing bytes") {
        auto extended = bytes;
        extended.push_back(0x00);
        REQUIRE(PreKeyBundle::Deserialize(extended).IsErr());
    }
    SECTION("Invalid pre-key flag") {
        auto corrupted = bytes;
        corrupted[8] = 0x02;
        REQUIRE(PreKeyBundle::Deserialize(corrupted).IsErr());
    }
}
