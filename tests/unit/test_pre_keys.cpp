#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/models/keys/pre_key.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::models;
using ratchetcore::protocol::crypto::SodiumInterop;
TEST_CASE("PreKey - Generate and persist", "[pre_keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pre_key = PreKey::Generate(42).Unwrap();
    REQUIRE(pre_key.GetId() == 42);
    SECTION("Record round-trips") {
        auto record = pre_key.Serialize().Unwrap();
        REQUIRE(record.size() == PreKey::SERIALIZED_SIZE);
        auto restored = PreKey::Deserialize(record).Unwrap();
        REQUIRE(restored.GetId() == 42);
        REQUIRE(restored.GetPublicKey() == pre_key.GetPublicKey());
        REQUIRE(restored.GetKeyPair().GetPrivateKeyBytes().Unwrap() ==
                pre_key.GetKeyPair().GetPrivateKeyBytes().Unwrap());
    }
    SECTION("Truncated record is a decode error") {
        auto record = pre_key.Serialize().Unwrap();
        record.pop_back();
        auto result = PreKey::Deserialize(record);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Clone keeps id and key") {
        auto clone = pre_key.Clone().Unwrap();
        REQUIRE(clone.GetId() == pre_key.GetId());
        REQUIRE(clone.GetPublicKey() == pre_key.GetPublicKey());
    }
}
TEST_CASE("SignedPreKey - Generate and persist", "[pre_keys][signature]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    auto signed_pre_key = SignedPreKey::Generate(7, identity).Unwrap();
    SECTION("Signature covers the public key") {
        REQUIRE(signed_pre_key.GetId() == 7);
        REQUIRE(identity.GetPublicKey().Verify(
            signed_pre_key.GetPublicKey(), signed_pre_key.GetSignature()).IsOk());
        REQUIRE(signed_pre_key.GetTimestamp() > 0);
    }
    SECTION("Record round-trips") {
        auto record = signed_pre_key.Serialize().Unwrap();
        REQUIRE(record.size() == SignedPreKey::SERIALIZED_SIZE);
        auto restored = SignedPreKey::Deserialize(record).Unwrap();
        REQUIRE(restored.GetId() == 7);
        REQUIRE(restored.GetPublicKey() == signed_pre_key.GetPublicKey());
        REQUIRE(restored.GetSignature() == signed_pre_key.GetSignature());
        REQUIRE(restored.GetTimestamp() == signed_pre_key.GetTimestamp());
    }
    SECTION("Record with a mismatched public key is rejected") {
        auto record = signed_pre_key.Serialize().Unwrap();
        record[4 + 32] ^= 0x01;
        REQUIRE(SignedPreKey::Deserialize(record).IsErr());
    }
}
