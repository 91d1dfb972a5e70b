#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/protocol/protocol_engine.hpp"
#include "ratchetcore/protocol/initial_message.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "helpers/engine_pair.hpp"
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::test;
using ratchetcore::protocol::crypto::SodiumInterop;
using ratchetcore::protocol::models::PreKeyBundle;
TEST_CASE("Tampering - Ratchet messages", "[security][tampering]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeEngine();
    auto bob = MakeEngine();
    Provision(*bob);
    Handshake(*alice, *bob);
    auto message = alice->Encrypt(kBobAddress, Bytes("authentic")).Unwrap();
    SECTION("Any flipped ciphertext bit is detected") {
        for (size_t i = 4 + kMessageHeaderBytes; i < message.size(); ++i) {
            auto tampered = message;
            tampered[i] ^= 0x80;
            auto result = bob->Decrypt(kAliceAddress, tampered);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DecryptionFailure);
        }
        REQUIRE(Text(bob->Decrypt(kAliceAddress, message).Unwrap()) == "authentic");
    }
    SECTION("Counter rewritten in the header") {
        auto tampered = message;
        tampered[4 + kMessageHeaderBytes - 1] ^= 0x01;
        REQUIRE(bob->Decrypt(kAliceAddress, tampered).IsErr());
        REQUIRE(Text(bob->Decrypt(kAliceAddress, message).Unwrap()) == "authentic");
    }
    SECTION("Truncation is a framing error") {
        std::vector<uint8_t> truncated(message.begin(), message.begin() + 4 + kMessageHeaderBytes + 8);
        auto result = bob->Decrypt(kAliceAddress, truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::MalformedMessage);
    }
    SECTION("Replay is rejected") {
        REQUIRE(bob->Decrypt(kAliceAddress, message).IsOk());
        REQUIRE(bob->Decrypt(kAliceAddress, message).UnwrapErr().type == ProtocolFailureType::DecryptionFailure);
    }
}
TEST_CASE("Tampering - Initial messages", "[security][tampering][x3dh]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeEngine();
    auto bob = MakeEngine();
    Provision(*bob);
    const auto initial = alice->EncryptInitial(kBobAddress, bob->CreatePreKeyBundle(1).Unwrap(), Bytes("hi"))
        .Unwrap();
    auto expect_rejected = [&](const std::vector<uint8_t>& tampered, ProtocolFailureType type) {
        auto result = bob->DecryptInitial(kAliceAddress, tampered);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == type);
        REQUIRE_FALSE(bob->HasSession(kAliceAddress).Unwrap());
        REQUIRE(bob->PreKeyCount() == 5);
    };
    SECTION("Ciphertext bit flip") {
        auto tampered = initial;
        tampered.back() ^= 0x01;
        expect_rejected(tampered, ProtocolFailureType::DecryptionFailure);
    }
    SECTION("Substituted ephemeral key") {
        auto tampered = InitialMessage::Deserialize(initial).Unwrap();
        tampered.ephemeral_key = models::DhKeyPair::Generate().Unwrap().GetPublicKey();
        expect_rejected(tampered.Serialize(), ProtocolFailureType::DecryptionFailure);
    }
    SECTION("Unknown signed pre-key id") {
        auto tampered = InitialMessage::Deserialize(initial).Unwrap();
        tampered.signed_pre_key_id = 99;
        expect_rejected(tampered.Serialize(), ProtocolFailureType::UnknownSignedPreKey);
    }
    SECTION("Unknown one-time pre-key id") {
        auto tampered = InitialMessage::Deserialize(initial).Unwrap();
        tampered.pre_key_id = 4242;
        expect_rejected(tampered.Serialize(), ProtocolFailureType::UnknownPreKey);
    }
    SECTION("Dropped one-time pre-key reference") {
        auto tampered = InitialMessage::Deserialize(initial).Unwrap();
        tampered.pre_key_id.reset();
        expect_rejected(tampered.Serialize(), ProtocolFailureType::DecryptionFailure);
    }
    SECTION("Garbage") {
        expect_rejected(std::vector<uint8_t>(100, 0x07), ProtocolFailureType::MalformedMessage);
    }
    REQUIRE(Text(bob->DecryptInitial(kAliceAddress, initial).Unwrap()) == "hi");
}
TEST_CASE("Tampering - Forged bundles", "[security][tampering][x3dh]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = MakeEngine();
    auto bob = MakeEngine();
    auto mallory = MakeEngine();
    Provision(*bob);
    Provision(*mallory);
    auto genuine = bob->CreatePreKeyBundle(1).Unwrap();
    auto mallory_bundle = mallory->CreatePreKeyBundle(1).Unwrap();
    PreKeyBundle forged(
        genuine.GetRegistrationId(),
        genuine.GetDeviceId(),
        genuine.GetPreKey(),
        genuine.GetSignedPreKeyId(),
        mallory_bundle.GetSignedPreKeyPublic(),
        mallory_bundle.GetSignedPreKeySignature(),
        genuine.GetIdentityKey());
    SECTION("EncryptInitial refuses") {
        auto result = alice->EncryptInitial(kBobAddress, forged, Bytes("hi"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::VerificationFailure);
        REQUIRE_FALSE(alice->HasSession(kBobAddress).Unwrap());
    }
    SECTION("ProcessPreKeyBundle refuses") {
        REQUIRE(alice->ProcessPreKeyBundle(kBobAddress, forged).UnwrapErr().type ==
                ProtocolFailureType::VerificationFailure);
        REQUIRE_FALSE(alice->HasSession(kBobAddress).Unwrap());
    }
}
