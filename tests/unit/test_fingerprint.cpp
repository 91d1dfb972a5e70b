#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/identity/fingerprint_calculator.hpp"
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include <algorithm>
#include <cctype>
using namespace ratchetcore::protocol;
using ratchetcore::protocol::crypto::SodiumInterop;
using ratchetcore::protocol::identity::FingerprintCalculator;
using ratchetcore::protocol::models::IdentityKeyPair;
TEST_CASE("FingerprintCalculator - Format", "[fingerprint][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeyPair::Generate().Unwrap();
    auto bob = IdentityKeyPair::Generate().Unwrap();
    const auto fingerprint = FingerprintCalculator::Calculate(
        alice.GetPublicKey(), "alice", bob.GetPublicKey(), "bob");
    SECTION("Twelve groups of five digits") {
        REQUIRE(fingerprint.size() == 12 * 5 + 11);
        for (size_t i = 0; i < fingerprint.size(); ++i) {
            if (i % 6 == 5) {
                REQUIRE(fingerprint[i] == ' ');
            } else {
                REQUIRE(std::isdigit(static_cast<unsigned char>(fingerprint[i])));
            }
        }
    }
    SECTION("Deterministic") {
        REQUIRE(FingerprintCalculator::Calculate(
            alice.GetPublicKey(), "alice", bob.GetPublicKey(), "bob") == fingerprint);
    }
}
TEST_CASE("FingerprintCalculator - Both sides agree", "[fingerprint][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeyPair::Generate().Unwrap();
    auto bob = IdentityKeyPair::Generate().Unwrap();
    SECTION("Distinct labels") {
        REQUIRE(FingerprintCalculator::Calculate(alice.GetPublicKey(), "alice", bob.GetPublicKey(), "bob") ==
                FingerprintCalculator::Calculate(bob.GetPublicKey(), "bob", alice.GetPublicKey(), "alice"));
    }
    SECTION("Equal labels fall back to key order") {
        REQUIRE(FingerprintCalculator::Calculate(alice.GetPublicKey(), "device", bob.GetPublicKey(), "device") ==
                FingerprintCalculator::Calculate(bob.GetPublicKey(), "device", alice.GetPublicKey(), "device"));
    }
}
TEST_CASE("FingerprintCalculator - Sensitivity", "[fingerprint][identity][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeyPair::Generate().Unwrap();
    auto bob = IdentityKeyPair::Generate().Unwrap();
    auto mallory = IdentityKeyPair::Generate().Unwrap();
    const auto genuine = FingerprintCalculator::Calculate(
        alice.GetPublicKey(), "alice", bob.GetPublicKey(), "bob");
    SECTION("Different remote key") {
        REQUIRE(FingerprintCalculator::Calculate(
            alice.GetPublicKey(), "alice", mallory.GetPublicKey(), "bob") != genuine);
    }
    SECTION("Different label") {
        REQUIRE(FingerprintCalculator::Calculate(
            alice.GetPublicKey(), "alice", bob.GetPublicKey(), "bobby") != genuine);
    }
    SECTION("Swapped labels") {
        REQUIRE(FingerprintCalculator::Calculate(
            alice.GetPublicKey(), "bob", bob.GetPublicKey(), "alice") != genuine);
    }
}
