#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/protocol/chain_step/chain_step.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/crypto/hkdf.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::chain_step;
using namespace ratchetcore::protocol::crypto;
TEST_CASE("ChainStep - Message key derivation", "[chain_step][ratchet]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> chain_key(kChainKeyBytes, 0x42);
    auto keys = ChainStep::DeriveMessageKeys(chain_key).Unwrap();
    SECTION("Output sizes") {
        REQUIRE(keys.cipher_key.size() == kMessageKeyBytes);
        REQUIRE(keys.mac_key.size() == kMacKeyBytes);
        REQUIRE(keys.iv.size() == kMessageIvBytes);
        REQUIRE(keys.next_chain_key.size() == kChainKeyBytes);
        REQUIRE(keys.Nonce().size() == kAesGcmNonceBytes);
    }
    SECTION("Matches the HMAC and HKDF construction") {
        const std::array<uint8_t, 1> chain_seed{0x02};
        const std::array<uint8_t, 1> message_seed{0x01};
        REQUIRE(keys.next_chain_key == SodiumInterop::HmacSha256(chain_key, chain_seed).Unwrap());
        auto seed = SodiumInterop::HmacSha256(chain_key, message_seed).Unwrap();
        auto material = Hkdf::DeriveKeyBytes(seed, kMessageKeyMaterialBytes, {}, kMessageKeysInfo).Unwrap();
        REQUIRE(std::equal(keys.cipher_key.begin(), keys.cipher_key.end(), material.begin()));
        REQUIRE(std::equal(keys.iv.begin(), keys.iv.end(), material.begin() + 64));
        REQUIRE(std::equal(keys.Nonce().begin(), keys.Nonce().end(), keys.iv.begin()));
    }
    SECTION("Deterministic and advancing") {
        auto again = ChainStep::DeriveMessageKeys(chain_key).Unwrap();
        REQUIRE(again.cipher_key == keys.cipher_key);
        auto next = ChainStep::DeriveMessageKeys(keys.next_chain_key).Unwrap();
        REQUIRE(next.cipher_key != keys.cipher_key);
        REQUIRE(next.next_chain_key != keys.next_chain_key);
        REQUIRE(keys.next_chain_key != chain_key);
    }
    SECTION("Wrong chain key length") {
        const std::vector<uint8_t> short_key(16, 0x01);
        auto result = ChainStep::DeriveMessageKeys(short_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }
}
TEST_CASE("ChainStep - Root key derivation", "[chain_step][ratchet]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> root_key(kRootKeyBytes, 0x11);
    const std::vector<uint8_t> dh_output(kX25519SharedSecretBytes, 0x22);
    SECTION("Splits 64 bytes of HKDF output") {
        auto step = ChainStep::DeriveRootKey(root_key, dh_output).Unwrap();
        auto expected = Hkdf::DeriveKeyBytes(dh_output, 64, root_key, kRootRatchetInfo).Unwrap();
        REQUIRE(std::equal(step.root_key.begin(), step.root_key.end(), expected.begin()));
        REQUIRE(std::equal(step.chain_key.begin(), step.chain_key.end(), expected.begin() + 32));
        REQUIRE(step.root_key != step.chain_key);
    }
    SECTION("Different DH outputs give different chains") {
        const std::vector<uint8_t> other_dh(kX25519SharedSecretBytes, 0x23);
        auto first = ChainStep::DeriveRootKey(root_key, dh_output).Unwrap();
        auto second = ChainStep::DeriveRootKey(root_key, other_dh).Unwrap();
        REQUIRE(first.chain_key != second.chain_key);
        REQUIRE(first.root_key != second.root_key);
    }
    SECTION("Input lengths are checked") {
        REQUIRE(ChainStep::DeriveRootKey(std::vector<uint8_t>(31, 0), dh_output).IsErr());
        REQUIRE(ChainStep::DeriveRootKey(root_key, std::vector<uint8_t>(33, 0)).IsErr());
    }
}
