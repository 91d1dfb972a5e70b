#pragma once
#include "ratchetcore/protocol/protocol_engine.hpp"
#include "ratchetcore/storage/in_memory_protocol_store.hpp"
#include "helpers/session_pair.hpp"
#include <memory>

namespace ratchetcore::protocol::test {

inline const models::ProtocolAddress kAliceAddress{"alice", 1};
inline const models::ProtocolAddress kBobAddress{"bob", 1};

inline std::unique_ptr<ProtocolEngine> MakeEngine(
    std::shared_ptr<interfaces::IProtocolStore> store = std::make_shared<storage::InMemoryProtocolStore>(),
    configuration::EngineConfig config = configuration::EngineConfig::Default()) {
    return std::move(ProtocolEngine::Create(std::move(store), config)).Unwrap();
}

/// Gives @p engine a signed pre-key (id 1) and @p pre_keys one-time pre-keys.
inline void Provision(ProtocolEngine& engine, uint32_t pre_keys = 5) {
    (void) engine.GenerateSignedPreKey(1).Unwrap();
    if (pre_keys > 0) {
        (void) engine.GeneratePreKeys(pre_keys).Unwrap();
    }
}

/// Alice opens a session to Bob with an initial message and Bob accepts it.
inline void Handshake(ProtocolEngine& alice, ProtocolEngine& bob, std::string_view greeting = "hello bob") {
    auto bundle = bob.CreatePreKeyBundle(1).Unwrap();
    auto initial = alice.EncryptInitial(kBobAddress, bundle, Bytes(greeting)).Unwrap();
    auto plaintext = bob.DecryptInitial(kAliceAddress, initial).Unwrap();
    (void) plaintext;
}

}
