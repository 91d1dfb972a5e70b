#include <catch2/catch_test_macros.hpp>
#include "ratchetcore/protocol/protocol_engine.hpp"
#include "ratchetcore/protocol/ratchet/ratchet_message.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "helpers/engine_pair.hpp"
#include "helpers/failing_protocol_store.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace ratchetcore::protocol;
using namespace ratchetcore::protocol::test;
using ratchetcore::protocol::crypto::SodiumInterop;
using ratchetcore::protocol::models::ProtocolAddress;

TEST_CASE("Concurrency - Racing initial messages", "[concurrency][engine][prekeys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Same initial message delivered on 8 threads is accepted once") {
        auto alice = MakeEngine();
        auto bob = MakeEngine();
        Provision(*bob);
        auto initial = alice->EncryptInitial(kBobAddress, bob->CreatePreKeyBundle(1).Unwrap(), Bytes("once"))
            .Unwrap();

        constexpr int THREAD_COUNT = 8;
        std::atomic<int> accepted{0};
        std::atomic<int> unknown_pre_key{0};
        std::atomic<int> other_failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto result = bob->DecryptInitial(kAliceAddress, initial);
                if (result.IsOk()) {
                    accepted.fetch_add(1);
                } else if (result.UnwrapErr().type == ProtocolFailureType::UnknownPreKey) {
                    unknown_pre_key.fetch_add(1);
                } else {
                    other_failures.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(accepted.load() == 1);
        REQUIRE(unknown_pre_key.load() == THREAD_COUNT - 1);
        REQUIRE(other_failures.load() == 0);
        REQUIRE(bob->PreKeyCount() == 4);
    }

    SECTION("Senders sharing one published pre-key") {
        auto bob = MakeEngine();
        Provision(*bob);
        const auto bundle = bob->CreatePreKeyBundle(1).Unwrap();

        constexpr int SENDER_COUNT = 12;
        std::vector<std::unique_ptr<ProtocolEngine>> senders;
        std::vector<std::vector<uint8_t>> initials;
        for (int i = 0; i < SENDER_COUNT; ++i) {
            senders.push_back(MakeEngine());
            initials.push_back(senders.back()->EncryptInitial(kBobAddress, bundle, Bytes("race")).Unwrap());
        }

        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;
        threads.reserve(SENDER_COUNT);
        for (int i = 0; i < SENDER_COUNT; ++i) {
            threads.emplace_back([&, i]() {
                const ProtocolAddress address{"sender" + std::to_string(i), 1};
                if (bob->DecryptInitial(address, initials[i]).IsOk()) {
                    accepted.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(accepted.load() == 1);
        REQUIRE(bob->PreKeyCount() == 4);
    }

    SECTION("Two identities claiming one name cannot both be trusted") {
        constexpr int ROUNDS = 10;
        for (int round = 0; round < ROUNDS; ++round) {
            auto bob = MakeEngine();
            Provision(*bob, 0);
            const auto bundle = bob->CreatePreKeyBundle(1).Unwrap();
            auto first = MakeEngine();
            auto second = MakeEngine();
            const ProtocolAddress first_address{"alice", 1};
            const ProtocolAddress second_address{"alice", 2};
            auto first_initial = first->EncryptInitial(kBobAddress, bundle, Bytes("first")).Unwrap();
            auto second_initial = second->EncryptInitial(kBobAddress, bundle, Bytes("second")).Unwrap();

            auto first_result = std::async(std::launch::async, [&]() {
                return bob->DecryptInitial(first_address, first_initial);
            });
            auto second_result = std::async(std::launch::async, [&]() {
                return bob->DecryptInitial(second_address, second_initial);
            });
            auto first_outcome = first_result.get();
            auto second_outcome = second_result.get();

            REQUIRE(first_outcome.IsOk() != second_outcome.IsOk());
            const auto& loser = first_outcome.IsOk() ? second_outcome : first_outcome;
            REQUIRE(loser.UnwrapErr().type == ProtocolFailureType::IdentityMismatch);

            const auto& winner = first_outcome.IsOk() ? *first : *second;
            const auto& loser_engine = first_outcome.IsOk() ? *second : *first;
            const auto& loser_address = first_outcome.IsOk() ? second_address : first_address;
            REQUIRE(bob->IsIdentityTrusted("alice", winner.GetIdentityPublicKey()));
            REQUIRE_FALSE(bob->IsIdentityTrusted("alice", loser_engine.GetIdentityPublicKey()));
            REQUIRE_FALSE(bob->HasSession(loser_address).Unwrap());
        }
    }

    SECTION("Pool readers are not blocked by an initial message being stored") {
        auto bob_store = std::make_shared<FailingProtocolStore>();
        auto bob = MakeEngine(bob_store);
        Provision(*bob);
        auto alice = MakeEngine();
        auto initial = alice->EncryptInitial(kBobAddress, bob->CreatePreKeyBundle(1).Unwrap(), Bytes("slow"))
            .Unwrap();

        std::promise<void> entered;
        auto entered_future = entered.get_future();
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        std::once_flag entered_once;
        bob_store->on_session_write = [&entered, &entered_once, released]() {
            std::call_once(entered_once, [&entered]() { entered.set_value(); });
            released.wait();
        };

        auto decrypting = std::async(std::launch::async, [&]() {
            return bob->DecryptInitial(kAliceAddress, initial);
        });
        entered_future.wait();

        auto reader = std::async(std::launch::async, [&]() {
            const size_t count = bob->PreKeyCount();
            auto bundle = bob->CreatePreKeyBundle(1);
            const bool offers_other_key = bundle.IsOk() && bundle.Unwrap().GetPreKey().has_value() &&
                                          bundle.Unwrap().GetPreKey()->id != 1;
            return std::make_pair(count, offers_other_key);
        });
        const bool reader_finished = reader.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
        release.set_value();

        REQUIRE(reader_finished);
        const auto [count_in_flight, offers_other_key] = reader.get();
        REQUIRE(count_in_flight == 5);
        REQUIRE(offers_other_key);
        REQUIRE(Text(decrypting.get().Unwrap()) == "slow");
        REQUIRE(bob->PreKeyCount() == 4);
    }
}

TEST_CASE("Concurrency - Parallel encryption", "[concurrency][engine]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("One session shared by 4 threads never reuses a counter") {
        auto alice = MakeEngine();
        auto bob = MakeEngine();
        Provision(*bob);
        Handshake(*alice, *bob);

        constexpr int THREAD_COUNT = 4;
        constexpr int MESSAGES_PER_THREAD = 25;
        std::mutex collected_mutex;
        std::vector<std::vector<uint8_t>> collected;
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                    auto message = alice->Encrypt(kBobAddress, Bytes("parallel"));
                    if (message.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    std::lock_guard<std::mutex> lock(collected_mutex);
                    collected.push_back(std::move(message).Unwrap());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(collected.size() == THREAD_COUNT * MESSAGES_PER_THREAD);
        std::set<uint32_t> counters;
        for (const auto& bytes : collected) {
            counters.insert(ratchet::RatchetMessage::Deserialize(bytes).Unwrap().header.message_counter);
        }
        REQUIRE(counters.size() == collected.size());
        for (const auto& bytes : collected) {
            REQUIRE(Text(bob->Decrypt(kAliceAddress, bytes).Unwrap()) == "parallel");
        }
    }

    SECTION("Independent peers progress in parallel") {
        auto bob = MakeEngine();
        Provision(*bob, 8);

        constexpr int PEER_COUNT = 6;
        constexpr int MESSAGES_PER_PEER = 20;
        std::vector<std::unique_ptr<ProtocolEngine>> peers;
        std::vector<ProtocolAddress> addresses;
        for (int i = 0; i < PEER_COUNT; ++i) {
            peers.push_back(MakeEngine());
            addresses.emplace_back("peer" + std::to_string(i), 1);
            auto initial = peers.back()->EncryptInitial(kBobAddress, bob->CreatePreKeyBundle(1).Unwrap(), Bytes("hi"))
                .Unwrap();
            REQUIRE(bob->DecryptInitial(addresses.back(), initial).IsOk());
        }

        std::vector<std::vector<std::vector<uint8_t>>> outboxes(PEER_COUNT);
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        threads.reserve(PEER_COUNT);
        for (int i = 0; i < PEER_COUNT; ++i) {
            threads.emplace_back([&, i]() {
                for (int m = 0; m < MESSAGES_PER_PEER; ++m) {
                    auto message = bob->Encrypt(addresses[i], Bytes(addresses[i].GetName()));
                    if (message.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    outboxes[i].push_back(std::move(message).Unwrap());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        for (int i = 0; i < PEER_COUNT; ++i) {
            REQUIRE(outboxes[i].size() == MESSAGES_PER_PEER);
            for (const auto& bytes : outboxes[i]) {
                REQUIRE(Text(peers[i]->Decrypt(kBobAddress, bytes).Unwrap()) == addresses[i].GetName());
            }
        }
    }

    SECTION("Pre-key generation from several threads hands out distinct ids") {
        auto bob = MakeEngine();
        constexpr int THREAD_COUNT = 4;
        constexpr uint32_t BATCH = 10;
        std::mutex ids_mutex;
        std::set<uint32_t> ids;
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto generated = bob->GeneratePreKeys(BATCH);
                if (generated.IsErr()) {
                    failures.fetch_add(1);
                    return;
                }
                std::lock_guard<std::mutex> lock(ids_mutex);
                for (const auto& pre_key : generated.Unwrap()) {
                    ids.insert(pre_key.id);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(ids.size() == THREAD_COUNT * BATCH);
        REQUIRE(*ids.begin() == 1);
        REQUIRE(*ids.rbegin() == THREAD_COUNT * BATCH);
        REQUIRE(bob->PreKeyCount() == THREAD_COUNT * BATCH);
    }
}
