#pragma once

/**
 * @file key_logger.hpp
 * @brief Key-material trace for diffing derivations between two peers.
 *
 * Compiled in only with -DRATCHETCORE_DEBUG_KEYS=ON. The trace goes to stderr
 * and contains private keys, chain keys and message keys in hex, so it must
 * never be enabled in a shipped build. Without the option every call below
 * is an empty inline and the macros expand to nothing.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#ifdef RATCHETCORE_DEBUG_KEYS
#include <fmt/core.h>
#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>
#endif

namespace ratchetcore::debug {

enum class Side {
    Initiator,
    Responder,
    Engine
};

#ifdef RATCHETCORE_DEBUG_KEYS

namespace detail {
    inline std::string_view Label(const Side side) {
        switch (side) {
            case Side::Initiator: return "INITIATOR";
            case Side::Responder: return "RESPONDER";
            case Side::Engine: return "ENGINE";
        }
        return "?";
    }

    // Long buffers are cut at 64 bytes and annotated with their full length.
    inline std::string Hex(std::span<const uint8_t> data) {
        constexpr size_t kMaxBytes = 64;
        constexpr std::string_view kDigits = "0123456789abcdef";
        const auto shown = data.first(std::min(data.size(), kMaxBytes));
        std::string out;
        out.reserve(shown.size() * 2 + 24);
        for (const uint8_t byte : shown) {
            out.push_back(kDigits[byte >> 4]);
            out.push_back(kDigits[byte & 0x0F]);
        }
        if (shown.size() < data.size()) {
            out += fmt::format("...({} bytes)", data.size());
        }
        return out;
    }

    template<typename... Args>
    void Emit(const Side side, std::string_view operation, fmt::format_string<Args...> text, Args&&... args) {
        fmt::print(stderr, "[RC-DEBUG] {} {} {}\n", Label(side), operation,
            fmt::format(text, std::forward<Args>(args)...));
    }

    inline void Key(const Side side, std::string_view operation, std::string_view name,
                    std::span<const uint8_t> data) {
        Emit(side, operation, "{}: {}", name, Hex(data));
    }
}

#define RC_LOG_VALUE(side, operation, name, value) \
    ::ratchetcore::debug::detail::Emit((side), (operation), "{}: {}", (name), (value))

#define RC_LOG_MSG(side, operation, message) \
    ::ratchetcore::debug::detail::Emit((side), (operation), "{}", std::string(message))

inline void LogIdentityCreated(const Side side, std::span<const uint8_t> ed25519_public,
                               std::span<const uint8_t> x25519_public, const uint32_t registration_id) {
    detail::Key(side, "IDENTITY", "ed25519_public", ed25519_public);
    detail::Key(side, "IDENTITY", "x25519_public", x25519_public);
    RC_LOG_VALUE(side, "IDENTITY", "registration_id", registration_id);
}

inline void LogPreKey(const Side side, const uint32_t id, std::span<const uint8_t> public_key) {
    detail::Emit(side, "PREKEY", "opk[{}] {}", id, detail::Hex(public_key));
}

inline void LogSignedPreKey(const Side side, const uint32_t id, std::span<const uint8_t> public_key,
                            std::span<const uint8_t> signature) {
    detail::Emit(side, "PREKEY", "spk[{}] {} sig {}", id, detail::Hex(public_key), detail::Hex(signature));
}

inline void LogX3DHStart(const Side side, const std::optional<uint32_t> used_opk_id) {
    if (used_opk_id.has_value()) {
        detail::Emit(side, "X3DH", "begin with opk {}", *used_opk_id);
    } else {
        detail::Emit(side, "X3DH", "begin without opk");
    }
}

inline void LogX3DHDH(const Side side, const int dh_number, std::span<const uint8_t> result) {
    detail::Emit(side, "X3DH", "dh{}: {}", dh_number, detail::Hex(result));
}

inline void LogX3DHSharedSecret(const Side side, std::span<const uint8_t> shared_secret) {
    detail::Key(side, "X3DH", "shared_secret", shared_secret);
}

inline void LogChainKeyDerivation(const Side side, const char* chain_type, const uint32_t index,
                                  std::span<const uint8_t> chain_key, std::span<const uint8_t> message_key) {
    detail::Emit(side, "CHAIN", "{}[{}] ck {} mk {}", chain_type, index,
        detail::Hex(chain_key), detail::Hex(message_key));
}

inline void LogDHRatchet(const Side side, const bool is_sending, std::span<const uint8_t> root_key_after,
                         std::span<const uint8_t> new_chain_key, std::span<const uint8_t> dh_public,
                         std::span<const uint8_t> peer_dh_public) {
    const std::string_view direction = is_sending ? "RATCHET-SEND" : "RATCHET-RECV";
    detail::Key(side, direction, "root_key", root_key_after);
    detail::Key(side, direction, "chain_key", new_chain_key);
    detail::Key(side, direction, "our_public", dh_public);
    detail::Key(side, direction, "peer_public", peer_dh_public);
}

inline void LogSkippedKeys(const Side side, const uint32_t from_counter, const uint32_t until_counter,
                           const size_t stored_total) {
    detail::Emit(side, "SKIP", "[{}, {}) stored {}", from_counter, until_counter, stored_total);
}

inline void LogSkippedKeysEvicted(const Side side, const char* reason, const size_t count) {
    detail::Emit(side, "EVICT", "{} ({})", reason, count);
}

inline void LogEncryption(const Side side, const uint32_t message_index, std::span<const uint8_t> cipher_key,
                          std::span<const uint8_t> nonce, std::span<const uint8_t> dh_public) {
    detail::Emit(side, "ENCRYPT", "#{} key {} nonce {} ratchet {}", message_index,
        detail::Hex(cipher_key), detail::Hex(nonce), detail::Hex(dh_public));
}

inline void LogDecryption(const Side side, const uint32_t message_index, std::span<const uint8_t> received_dh_public,
                          const bool triggered_ratchet, const bool used_skipped_key) {
    detail::Emit(side, "DECRYPT", "#{} ratchet {} stepped={} skipped={}", message_index,
        detail::Hex(received_dh_public), triggered_ratchet, used_skipped_key);
}

inline void LogRejected(const Side side, const char* operation, std::string_view reason) {
    detail::Emit(side, operation, "rejected: {}", reason);
}

#else

#define RC_LOG_VALUE(side, operation, name, value) ((void)0)
#define RC_LOG_MSG(side, operation, message) ((void)0)

inline void LogIdentityCreated(Side, std::span<const uint8_t>, std::span<const uint8_t>, uint32_t) {}
inline void LogPreKey(Side, uint32_t, std::span<const uint8_t>) {}
inline void LogSignedPreKey(Side, uint32_t, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogX3DHStart(Side, std::optional<uint32_t>) {}
inline void LogX3DHDH(Side, int, std::span<const uint8_t>) {}
inline void LogX3DHSharedSecret(Side, std::span<const uint8_t>) {}
inline void LogChainKeyDerivation(Side, const char*, uint32_t, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogDHRatchet(Side, bool, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSkippedKeys(Side, uint32_t, uint32_t, size_t) {}
inline void LogSkippedKeysEvicted(Side, const char*, size_t) {}
inline void LogEncryption(Side, uint32_t, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}
inline void LogDecryption(Side, uint32_t, std::span<const uint8_t>, bool, bool) {}
inline void LogRejected(Side, const char*, std::string_view) {}

#endif

}
