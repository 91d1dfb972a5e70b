#pragma once
#include "ratchetcore/models/keys/identity_key_pair.hpp"
#include <string>
#include <string_view>

namespace ratchetcore::protocol::identity {

/**
 * @brief Numeric safety number for a pair of identity keys
 *
 * The (label, key) pairs are ordered by label, with the key bytes breaking
 * ties, so both parties compute the same string:
 * ```
 * h = SHA-256(label1 || key1 || label2 || key2)
 * repeat 5199 times: h = SHA-256(h || key1 || key2)
 * ```
 * The result is 12 space-separated groups of 5 decimal digits. Group i is
 * the big-endian value of h[5i mod 30 .. +5] (indices mod 32) mod 100000.
 */
class FingerprintCalculator {
public:
    [[nodiscard]] static std::string Calculate(
        const models::IdentityPublicKey& local_identity,
        std::string_view local_label,
        const models::IdentityPublicKey& remote_identity,
        std::string_view remote_label);
private:
    FingerprintCalculator() = delete;
};
}
