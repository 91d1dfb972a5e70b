#include "ratchetcore/identity/fingerprint_calculator.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/protocol/constants.hpp"
#include "ratchetcore/core/format.hpp"
#include <algorithm>

namespace ratchetcore::protocol::identity {
    using crypto::SodiumInterop;

    namespace {
        std::span<const uint8_t> LabelBytes(std::string_view label) {
            return {reinterpret_cast<const uint8_t*>(label.data()), label.size()};
        }

        bool LocalComesFirst(
            std::string_view local_label,
            std::span<const uint8_t> local_key,
            std::string_view remote_label,
            std::span<const uint8_t> remote_key) {
            if (local_label != remote_label) {
                return local_label < remote_label;
            }
            return std::lexicographical_compare(
                local_key.begin(), local_key.end(), remote_key.begin(), remote_key.end());
        }
    }

    std::string FingerprintCalculator::Calculate(
        const models::IdentityPublicKey& local_identity,
        std::string_view local_label,
        const models::IdentityPublicKey& remote_identity,
        std::string_view remote_label) {
        auto first_key = local_identity.AsSpan();
        auto second_key = remote_identity.AsSpan();
        auto first_label = local_label;
        auto second_label = remote_label;
        if (!LocalComesFirst(local_label, first_key, remote_label, second_key)) {
            std::swap(first_key, second_key);
            std::swap(first_label, second_label);
        }

        auto hash = SodiumInterop::Sha256({
            LabelBytes(first_label), first_key, LabelBytes(second_label), second_key});
        for (uint32_t round = 0; round < kFingerprintIterations; ++round) {
            hash = SodiumInterop::Sha256({hash, first_key, second_key});
        }

        std::string fingerprint;
        fingerprint.reserve(kFingerprintGroups * (kFingerprintGroupBytes + 1));
        for (size_t group = 0; group < kFingerprintGroups; ++group) {
            const size_t offset = (group * kFingerprintGroupBytes) % kFingerprintOffsetModulus;
            uint64_t value = 0;
            for (size_t i = 0; i < kFingerprintGroupBytes; ++i) {
                value = (value << 8) | hash[(offset + i) % hash.size()];
            }
            if (group > 0) {
                fingerprint.push_back(' ');
            }
            fingerprint += compat::format("{:05}", value % kFingerprintGroupModulus);
        }
        return fingerprint;
    }
}
