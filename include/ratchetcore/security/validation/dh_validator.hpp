#pragma once

#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include "ratchetcore/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace ratchetcore::protocol::security {

/**
 * @brief Structural checks on peer-supplied X25519 public keys
 *
 * Applied to every ratchet key taken off the wire and to every key in a
 * pre-key bundle before it reaches crypto_scalarmult. Bit 255 is ignored, as
 * in X25519 itself.
 */
class DhValidator {
public:
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateX25519PublicKey(
        std::span<const uint8_t> public_key);

    [[nodiscard]] static bool HasSmallOrder(std::span<const uint8_t> public_key);

    /**
     * @brief True when the key (bit 255 cleared) is below 2^255 - 19
     */
    [[nodiscard]] static bool IsCanonicalFieldElement(std::span<const uint8_t> public_key);

private:
    static constexpr size_t KEY_SIZE = Constants::X_25519_PUBLIC_KEY_SIZE;
    using Point = std::array<uint8_t, KEY_SIZE>;

    // u-coordinates of order 1, 2, 4 and 8 plus the non-reduced aliases p-1, p, p+1
    static constexpr std::array<Point, 7> SMALL_ORDER_POINTS = {{
        {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae, 0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd, 0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24, 0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86, 0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        {0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    }};

    static constexpr uint8_t TOP_BIT_MASK = 0x7F;

    [[nodiscard]] static Point ClearTopBit(std::span<const uint8_t> public_key);

    [[nodiscard]] static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);
};

}
