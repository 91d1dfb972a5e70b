#include "ratchetcore/security/validation/dh_validator.hpp"
#include "ratchetcore/core/format.hpp"

#include <algorithm>

namespace ratchetcore::protocol::security {

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey(
                compat::format(
                    "Invalid X25519 public key size: expected {}, got {}",
                    KEY_SIZE,
                    public_key.size())
            ));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey(
                "X25519 public key is a small-order point"
            ));
    }

    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey(
                "X25519 public key is not a canonical Curve25519 field element"
            ));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

DhValidator::Point DhValidator::ClearTopBit(std::span<const uint8_t> public_key) {
    Point point{};
    std::copy_n(public_key.begin(), KEY_SIZE, point.begin());
    point[KEY_SIZE - 1] &= TOP_BIT_MASK;
    return point;
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    if (public_key.size() != KEY_SIZE) {
        return false;
    }
    const Point candidate = ClearTopBit(public_key);
    bool found = false;
    for (const auto& small_order_point : SMALL_ORDER_POINTS) {
        found |= ConstantTimeEquals(candidate, small_order_point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    if (public_key.size() != KEY_SIZE) {
        return false;
    }
    // p = 2^255 - 19 little-endian: ed ff .. ff 7f
    const Point value = ClearTopBit(public_key);
    if (value[KEY_SIZE - 1] != TOP_BIT_MASK) {
        return true;
    }
    for (size_t i = KEY_SIZE - 2; i >= 1; --i) {
        if (value[i] != 0xFF) {
            return true;
        }
    }
    return value[0] < 0xED;
}

bool DhValidator::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return false;
    }

    uint8_t diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= a[i] ^ b[i];
    }
    return diff == 0;
}

}
