#pragma once
#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
namespace ratchetcore::protocol::models {

/**
 * Remote endpoint a session belongs to. Its string form `name.device_id` is
 * the key under which the session blob is stored.
 */
class ProtocolAddress {
public:
    ProtocolAddress(std::string name, uint32_t device_id)
        : name_(std::move(name)), device_id_(device_id) {}

    /// Splits at the last '.', so names may themselves contain dots.
    [[nodiscard]] static Result<ProtocolAddress, ProtocolFailure> Parse(std::string_view text);

    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }
    [[nodiscard]] uint32_t GetDeviceId() const noexcept { return device_id_; }
    [[nodiscard]] std::string ToString() const;

    auto operator<=>(const ProtocolAddress&) const = default;
    bool operator==(const ProtocolAddress&) const = default;

private:
    std::string name_;
    uint32_t device_id_;
};
}
