#include "ratchetcore/models/protocol_address.hpp"
#include "ratchetcore/core/format.hpp"
#include <charconv>

namespace ratchetcore::protocol::models {

    std::string ProtocolAddress::ToString() const {
        return compat::format("{}.{}", name_, device_id_);
    }

    Result<ProtocolAddress, ProtocolFailure> ProtocolAddress::Parse(std::string_view text) {
        const auto separator = text.rfind('.');
        if (separator == std::string_view::npos || separator == 0 || separator + 1 == text.size()) {
            return Result<ProtocolAddress, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Invalid protocol address '{}': expected name.device_id", text)));
        }
        const std::string_view device_part = text.substr(separator + 1);
        uint32_t device_id = 0;
        const auto [end, ec] = std::from_chars(device_part.data(), device_part.data() + device_part.size(), device_id);
        if (ec != std::errc() || end != device_part.data() + device_part.size()) {
            return Result<ProtocolAddress, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Invalid device id in protocol address '{}'", text)));
        }
        return Result<ProtocolAddress, ProtocolFailure>::Ok(
            ProtocolAddress(std::string(text.substr(0, separator)), device_id));
    }
}
