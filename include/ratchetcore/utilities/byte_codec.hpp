#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
namespace ratchetcore::protocol::utilities {

/**
 * Big-endian writer used by the fixed wire layouts (headers, bundles,
 * initial messages, key records).
 */
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buffer_.reserve(reserve); }

    void WriteU8(const uint8_t value) {
        buffer_.push_back(value);
    }
    void WriteU32(const uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }
    void WriteI64(const int64_t value) {
        const auto raw = static_cast<uint64_t>(value);
        for (int shift = 56; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<uint8_t>((raw >> shift) & 0xFF));
        }
    }
    void WriteBytes(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    [[nodiscard]] std::vector<uint8_t> Take() && {
        return std::move(buffer_);
    }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * Bounds-checked big-endian reader. Every Read* returns false and leaves the
 * cursor unchanged when fewer bytes remain than requested.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool ReadU8(uint8_t& out) noexcept {
        if (Remaining() < 1) {
            return false;
        }
        out = data_[offset_++];
        return true;
    }
    [[nodiscard]] bool ReadU32(uint32_t& out) noexcept {
        if (Remaining() < 4) {
            return false;
        }
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            value = (value << 8) | data_[offset_ + i];
        }
        offset_ += 4;
        out = value;
        return true;
    }
    [[nodiscard]] bool ReadI64(int64_t& out) noexcept {
        if (Remaining() < 8) {
            return false;
        }
        uint64_t value = 0;
        for (size_t i = 0; i < 8; ++i) {
            value = (value << 8) | data_[offset_ + i];
        }
        offset_ += 8;
        out = static_cast<int64_t>(value);
        return true;
    }
    [[nodiscard]] bool ReadBytes(const size_t count, std::span<const uint8_t>& out) noexcept {
        if (Remaining() < count) {
            return false;
        }
        out = data_.subspan(offset_, count);
        offset_ += count;
        return true;
    }

    [[nodiscard]] std::span<const uint8_t> Rest() const noexcept {
        return data_.subspan(offset_);
    }
    [[nodiscard]] size_t Remaining() const noexcept {
        return data_.size() - offset_;
    }
    [[nodiscard]] bool AtEnd() const noexcept {
        return offset_ == data_.size();
    }

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

}
