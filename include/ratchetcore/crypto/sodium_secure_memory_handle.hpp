#pragma once

#include "ratchetcore/core/result.hpp"
#include "ratchetcore/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

namespace ratchetcore::protocol::crypto {

/**
 * @brief Move-only owner of a secret held in sodium_malloc memory
 *
 * The region is guarded, locked in RAM and zeroed by sodium_free on release.
 * A default-constructed or moved-from handle is empty and refuses access.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates exactly data.size() bytes and copies data in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept = default;
    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;
    ~SecureMemoryHandle() = default;

    /// Overwrites the front of the region; bytes past data.size() are zeroed.
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Copies out the first count bytes. The caller wipes the copy.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t count) const;

    [[nodiscard]] Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    /// Runs func over the secret in place.
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using R = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<R, SodiumFailure>::Err(EmptyHandleFailure());
        }
        return Result<R, SodiumFailure>::Ok(std::forward<F>(func)(View()));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return region_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    struct SodiumFree {
        void operator()(uint8_t* region) const noexcept;
    };

    SecureMemoryHandle(uint8_t* region, size_t size) noexcept
        : region_(region), size_(size) {}

    [[nodiscard]] std::span<const uint8_t> View() const noexcept {
        return {region_.get(), size_};
    }

    static SodiumFailure EmptyHandleFailure();

    std::unique_ptr<uint8_t, SodiumFree> region_;
    size_t size_ = 0;
};

}
