#include "ratchetcore/crypto/sodium_secure_memory_handle.hpp"
#include "ratchetcore/crypto/sodium_interop.hpp"
#include "ratchetcore/core/constants.hpp"
#include "ratchetcore/core/format.hpp"

#include <algorithm>
#include <utility>

namespace ratchetcore::protocol::crypto {

void SecureMemoryHandle::SodiumFree::operator()(uint8_t* region) const noexcept {
    SodiumInterop::FreeSecure(region);
}

SodiumFailure SecureMemoryHandle::EmptyHandleFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    using R = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return R::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return R::Err(SodiumFailure::AllocationFailed("Secure memory size must be non-zero"));
    }
    auto* region = static_cast<uint8_t*>(SodiumInterop::AllocateSecure(size));
    if (region == nullptr) {
        return R::Err(SodiumFailure::AllocationFailed(
            compat::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return R::Ok(SecureMemoryHandle(region, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto allocated = Allocate(data.size());
    if (allocated.IsErr()) {
        return allocated;
    }
    auto handle = std::move(allocated).Unwrap();
    if (auto written = handle.Write(data); written.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(written).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : region_(std::move(other.region_)), size_(std::exchange(other.size_, 0)) {}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        region_ = std::move(other.region_);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(EmptyHandleFailure());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            compat::format("{} ({} > {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }
    std::copy(data.begin(), data.end(), region_.get());
    if (data.size() < size_) {
        sodium_memzero(region_.get() + data.size(), size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t count) const {
    using R = Result<std::vector<uint8_t>, SodiumFailure>;
    if (IsInvalid()) {
        return R::Err(EmptyHandleFailure());
    }
    if (count > size_) {
        return R::Err(SodiumFailure::ReadOperationFailed(
            compat::format("{}requested {} of {} bytes", ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, count, size_)));
    }
    const auto view = View().first(count);
    return R::Ok(std::vector<uint8_t>(view.begin(), view.end()));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Clone() const {
    if (IsInvalid()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(EmptyHandleFailure());
    }
    return FromBytes(View());
}

}
