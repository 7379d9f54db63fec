#include "dhole/crypto/sodium_secure_memory_handle.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"

#include <cstring>
#include <format>
#include <string>

namespace dhole::protocol::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(const size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    if (size > SodiumInterop::MAX_BUFFER_SIZE) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Secure allocation of {} bytes exceeds maximum {}",
                            size, SodiumInterop::MAX_BUFFER_SIZE)));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                std::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

SodiumFailure SecureMemoryHandle::DisposedFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(DisposedFailure());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("{} (data: {}, buffer: {})",
                            ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    auto* bytes = static_cast<uint8_t*>(ptr_);
    if (!data.empty()) {
        std::memcpy(bytes, data.data(), data.size());
    }
    if (data.size() < size_) {
        sodium_memzero(bytes + data.size(), size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(DisposedFailure());
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("Output buffer too small (requested: {}, provided: {})",
                            size_, output.size())));
    }
    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(DisposedFailure());
    }
    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("{}{} of {} bytes", ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, size, size_)));
    }
    std::vector<uint8_t> result(static_cast<const uint8_t*>(ptr_),
                                static_cast<const uint8_t*>(ptr_) + size);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

} // namespace dhole::protocol::crypto
