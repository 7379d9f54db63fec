#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace dhole::protocol::crypto {

/**
 * @brief Move-only owner of a sodium_malloc region
 *
 * The region sits between guard pages, is locked in RAM and is zeroed by
 * sodium_free when the handle is destroyed or reassigned. Secret keys,
 * symmetric keys and ephemeral scalars all live in one of these.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32);
 * if (handle.IsOk()) {
 *     auto seed = std::move(handle).Unwrap();
 *     seed.WithWriteAccess([](std::span<uint8_t> bytes) { ... });
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    /// Fails when libsodium is not initialized, size is zero or allocation fails
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /// Copies @p data in; any unused tail of the region is zeroed
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// @p output must hold at least Size() bytes
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Run @p func over a read-only view of the region
     *
     * The view must not escape the callback. @p func must return a value;
     * use Unit for side-effect-only callbacks.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        static_assert(!std::is_void_v<T>, "WithReadAccess callback must return a value");

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        static_assert(!std::is_void_v<T>, "WithWriteAccess callback must return a value");

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_)));
    }

    /// True for a default-constructed or moved-from handle
    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    static SodiumFailure DisposedFailure();
    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

/**
 * @brief Collapses the nested result of a With*Access callback that itself
 * returns Result<T, ProtocolFailure>
 *
 * A disposed handle surfaces through ProtocolFailure::FromSodiumFailure.
 */
template<typename T>
Result<T, ProtocolFailure> FlattenAccess(Result<Result<T, ProtocolFailure>, SodiumFailure>&& access) {
    if (access.IsErr()) {
        return Result<T, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(access.UnwrapErr()));
    }
    return std::move(access).Unwrap();
}

} // namespace dhole::protocol::crypto
