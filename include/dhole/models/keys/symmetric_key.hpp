#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/core/constants.hpp"
#include "dhole/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace dhole::protocol::models {

/**
 * @brief 32-byte XChaCha20-Poly1305 key held in guarded memory
 *
 * Produced by KeyExchange::Derive, by Generate or from raw bytes.
 * Move-only; equality is available only as a constant-time comparison.
 */
class SymmetricKey {
public:
    static Result<SymmetricKey, ProtocolFailure> Generate();

    /// Fails with InvalidKeyLength unless @p bytes is exactly 32 bytes
    static Result<SymmetricKey, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);

    /**
     * @brief Allocate a key and let @p writer fill all 32 bytes in place
     *
     * @p writer receives std::span<uint8_t> and returns
     * Result<Unit, ProtocolFailure>; on failure the region is released and
     * zeroed without ever being exposed.
     */
    template<typename F>
    static Result<SymmetricKey, ProtocolFailure> CreateWith(F&& writer) {
        auto allocated = Allocate();
        if (allocated.IsErr()) {
            return std::move(allocated).template PropagateErr<SymmetricKey>();
        }
        auto handle = std::move(allocated).Unwrap();
        auto written = crypto::FlattenAccess(handle.WithWriteAccess(std::forward<F>(writer)));
        if (written.IsErr()) {
            return std::move(written).template PropagateErr<SymmetricKey>();
        }
        return Result<SymmetricKey, ProtocolFailure>::Ok(SymmetricKey(std::move(handle)));
    }

    SymmetricKey(SymmetricKey&&) noexcept = default;
    SymmetricKey& operator=(SymmetricKey&&) noexcept = default;
    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;

    /// Run @p func over the key bytes; same contract as SecretKey::WithSeed
    template<typename F>
    auto WithKey(F&& func) const -> std::invoke_result_t<F, std::span<const uint8_t>> {
        return crypto::FlattenAccess(key_.WithReadAccess(std::forward<F>(func)));
    }

    [[nodiscard]] bool ConstantTimeEquals(const SymmetricKey& other) const;

    /// Copy of the raw key for fixtures and interop checks
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ExportBytes() const;

private:
    explicit SymmetricKey(crypto::SecureMemoryHandle key) noexcept
        : key_(std::move(key)) {}

    static Result<crypto::SecureMemoryHandle, ProtocolFailure> Allocate();

    crypto::SecureMemoryHandle key_;
};

} // namespace dhole::protocol::models
