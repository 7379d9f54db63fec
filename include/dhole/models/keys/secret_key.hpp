#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/crypto/sodium_secure_memory_handle.hpp"
#include "dhole/models/keys/public_key.hpp"

#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace dhole::protocol::models {

/**
 * @brief 32-byte Ed25519 seed held in guarded memory
 *
 * The same seed drives signing and, through its Montgomery form, key
 * agreement. The matching PublicKey is computed once when the key is
 * created. The seed never leaves guarded memory except inside a WithSeed
 * callback, and no protocol output contains it.
 */
class SecretKey {
public:
    /// Fresh seed from the secure randomness source
    static Result<SecretKey, ProtocolFailure> Generate();

    /// Fails with InvalidKeyLength unless @p bytes is exactly 32 bytes
    static Result<SecretKey, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);

    SecretKey(SecretKey&&) noexcept = default;
    SecretKey& operator=(SecretKey&&) noexcept = default;
    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }

    /**
     * @brief Run @p func over the seed bytes
     *
     * @p func receives std::span<const uint8_t> and returns
     * Result<T, ProtocolFailure>. The span is valid only for the duration of
     * the call.
     */
    template<typename F>
    auto WithSeed(F&& func) const -> std::invoke_result_t<F, std::span<const uint8_t>> {
        return crypto::FlattenAccess(seed_.WithReadAccess(std::forward<F>(func)));
    }

private:
    SecretKey(crypto::SecureMemoryHandle seed, const PublicKey& public_key) noexcept
        : seed_(std::move(seed))
        , public_key_(public_key) {}

    static Result<SecretKey, ProtocolFailure> FromSeedHandle(crypto::SecureMemoryHandle seed);

    crypto::SecureMemoryHandle seed_;
    PublicKey public_key_;
};

} // namespace dhole::protocol::models
