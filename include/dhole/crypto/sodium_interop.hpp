#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <span>
#include <vector>

namespace dhole::protocol::crypto {

/**
 * @brief Thin layer over libsodium's process-wide services
 *
 * Owns the one-time library initialization, secure wiping, constant-time
 * comparison, the randomness source, BLAKE2b hashing and guarded
 * allocation. Every higher-level operation goes through here instead of
 * calling libsodium's global functions directly.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every public protocol operation calls this
     * before touching any primitive.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     *
     * Buffers up to Constants::SMALL_BUFFER_THRESHOLD are cleared through a
     * volatile pointer, larger ones through sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a caller-owned buffer from the secure randomness source
     *
     * Fails with RandomnessFailure when libsodium cannot be initialized; the
     * caller must not retry with a weaker source.
     */
    static Result<Unit, ProtocolFailure> FillRandom(std::span<uint8_t> output);

    static Result<std::vector<uint8_t>, ProtocolFailure> GetRandomBytes(size_t size);

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief Unkeyed BLAKE2b over the concatenation of @p parts
     *
     * The digest length is output.size(), which must lie within
     * [crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX].
     */
    static Result<Unit, ProtocolFailure> GenericHash(
        std::span<uint8_t> output,
        std::initializer_list<std::span<const uint8_t>> parts);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief sodium_malloc: guard pages, mlock, canary, zeroed on free
     *
     * @return nullptr when libsodium is not initialized or allocation fails
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;
    static void WipeLargeBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace dhole::protocol::crypto
