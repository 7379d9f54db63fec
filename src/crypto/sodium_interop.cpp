#include "dhole/crypto/sodium_interop.hpp"

#include <format>
#include <string>

namespace dhole::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        WipeSmallBuffer(buffer);
    } else {
        WipeLargeBuffer(buffer);
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* bytes = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        bytes[i] = 0;
    }
}

void SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) noexcept {
    sodium_memzero(buffer.data(), buffer.size());
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::format("{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                            ErrorMessages::NOT_INITIALIZED)));
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, ProtocolFailure> SodiumInterop::FillRandom(std::span<uint8_t> output) {
    if (auto init = Initialize(); init.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::RandomnessFailure(
                std::format("{}: {}", ErrorMessages::RANDOMNESS_UNAVAILABLE, init.UnwrapErr().message)));
    }
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::GetRandomBytes(const size_t size) {
    if (size > MAX_BUFFER_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Requested {} random bytes, maximum is {}", size, MAX_BUFFER_SIZE)));
    }
    std::vector<uint8_t> buffer(size);
    if (auto fill = FillRandom(buffer); fill.IsErr()) {
        return std::move(fill).PropagateErr<std::vector<uint8_t>>();
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(buffer));
}

// ============================================================================
// Hashing
// ============================================================================

Result<Unit, ProtocolFailure> SodiumInterop::GenericHash(
    std::span<uint8_t> output,
    const std::initializer_list<std::span<const uint8_t>> parts) {
    if (auto init = Initialize(); init.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    if (output.size() < crypto_generichash_BYTES_MIN || output.size() > crypto_generichash_BYTES_MAX) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("BLAKE2b digest length {} outside [{}, {}]",
                            output.size(), crypto_generichash_BYTES_MIN, crypto_generichash_BYTES_MAX)));
    }

    crypto_generichash_state state;
    if (crypto_generichash_init(&state, nullptr, 0, output.size()) != SodiumConstants::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Generic("BLAKE2b initialization failed"));
    }
    for (const auto part : parts) {
        if (crypto_generichash_update(&state, part.data(), part.size()) != SodiumConstants::SUCCESS) {
            sodium_memzero(&state, sizeof(state));
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Generic("BLAKE2b update failed"));
        }
    }
    const int rc = crypto_generichash_final(&state, output.data(), output.size());
    sodium_memzero(&state, sizeof(state));
    if (rc != SodiumConstants::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Generic("BLAKE2b finalization failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace dhole::protocol::crypto
