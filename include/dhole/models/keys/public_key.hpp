#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol::models {

/**
 * @brief 32-byte compressed Edwards25519 point
 *
 * Plain copyable value. Construction only checks the length; whether the
 * point is usable for key agreement is decided by KeyExchange.
 */
class PublicKey {
public:
    using Bytes = std::array<uint8_t, Constants::PUBLIC_KEY_SIZE>;

    explicit PublicKey(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /// Fails with InvalidKeyLength unless @p bytes is exactly 32 bytes
    static Result<PublicKey, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::vector<uint8_t> ToVector() const {
        return {bytes_.begin(), bytes_.end()};
    }

    [[nodiscard]] bool operator==(const PublicKey& other) const noexcept {
        return bytes_ == other.bytes_;
    }

    [[nodiscard]] bool operator!=(const PublicKey& other) const noexcept {
        return bytes_ != other.bytes_;
    }

    /// Lexicographic byte order
    [[nodiscard]] bool operator<(const PublicKey& other) const noexcept {
        return bytes_ < other.bytes_;
    }

private:
    Bytes bytes_;
};

} // namespace dhole::protocol::models
