#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/core/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol::models {

/// Detached 64-byte Ed25519 signature
class Signature {
public:
    using Bytes = std::array<uint8_t, Constants::SIGNATURE_SIZE>;

    explicit Signature(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /// Fails with SignatureLength unless @p bytes is exactly 64 bytes
    static Result<Signature, ProtocolFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::vector<uint8_t> ToVector() const {
        return {bytes_.begin(), bytes_.end()};
    }

    [[nodiscard]] bool operator==(const Signature& other) const noexcept {
        return bytes_ == other.bytes_;
    }

    [[nodiscard]] bool operator!=(const Signature& other) const noexcept {
        return bytes_ != other.bytes_;
    }

private:
    Bytes bytes_;
};

} // namespace dhole::protocol::models
