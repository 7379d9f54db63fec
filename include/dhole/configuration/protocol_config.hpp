#pragma once

#include "dhole/core/constants.hpp"

#include <cstddef>
#include <cstdint>

namespace dhole::protocol::configuration {

/// Size limits applied by every codec before any cryptographic work
///
/// The limits bound the plaintext a caller may protect and, derived from it,
/// the framed input a codec will accept for decryption. Oversized input is
/// rejected with ProtocolFailureType::InvalidInput.
///
/// @example
/// ```cpp
/// // Server accepting user uploads: default 10 MiB ceiling
/// auto config = ProtocolConfig::Default();
///
/// // Embedded peer with small buffers
/// auto config = ProtocolConfig::Constrained();
///
/// // Custom ceiling
/// auto config = ProtocolConfig::Default().WithMaxMessageBytes(1 << 20);
/// ```
class ProtocolConfig {
public:
    static constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 10 * 1024 * 1024;
    static constexpr size_t CONSTRAINED_MAX_MESSAGE_BYTES = 64 * 1024;
    static constexpr size_t UNBOUNDED_MAX_MESSAGE_BYTES = 1'000'000'000;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// 10 MiB plaintext ceiling
    [[nodiscard]] static constexpr ProtocolConfig Default() noexcept {
        return ProtocolConfig(DEFAULT_MAX_MESSAGE_BYTES);
    }

    /// 64 KiB plaintext ceiling for memory-constrained peers
    [[nodiscard]] static constexpr ProtocolConfig Constrained() noexcept {
        return ProtocolConfig(CONSTRAINED_MAX_MESSAGE_BYTES);
    }

    /// Largest buffer the secure-memory layer will handle (1 GB)
    [[nodiscard]] static constexpr ProtocolConfig Unbounded() noexcept {
        return ProtocolConfig(UNBOUNDED_MAX_MESSAGE_BYTES);
    }

    /// Copy with a custom plaintext ceiling, clamped to the unbounded limit
    [[nodiscard]] constexpr ProtocolConfig WithMaxMessageBytes(const size_t max_bytes) const noexcept {
        return ProtocolConfig(max_bytes > UNBOUNDED_MAX_MESSAGE_BYTES
                                  ? UNBOUNDED_MAX_MESSAGE_BYTES
                                  : max_bytes);
    }

    // =========================================================================
    // Limit Queries
    // =========================================================================

    [[nodiscard]] constexpr size_t MaxMessageBytes() const noexcept {
        return max_message_bytes_;
    }

    /// Largest Encrypted Message (version || nonce || ciphertext || tag)
    [[nodiscard]] constexpr size_t MaxEncryptedBytes() const noexcept {
        return max_message_bytes_ + WireFormat::ENCRYPTED_OVERHEAD;
    }

    /// Largest Sealed Message (ephemeral key || nonce || ciphertext || tag)
    [[nodiscard]] constexpr size_t MaxSealedBytes() const noexcept {
        return max_message_bytes_ + WireFormat::SEALED_OVERHEAD;
    }

    [[nodiscard]] constexpr bool AllowsMessage(const size_t message_bytes) const noexcept {
        return message_bytes <= max_message_bytes_;
    }

    // =========================================================================
    // Comparison Operators
    // =========================================================================

    [[nodiscard]] constexpr bool operator==(const ProtocolConfig& other) const noexcept {
        return max_message_bytes_ == other.max_message_bytes_;
    }

    [[nodiscard]] constexpr bool operator!=(const ProtocolConfig& other) const noexcept {
        return max_message_bytes_ != other.max_message_bytes_;
    }

private:
    explicit constexpr ProtocolConfig(const size_t max_message_bytes) noexcept
        : max_message_bytes_(max_message_bytes) {}

    size_t max_message_bytes_;
};

} // namespace dhole::protocol::configuration
