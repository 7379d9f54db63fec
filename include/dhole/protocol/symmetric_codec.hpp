#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/configuration/protocol_config.hpp"
#include "dhole/models/keys/symmetric_key.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol {

/**
 * @brief Encrypted Message framing and MACs under an explicit SymmetricKey
 *
 * Encrypted Message layout:
 *
 *   [0x01][24-byte nonce][ciphertext][16-byte tag]
 *
 * The version byte is always authenticated: the AEAD associated data is
 * version || associated_data.
 */
class SymmetricCodec {
public:
    using ProtocolConfig = configuration::ProtocolConfig;

    /// Fresh random nonce per call; oversized plaintext fails with InvalidInput
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> message,
        const models::SymmetricKey& key,
        std::span<const uint8_t> associated_data = {},
        const ProtocolConfig& config = ProtocolConfig::Default());

    /**
     * @brief Open an Encrypted Message
     *
     * Empty input, truncated input and any tag mismatch all fail with the
     * same Authentication failure. A version byte other than 0x01 fails with
     * UnsupportedVersion before any cryptographic work.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> encrypted,
        const models::SymmetricKey& key,
        std::span<const uint8_t> associated_data = {},
        const ProtocolConfig& config = ProtocolConfig::Default());

    /// Structural checks shared with ChannelCodec; no key material involved
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateFraming(
        std::span<const uint8_t> encrypted,
        const ProtocolConfig& config = ProtocolConfig::Default());

    /**
     * @brief HMAC-SHA512-256 over @p message
     *
     * Keyed by HKDF(key, info = "Dhole-Auth-v1") so the AEAD key is never
     * used as a MAC key directly.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Authenticate(
        std::span<const uint8_t> message,
        const models::SymmetricKey& key,
        const ProtocolConfig& config = ProtocolConfig::Default());

    /// Ok(false) for a wrong-length or mismatching MAC; comparison is constant-time
    [[nodiscard]] static Result<bool, ProtocolFailure> VerifyMac(
        std::span<const uint8_t> message,
        const models::SymmetricKey& key,
        std::span<const uint8_t> mac,
        const ProtocolConfig& config = ProtocolConfig::Default());

private:
    SymmetricCodec() = delete;
};

} // namespace dhole::protocol
