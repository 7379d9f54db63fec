#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/configuration/protocol_config.hpp"
#include "dhole/models/keys/public_key.hpp"
#include "dhole/models/keys/secret_key.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol {

/**
 * @brief Authenticated encryption between two identified parties
 *
 * The sender derives the Outbound key for (sender, recipient), the
 * recipient derives the Inbound key for (recipient, sender); both land on
 * the same SymmetricKey. The output is an Encrypted Message as produced by
 * SymmetricCodec with no caller associated data.
 */
class ChannelCodec {
public:
    using ProtocolConfig = configuration::ProtocolConfig;

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> message,
        const models::SecretKey& sender_secret,
        const models::PublicKey& recipient_public,
        const ProtocolConfig& config = ProtocolConfig::Default());

    /**
     * Framing is checked before any key derivation: empty or truncated
     * input fails with Authentication, a foreign version byte with
     * UnsupportedVersion.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> encrypted,
        const models::SecretKey& recipient_secret,
        const models::PublicKey& sender_public,
        const ProtocolConfig& config = ProtocolConfig::Default());

private:
    ChannelCodec() = delete;
};

} // namespace dhole::protocol
