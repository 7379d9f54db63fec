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
 * @brief Anonymous encryption to a recipient public key
 *
 * Sealed Message layout:
 *
 *   [32-byte ephemeral public key][24-byte nonce][ciphertext][16-byte tag]
 *
 * A fresh ephemeral key pair is generated per call and discarded before
 * Seal returns. The nonce is BLAKE2b-192(ephemeral_public || recipient_public),
 * which binds the message to its intended recipient; Unseal recomputes and
 * checks it.
 */
class SealCodec {
public:
    using ProtocolConfig = configuration::ProtocolConfig;

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Seal(
        std::span<const uint8_t> message,
        const models::PublicKey& recipient_public,
        const ProtocolConfig& config = ProtocolConfig::Default());

    /**
     * Truncated input, a nonce that does not match the recipient and any tag
     * mismatch fail with Authentication. An embedded ephemeral key that is
     * not a usable curve point fails with DegenerateKey.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Unseal(
        std::span<const uint8_t> sealed,
        const models::SecretKey& recipient_secret,
        const ProtocolConfig& config = ProtocolConfig::Default());

private:
    SealCodec() = delete;
};

} // namespace dhole::protocol
