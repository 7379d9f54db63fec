#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/models/keys/public_key.hpp"
#include "dhole/models/keys/secret_key.hpp"
#include "dhole/models/signature.hpp"

#include <cstdint>
#include <span>

namespace dhole::protocol {

/**
 * @brief Detached Ed25519 signatures over a domain-separated prehash
 *
 * The signed payload is "Dhole-Signature-v1" || BLAKE2b-512(message), so a
 * signature produced here never verifies as a plain Ed25519 signature over
 * the same message, and vice versa.
 */
class SignatureCodec {
public:
    /// Deterministic: the same key and message always give the same signature.
    /// The prehash streams, so no message size limit applies.
    [[nodiscard]] static Result<models::Signature, ProtocolFailure> Sign(
        std::span<const uint8_t> message,
        const models::SecretKey& signer_secret);

    /// False on any mismatch; never an error
    [[nodiscard]] static bool Verify(
        std::span<const uint8_t> message,
        const models::PublicKey& signer_public,
        const models::Signature& signature);

    /// As above for an unparsed signature; a wrong length fails with SignatureLength
    [[nodiscard]] static Result<bool, ProtocolFailure> Verify(
        std::span<const uint8_t> message,
        const models::PublicKey& signer_public,
        std::span<const uint8_t> signature);

private:
    SignatureCodec() = delete;
};

} // namespace dhole::protocol
