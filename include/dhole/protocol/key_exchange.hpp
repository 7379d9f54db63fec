#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/enums/key_direction.hpp"
#include "dhole/models/keys/public_key.hpp"
#include "dhole/models/keys/secret_key.hpp"
#include "dhole/models/keys/symmetric_key.hpp"

namespace dhole::protocol {

/**
 * @brief Directional X25519 key agreement
 *
 * Both parties derive the same key for one traffic direction:
 *
 *   Derive(A, B.pk, Outbound) == Derive(B, A.pk, Inbound)
 *   Derive(A, B.pk, Inbound)  == Derive(B, A.pk, Outbound)
 *
 * and the two directions never coincide. The HKDF input binds the shared
 * secret to both public keys in sorted order and to a direction byte:
 *
 *   ikm  = X25519(a, B) || min(A, B) || max(A, B) || direction_byte
 *   key  = HKDF-SHA256(ikm, salt = empty, info = "Dhole-KeyExchange-v1", 32)
 *
 * where direction_byte = (Outbound ? 1 : 0) XOR (A < B ? 1 : 0).
 *
 * Fails with DegenerateKey when the peer key is not a usable prime-order
 * point, equals the caller's own public key, or yields an all-zero shared
 * secret.
 */
class KeyExchange {
public:
    [[nodiscard]] static Result<models::SymmetricKey, ProtocolFailure> Derive(
        const models::SecretKey& own_secret,
        const models::PublicKey& peer_public,
        enums::KeyDirection direction);

private:
    KeyExchange() = delete;
};

} // namespace dhole::protocol
