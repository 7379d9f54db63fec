#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"

#include <cstdint>
#include <span>

namespace dhole::protocol::crypto {

/**
 * @brief Edwards25519 / Curve25519 operations over libsodium
 *
 * One 32-byte seed serves both key agreement and signing. The Ed25519 key
 * pair is derived from the seed (RFC 8032), and key agreement runs X25519
 * over the birationally equivalent Montgomery forms of both keys.
 *
 * All outputs are written into caller-owned buffers of exact size so that
 * secret intermediates can live in guarded memory.
 */
class Curve25519 {
public:
    /// [clamp(SHA-512(seed)[0..32])]·B, compressed Edwards encoding
    static Result<Unit, ProtocolFailure> DerivePublicKey(
        std::span<const uint8_t> seed,
        std::span<uint8_t> public_key);

    /// X25519 scalar for @p seed, as used by crypto_sign_ed25519_sk_to_curve25519
    static Result<Unit, ProtocolFailure> ToMontgomerySecret(
        std::span<const uint8_t> seed,
        std::span<uint8_t> x25519_scalar);

    /**
     * @brief Montgomery u-coordinate of an Ed25519 public key
     *
     * Fails with DegenerateKey for non-canonical encodings, small-order
     * points and points outside the prime-order subgroup.
     */
    static Result<Unit, ProtocolFailure> ToMontgomeryPublic(
        std::span<const uint8_t> ed25519_public,
        std::span<uint8_t> x25519_public);

    /// X25519; an all-zero result fails with DegenerateKey
    static Result<Unit, ProtocolFailure> Ecdh(
        std::span<const uint8_t> x25519_scalar,
        std::span<const uint8_t> x25519_public,
        std::span<uint8_t> shared_secret);

    /// Deterministic Ed25519 detached signature
    static Result<Unit, ProtocolFailure> SignDetached(
        std::span<const uint8_t> seed,
        std::span<const uint8_t> message,
        std::span<uint8_t> signature);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

private:
    Curve25519() = delete;
};

} // namespace dhole::protocol::crypto
