#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol::crypto {

/**
 * XChaCha20-Poly1305 (IETF) authenticated encryption, libsodium backend
 *
 * Stateless primitive: the caller supplies a 24-byte nonce. The extended
 * nonce is large enough that a fresh random nonce per message is safe; the
 * channel codec draws one from SodiumInterop::FillRandom for every call and
 * the seal codec derives one from two public keys that include a fresh
 * ephemeral key.
 *
 * Output of Encrypt is ciphertext || 16-byte tag. Decrypt reports any tag
 * mismatch as ProtocolFailureType::Authentication and never releases
 * partially decrypted plaintext.
 */
class XChaCha20Poly1305 {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    XChaCha20Poly1305() = delete;
};

} // namespace dhole::protocol::crypto
