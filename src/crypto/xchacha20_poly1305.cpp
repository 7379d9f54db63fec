#include "dhole/crypto/xchacha20_poly1305.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"

#include <format>

namespace dhole::protocol::crypto {

namespace {
    static_assert(Constants::XCHACHA20_POLY1305_KEY_SIZE == crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
    static_assert(Constants::XCHACHA20_POLY1305_NONCE_SIZE == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
    static_assert(Constants::XCHACHA20_POLY1305_TAG_SIZE == crypto_aead_xchacha20poly1305_ietf_ABYTES);

    Result<Unit, ProtocolFailure> CheckParameters(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::XCHACHA20_POLY1305_KEY_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyLength(
                    std::format("XChaCha20-Poly1305 key must be {} bytes, got {}",
                        Constants::XCHACHA20_POLY1305_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::XCHACHA20_POLY1305_NONCE_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    std::format("XChaCha20-Poly1305 nonce must be {} bytes, got {}",
                        Constants::XCHACHA20_POLY1305_NONCE_SIZE, nonce.size())));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, ProtocolFailure>
XChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckParameters(key, nonce); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    if (plaintext.size() > crypto_aead_xchacha20poly1305_ietf_MESSAGEBYTES_MAX) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Plaintext of {} bytes exceeds the XChaCha20-Poly1305 limit",
                    plaintext.size())));
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + Constants::XCHACHA20_POLY1305_TAG_SIZE);
    unsigned long long written = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        ciphertext.data(), &written,
        plaintext.data(), plaintext.size(),
        associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
        nullptr,
        nonce.data(), key.data());
    if (rc != SodiumConstants::SUCCESS || written != ciphertext.size()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("XChaCha20-Poly1305 encryption failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ProtocolFailure>
XChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckParameters(key, nonce); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    if (ciphertext_with_tag.size() < Constants::XCHACHA20_POLY1305_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Authentication());
    }

    std::vector<uint8_t> plaintext(ciphertext_with_tag.size() - Constants::XCHACHA20_POLY1305_TAG_SIZE);
    unsigned long long written = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        plaintext.data(), &written,
        nullptr,
        ciphertext_with_tag.data(), ciphertext_with_tag.size(),
        associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
        nonce.data(), key.data());
    if (rc != SodiumConstants::SUCCESS) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Authentication());
    }
    plaintext.resize(static_cast<size_t>(written));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

} // namespace dhole::protocol::crypto
