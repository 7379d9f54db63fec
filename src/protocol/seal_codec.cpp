#include "dhole/protocol/seal_codec.hpp"
#include "dhole/protocol/key_exchange.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/crypto/xchacha20_poly1305.hpp"
#include "dhole/models/keys/key_pair.hpp"
#include "dhole/debug/key_logger.hpp"

#include <array>
#include <format>

namespace dhole::protocol {

namespace {
    using crypto::SodiumInterop;
    using models::PublicKey;
    using Nonce = std::array<uint8_t, Constants::XCHACHA20_POLY1305_NONCE_SIZE>;

    Result<Nonce, ProtocolFailure> DeriveSealNonce(
        const PublicKey& ephemeral_public,
        const PublicKey& recipient_public) {
        Nonce nonce{};
        auto hashed = SodiumInterop::GenericHash(
            nonce, {ephemeral_public.AsSpan(), recipient_public.AsSpan()});
        if (hashed.IsErr()) {
            return std::move(hashed).PropagateErr<Nonce>();
        }
        return Result<Nonce, ProtocolFailure>::Ok(nonce);
    }
}

Result<std::vector<uint8_t>, ProtocolFailure> SealCodec::Seal(
    std::span<const uint8_t> message,
    const PublicKey& recipient_public,
    const ProtocolConfig& config) {

    if (!config.AllowsMessage(message.size())) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Message of {} bytes exceeds configured maximum {}",
                    message.size(), config.MaxMessageBytes())));
    }

    // Lives only in this scope; sodium_free zeroes the seed on every return path
    auto ephemeral_result = models::KeyPair::Generate();
    if (ephemeral_result.IsErr()) {
        return std::move(ephemeral_result).PropagateErr<std::vector<uint8_t>>();
    }
    const auto ephemeral = std::move(ephemeral_result).Unwrap();
    const PublicKey& ephemeral_public = ephemeral.GetPublicKey();

    auto key = KeyExchange::Derive(
        ephemeral.GetSecretKey(), recipient_public, enums::KeyDirection::Outbound);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<std::vector<uint8_t>>();
    }

    auto nonce_result = DeriveSealNonce(ephemeral_public, recipient_public);
    if (nonce_result.IsErr()) {
        return std::move(nonce_result).PropagateErr<std::vector<uint8_t>>();
    }
    const Nonce& nonce = nonce_result.Unwrap();

    auto ciphertext = key.Unwrap().WithKey([&](std::span<const uint8_t> key_bytes) {
        return crypto::XChaCha20Poly1305::Encrypt(key_bytes, nonce, message);
    });
    if (ciphertext.IsErr()) {
        return ciphertext;
    }

    debug::LogSeal(debug::Role::Sender, ephemeral_public.AsSpan(), nonce);

    const auto& body = ciphertext.Unwrap();
    std::vector<uint8_t> output;
    output.reserve(WireFormat::SEALED_PAYLOAD_OFFSET + body.size());
    output.insert(output.end(), ephemeral_public.GetBytes().begin(), ephemeral_public.GetBytes().end());
    output.insert(output.end(), nonce.begin(), nonce.end());
    output.insert(output.end(), body.begin(), body.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> SealCodec::Unseal(
    std::span<const uint8_t> sealed,
    const models::SecretKey& recipient_secret,
    const ProtocolConfig& config) {

    if (sealed.size() < WireFormat::SEALED_OVERHEAD) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ProtocolFailure::Authentication());
    }
    if (sealed.size() > config.MaxSealedBytes()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Sealed message of {} bytes exceeds configured maximum {}",
                    sealed.size(), config.MaxSealedBytes())));
    }

    auto ephemeral_result = PublicKey::FromBytes(
        sealed.subspan(WireFormat::SEALED_EPHEMERAL_OFFSET, Constants::PUBLIC_KEY_SIZE));
    if (ephemeral_result.IsErr()) {
        return std::move(ephemeral_result).PropagateErr<std::vector<uint8_t>>();
    }
    const PublicKey& ephemeral_public = ephemeral_result.Unwrap();
    const auto embedded_nonce = sealed.subspan(
        WireFormat::SEALED_NONCE_OFFSET, Constants::XCHACHA20_POLY1305_NONCE_SIZE);
    const auto payload = sealed.subspan(WireFormat::SEALED_PAYLOAD_OFFSET);

    auto expected_nonce = DeriveSealNonce(ephemeral_public, recipient_secret.GetPublicKey());
    if (expected_nonce.IsErr()) {
        return std::move(expected_nonce).PropagateErr<std::vector<uint8_t>>();
    }
    auto nonce_matches = SodiumInterop::ConstantTimeEquals(expected_nonce.Unwrap(), embedded_nonce);
    if (nonce_matches.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(nonce_matches.UnwrapErr()));
    }
    debug::LogSeal(debug::Role::Recipient, ephemeral_public.AsSpan(), embedded_nonce);
    if (!nonce_matches.Unwrap()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ProtocolFailure::Authentication());
    }

    auto key = KeyExchange::Derive(recipient_secret, ephemeral_public, enums::KeyDirection::Inbound);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<std::vector<uint8_t>>();
    }
    return key.Unwrap().WithKey([&](std::span<const uint8_t> key_bytes) {
        return crypto::XChaCha20Poly1305::Decrypt(key_bytes, embedded_nonce, payload);
    });
}

} // namespace dhole::protocol
