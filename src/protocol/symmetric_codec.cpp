#include "dhole/protocol/symmetric_codec.hpp"
#include "dhole/crypto/hkdf.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/crypto/xchacha20_poly1305.hpp"
#include "dhole/debug/key_logger.hpp"

#include <array>
#include <format>

namespace dhole::protocol {

namespace {
    using crypto::SodiumInterop;
    using models::SymmetricKey;
    using Nonce = std::array<uint8_t, Constants::XCHACHA20_POLY1305_NONCE_SIZE>;

    static_assert(Constants::MAC_SIZE == crypto_auth_BYTES);
    static_assert(Constants::SYMMETRIC_KEY_SIZE == crypto_auth_KEYBYTES);

    std::vector<uint8_t> BuildAssociatedData(std::span<const uint8_t> associated_data) {
        std::vector<uint8_t> aad;
        aad.reserve(WireFormat::VERSION_SIZE + associated_data.size());
        aad.push_back(WireFormat::ENCRYPTED_MESSAGE_VERSION);
        aad.insert(aad.end(), associated_data.begin(), associated_data.end());
        return aad;
    }

    Result<Unit, ProtocolFailure> CheckMessageSize(
        const size_t size,
        const configuration::ProtocolConfig& config) {
        if (!config.AllowsMessage(size)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    std::format("Message of {} bytes exceeds configured maximum {}",
                        size, config.MaxMessageBytes())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    /// Derives the MAC sub-key and hands it to @p use; the sub-key is wiped afterwards
    template<typename F>
    Result<bool, ProtocolFailure> WithAuthKey(const SymmetricKey& key, F&& use) {
        return key.WithKey([&use](std::span<const uint8_t> key_bytes) -> Result<bool, ProtocolFailure> {
            std::array<uint8_t, crypto_auth_KEYBYTES> auth_key{};
            auto derived = crypto::Hkdf::DeriveKey(
                key_bytes, auth_key, {}, DomainSeparation::AsBytes(DomainSeparation::AUTH_KEY_INFO));
            const bool outcome = derived.IsOk() && use(std::span<const uint8_t>(auth_key));
            if (auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(auth_key)); wiped.IsErr()) {
                return Result<bool, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(wiped.UnwrapErr()));
            }
            if (derived.IsErr()) {
                return std::move(derived).PropagateErr<bool>();
            }
            return Result<bool, ProtocolFailure>::Ok(outcome);
        });
    }
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricCodec::Encrypt(
    std::span<const uint8_t> message,
    const SymmetricKey& key,
    std::span<const uint8_t> associated_data,
    const ProtocolConfig& config) {

    if (auto size_ok = CheckMessageSize(message.size(), config); size_ok.IsErr()) {
        return std::move(size_ok).PropagateErr<std::vector<uint8_t>>();
    }

    Nonce nonce{};
    if (auto random = SodiumInterop::FillRandom(nonce); random.IsErr()) {
        return std::move(random).PropagateErr<std::vector<uint8_t>>();
    }
    const auto aad = BuildAssociatedData(associated_data);

    auto sealed = key.WithKey([&](std::span<const uint8_t> key_bytes) {
        return crypto::XChaCha20Poly1305::Encrypt(key_bytes, nonce, message, aad);
    });
    if (sealed.IsErr()) {
        return sealed;
    }
    const auto& ciphertext = sealed.Unwrap();

    debug::LogEncryption(debug::Role::Sender, WireFormat::ENCRYPTED_MESSAGE_VERSION, nonce, message.size());

    std::vector<uint8_t> output;
    output.reserve(WireFormat::ENCRYPTED_PAYLOAD_OFFSET + ciphertext.size());
    output.push_back(WireFormat::ENCRYPTED_MESSAGE_VERSION);
    output.insert(output.end(), nonce.begin(), nonce.end());
    output.insert(output.end(), ciphertext.begin(), ciphertext.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<Unit, ProtocolFailure> SymmetricCodec::ValidateFraming(
    std::span<const uint8_t> encrypted,
    const ProtocolConfig& config) {

    if (encrypted.empty()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Authentication());
    }
    if (encrypted[WireFormat::VERSION_OFFSET] != WireFormat::ENCRYPTED_MESSAGE_VERSION) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::UnsupportedVersion(
                std::format("Unsupported message version 0x{:02x}, expected 0x{:02x}",
                    encrypted[WireFormat::VERSION_OFFSET], WireFormat::ENCRYPTED_MESSAGE_VERSION)));
    }
    if (encrypted.size() < WireFormat::ENCRYPTED_OVERHEAD) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Authentication());
    }
    if (encrypted.size() > config.MaxEncryptedBytes()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Encrypted message of {} bytes exceeds configured maximum {}",
                    encrypted.size(), config.MaxEncryptedBytes())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricCodec::Decrypt(
    std::span<const uint8_t> encrypted,
    const SymmetricKey& key,
    std::span<const uint8_t> associated_data,
    const ProtocolConfig& config) {

    if (auto framing = ValidateFraming(encrypted, config); framing.IsErr()) {
        return std::move(framing).PropagateErr<std::vector<uint8_t>>();
    }

    const auto nonce = encrypted.subspan(
        WireFormat::ENCRYPTED_NONCE_OFFSET, Constants::XCHACHA20_POLY1305_NONCE_SIZE);
    const auto payload = encrypted.subspan(WireFormat::ENCRYPTED_PAYLOAD_OFFSET);
    const auto aad = BuildAssociatedData(associated_data);

    auto opened = key.WithKey([&](std::span<const uint8_t> key_bytes) {
        return crypto::XChaCha20Poly1305::Decrypt(key_bytes, nonce, payload, aad);
    });

    debug::LogDecryption(debug::Role::Recipient, encrypted[WireFormat::VERSION_OFFSET], nonce, opened.IsOk());
    return opened;
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricCodec::Authenticate(
    std::span<const uint8_t> message,
    const SymmetricKey& key,
    const ProtocolConfig& config) {

    if (auto size_ok = CheckMessageSize(message.size(), config); size_ok.IsErr()) {
        return std::move(size_ok).PropagateErr<std::vector<uint8_t>>();
    }

    std::vector<uint8_t> mac(Constants::MAC_SIZE);
    auto computed = WithAuthKey(key, [&](std::span<const uint8_t> auth_key) {
        return crypto_auth(mac.data(), message.data(), message.size(), auth_key.data())
            == SodiumConstants::SUCCESS;
    });
    if (computed.IsErr()) {
        return std::move(computed).PropagateErr<std::vector<uint8_t>>();
    }
    if (!computed.Unwrap()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("HMAC-SHA512-256 computation failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
}

Result<bool, ProtocolFailure> SymmetricCodec::VerifyMac(
    std::span<const uint8_t> message,
    const SymmetricKey& key,
    std::span<const uint8_t> mac,
    const ProtocolConfig& config) {

    if (auto size_ok = CheckMessageSize(message.size(), config); size_ok.IsErr()) {
        return std::move(size_ok).PropagateErr<bool>();
    }
    if (mac.size() != Constants::MAC_SIZE) {
        return Result<bool, ProtocolFailure>::Ok(false);
    }

    // crypto_auth_verify compares in constant time
    return WithAuthKey(key, [&](std::span<const uint8_t> auth_key) {
        return crypto_auth_verify(mac.data(), message.data(), message.size(), auth_key.data())
            == SodiumConstants::SUCCESS;
    });
}

} // namespace dhole::protocol
