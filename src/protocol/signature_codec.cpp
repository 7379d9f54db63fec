#include "dhole/protocol/signature_codec.hpp"
#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/debug/key_logger.hpp"

#include <algorithm>
#include <array>

namespace dhole::protocol {

namespace {
    using crypto::SodiumInterop;
    using models::Signature;

    constexpr size_t PAYLOAD_SIZE =
        DomainSeparation::SIGNATURE_PREFIX.size() + Constants::PREHASH_SIZE;
    using Payload = std::array<uint8_t, PAYLOAD_SIZE>;

    Result<Payload, ProtocolFailure> BuildPayload(std::span<const uint8_t> message) {
        Payload payload{};
        const auto prefix = DomainSeparation::AsBytes(DomainSeparation::SIGNATURE_PREFIX);
        std::copy(prefix.begin(), prefix.end(), payload.begin());
        auto prehash = std::span<uint8_t>(payload).subspan(prefix.size(), Constants::PREHASH_SIZE);
        if (auto hashed = SodiumInterop::GenericHash(prehash, {message}); hashed.IsErr()) {
            return std::move(hashed).PropagateErr<Payload>();
        }
        return Result<Payload, ProtocolFailure>::Ok(payload);
    }
}

Result<Signature, ProtocolFailure> SignatureCodec::Sign(
    std::span<const uint8_t> message,
    const models::SecretKey& signer_secret) {

    auto payload = BuildPayload(message);
    if (payload.IsErr()) {
        return std::move(payload).PropagateErr<Signature>();
    }

    Signature::Bytes signature{};
    auto signed_result = signer_secret.WithSeed([&](std::span<const uint8_t> seed) {
        return crypto::Curve25519::SignDetached(seed, payload.Unwrap(), signature);
    });
    if (signed_result.IsErr()) {
        return std::move(signed_result).PropagateErr<Signature>();
    }

    debug::LogSignature(debug::Role::Signer,
        std::span<const uint8_t>(payload.Unwrap()).subspan(DomainSeparation::SIGNATURE_PREFIX.size()),
        signature);
    return Result<Signature, ProtocolFailure>::Ok(Signature(signature));
}

bool SignatureCodec::Verify(
    std::span<const uint8_t> message,
    const models::PublicKey& signer_public,
    const Signature& signature) {

    auto payload = BuildPayload(message);
    if (payload.IsErr()) {
        return false;
    }
    return crypto::Curve25519::VerifyDetached(signer_public.AsSpan(), payload.Unwrap(), signature.AsSpan());
}

Result<bool, ProtocolFailure> SignatureCodec::Verify(
    std::span<const uint8_t> message,
    const models::PublicKey& signer_public,
    std::span<const uint8_t> signature) {

    auto parsed = Signature::FromBytes(signature);
    if (parsed.IsErr()) {
        return std::move(parsed).PropagateErr<bool>();
    }
    return Result<bool, ProtocolFailure>::Ok(Verify(message, signer_public, parsed.Unwrap()));
}

} // namespace dhole::protocol
