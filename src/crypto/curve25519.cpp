#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"

#include <array>
#include <format>
#include <string>

namespace dhole::protocol::crypto {

namespace {
    static_assert(Constants::SECRET_KEY_SIZE == crypto_sign_SEEDBYTES);
    static_assert(Constants::PUBLIC_KEY_SIZE == crypto_sign_PUBLICKEYBYTES);
    static_assert(Constants::ED_25519_EXPANDED_SECRET_SIZE == crypto_sign_SECRETKEYBYTES);
    static_assert(Constants::SIGNATURE_SIZE == crypto_sign_BYTES);
    static_assert(Constants::X_25519_SCALAR_SIZE == crypto_scalarmult_SCALARBYTES);
    static_assert(Constants::X_25519_SHARED_SECRET_SIZE == crypto_scalarmult_BYTES);

    using ExpandedSecret = std::array<uint8_t, Constants::ED_25519_EXPANDED_SECRET_SIZE>;

    Result<Unit, ProtocolFailure> RequireSize(
        std::span<const uint8_t> buffer,
        const size_t expected,
        const char* what) {
        if (buffer.size() != expected) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyLength(
                    std::format("{} must be {} bytes, got {}", what, expected, buffer.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> EnsureInitialized() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    /// Expands the seed into libsodium's (seed || public) form; the caller wipes it
    Result<Unit, ProtocolFailure> ExpandSeed(
        std::span<const uint8_t> seed,
        std::span<uint8_t> public_key,
        ExpandedSecret& expanded) {
        if (crypto_sign_seed_keypair(public_key.data(), expanded.data(), seed.data())
                != SodiumConstants::SUCCESS) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Ed25519 seed expansion failed"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void Wipe(std::span<uint8_t> buffer) noexcept {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

Result<Unit, ProtocolFailure> Curve25519::DerivePublicKey(
    std::span<const uint8_t> seed,
    std::span<uint8_t> public_key) {
    if (auto ok = RequireSize(seed, Constants::SECRET_KEY_SIZE, "Secret key"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(public_key, Constants::PUBLIC_KEY_SIZE, "Public key buffer"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = EnsureInitialized(); ok.IsErr()) {
        return ok;
    }

    ExpandedSecret expanded{};
    auto result = ExpandSeed(seed, public_key, expanded);
    Wipe(expanded);
    return result;
}

Result<Unit, ProtocolFailure> Curve25519::ToMontgomerySecret(
    std::span<const uint8_t> seed,
    std::span<uint8_t> x25519_scalar) {
    if (auto ok = RequireSize(seed, Constants::SECRET_KEY_SIZE, "Secret key"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(x25519_scalar, Constants::X_25519_SCALAR_SIZE, "X25519 scalar buffer"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = EnsureInitialized(); ok.IsErr()) {
        return ok;
    }

    ExpandedSecret expanded{};
    std::array<uint8_t, Constants::PUBLIC_KEY_SIZE> public_key{};
    if (auto expand = ExpandSeed(seed, public_key, expanded); expand.IsErr()) {
        Wipe(expanded);
        return expand;
    }
    const int rc = crypto_sign_ed25519_sk_to_curve25519(x25519_scalar.data(), expanded.data());
    Wipe(expanded);
    if (rc != SodiumConstants::SUCCESS) {
        Wipe(x25519_scalar);
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Ed25519 to X25519 secret conversion failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> Curve25519::ToMontgomeryPublic(
    std::span<const uint8_t> ed25519_public,
    std::span<uint8_t> x25519_public) {
    if (auto ok = RequireSize(ed25519_public, Constants::PUBLIC_KEY_SIZE, "Public key"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(x25519_public, Constants::X_25519_PUBLIC_KEY_SIZE, "X25519 public buffer"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = EnsureInitialized(); ok.IsErr()) {
        return ok;
    }

    if (crypto_sign_ed25519_pk_to_curve25519(x25519_public.data(), ed25519_public.data())
            != SodiumConstants::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey(std::string(ErrorMessages::INVALID_PEER_POINT)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> Curve25519::Ecdh(
    std::span<const uint8_t> x25519_scalar,
    std::span<const uint8_t> x25519_public,
    std::span<uint8_t> shared_secret) {
    if (auto ok = RequireSize(x25519_scalar, Constants::X_25519_SCALAR_SIZE, "X25519 scalar"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(x25519_public, Constants::X_25519_PUBLIC_KEY_SIZE, "X25519 public key"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(shared_secret, Constants::X_25519_SHARED_SECRET_SIZE, "Shared secret buffer"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = EnsureInitialized(); ok.IsErr()) {
        return ok;
    }

    // crypto_scalarmult returns -1 when the result is the all-zero point
    if (crypto_scalarmult(shared_secret.data(), x25519_scalar.data(), x25519_public.data())
            != SodiumConstants::SUCCESS) {
        Wipe(shared_secret);
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey(std::string(ErrorMessages::ZERO_SHARED_SECRET)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> Curve25519::SignDetached(
    std::span<const uint8_t> seed,
    std::span<const uint8_t> message,
    std::span<uint8_t> signature) {
    if (auto ok = RequireSize(seed, Constants::SECRET_KEY_SIZE, "Secret key"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = RequireSize(signature, Constants::SIGNATURE_SIZE, "Signature buffer"); ok.IsErr()) {
        return ok;
    }
    if (auto ok = EnsureInitialized(); ok.IsErr()) {
        return ok;
    }

    ExpandedSecret expanded{};
    std::array<uint8_t, Constants::PUBLIC_KEY_SIZE> public_key{};
    if (auto expand = ExpandSeed(seed, public_key, expanded); expand.IsErr()) {
        Wipe(expanded);
        return expand;
    }
    const int rc = crypto_sign_detached(
        signature.data(), nullptr, message.data(), message.size(), expanded.data());
    Wipe(expanded);
    if (rc != SodiumConstants::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Ed25519 signing failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool Curve25519::VerifyDetached(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key.size() != Constants::PUBLIC_KEY_SIZE ||
        signature.size() != Constants::SIGNATURE_SIZE ||
        SodiumInterop::Initialize().IsErr()) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(), public_key.data())
        == SodiumConstants::SUCCESS;
}

} // namespace dhole::protocol::crypto
