#include "dhole/models/keys/secret_key.hpp"
#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/sodium_interop.hpp"

#include <format>

namespace dhole::protocol::models {

namespace {
    Result<crypto::SecureMemoryHandle, ProtocolFailure> AllocateSeed() {
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto handle = crypto::SecureMemoryHandle::Allocate(Constants::SECRET_KEY_SIZE);
        if (handle.IsErr()) {
            return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
    }
}

Result<SecretKey, ProtocolFailure> SecretKey::Generate() {
    auto allocated = AllocateSeed();
    if (allocated.IsErr()) {
        return std::move(allocated).PropagateErr<SecretKey>();
    }
    auto seed = std::move(allocated).Unwrap();

    auto filled = crypto::FlattenAccess(seed.WithWriteAccess([](std::span<uint8_t> bytes) {
        return crypto::SodiumInterop::FillRandom(bytes);
    }));
    if (filled.IsErr()) {
        return std::move(filled).PropagateErr<SecretKey>();
    }
    return FromSeedHandle(std::move(seed));
}

Result<SecretKey, ProtocolFailure> SecretKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::SECRET_KEY_SIZE) {
        return Result<SecretKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyLength(
                std::format("Secret key must be {} bytes, got {}",
                    Constants::SECRET_KEY_SIZE, bytes.size())));
    }
    auto allocated = AllocateSeed();
    if (allocated.IsErr()) {
        return std::move(allocated).PropagateErr<SecretKey>();
    }
    auto seed = std::move(allocated).Unwrap();
    if (auto written = seed.Write(bytes); written.IsErr()) {
        return Result<SecretKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    return FromSeedHandle(std::move(seed));
}

Result<SecretKey, ProtocolFailure> SecretKey::FromSeedHandle(crypto::SecureMemoryHandle seed) {
    auto derived = crypto::FlattenAccess(seed.WithReadAccess(
        [](std::span<const uint8_t> seed_bytes) -> Result<PublicKey, ProtocolFailure> {
            PublicKey::Bytes public_bytes{};
            if (auto ok = crypto::Curve25519::DerivePublicKey(seed_bytes, public_bytes); ok.IsErr()) {
                return std::move(ok).PropagateErr<PublicKey>();
            }
            return Result<PublicKey, ProtocolFailure>::Ok(PublicKey(public_bytes));
        }));
    if (derived.IsErr()) {
        return std::move(derived).PropagateErr<SecretKey>();
    }
    return Result<SecretKey, ProtocolFailure>::Ok(SecretKey(std::move(seed), derived.Unwrap()));
}

} // namespace dhole::protocol::models
