#include "dhole/protocol/key_exchange.hpp"
#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/hkdf.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/crypto/sodium_secure_memory_handle.hpp"
#include "dhole/security/validation/dh_validator.hpp"
#include "dhole/debug/key_logger.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace dhole::protocol {

namespace {
    using crypto::Curve25519;
    using crypto::SecureMemoryHandle;
    using enums::KeyDirection;
    using models::PublicKey;
    using models::SecretKey;
    using models::SymmetricKey;

    // Guarded scratch region: [x25519 scalar][shared || lo || hi || direction]
    constexpr size_t SCALAR_OFFSET = 0;
    constexpr size_t IKM_OFFSET = Constants::X_25519_SCALAR_SIZE;
    constexpr size_t IKM_SIZE =
        Constants::X_25519_SHARED_SECRET_SIZE + 2 * Constants::PUBLIC_KEY_SIZE + 1;
    constexpr size_t WORKSPACE_SIZE = IKM_OFFSET + IKM_SIZE;

    uint8_t DirectionByte(const KeyDirection direction, const bool own_first) noexcept {
        const uint8_t outbound = direction == KeyDirection::Outbound
            ? DomainSeparation::DIRECTION_OUTBOUND_BIT
            : DomainSeparation::DIRECTION_INBOUND_BIT;
        return static_cast<uint8_t>(outbound ^ (own_first ? 1 : 0));
    }
}

Result<SymmetricKey, ProtocolFailure> KeyExchange::Derive(
    const SecretKey& own_secret,
    const PublicKey& peer_public,
    const KeyDirection direction) {

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE> peer_montgomery{};
    if (auto converted = Curve25519::ToMontgomeryPublic(peer_public.AsSpan(), peer_montgomery);
        converted.IsErr()) {
        return std::move(converted).PropagateErr<SymmetricKey>();
    }
    if (auto valid = security::DhValidator::ValidateX25519PublicKey(peer_montgomery); valid.IsErr()) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey(valid.UnwrapErr().message));
    }

    const PublicKey& own_public = own_secret.GetPublicKey();
    if (own_public == peer_public) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey(std::string(ErrorMessages::REFLECTED_PUBLIC_KEY)));
    }

    auto allocated = SecureMemoryHandle::Allocate(WORKSPACE_SIZE);
    if (allocated.IsErr()) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(allocated.UnwrapErr()));
    }
    auto workspace = std::move(allocated).Unwrap();

    const bool own_first = own_public < peer_public;
    const uint8_t direction_byte = DirectionByte(direction, own_first);

    auto ikm_ready = crypto::FlattenAccess(workspace.WithWriteAccess(
        [&](std::span<uint8_t> scratch) -> Result<Unit, ProtocolFailure> {
            auto scalar = scratch.subspan(SCALAR_OFFSET, Constants::X_25519_SCALAR_SIZE);
            auto ikm = scratch.subspan(IKM_OFFSET, IKM_SIZE);

            auto scalar_ready = own_secret.WithSeed([scalar](std::span<const uint8_t> seed) {
                return Curve25519::ToMontgomerySecret(seed, scalar);
            });
            if (scalar_ready.IsErr()) {
                return scalar_ready;
            }

            auto shared = ikm.subspan(0, Constants::X_25519_SHARED_SECRET_SIZE);
            if (auto agreed = Curve25519::Ecdh(scalar, peer_montgomery, shared); agreed.IsErr()) {
                return agreed;
            }

            const PublicKey& lo = own_first ? own_public : peer_public;
            const PublicKey& hi = own_first ? peer_public : own_public;
            auto cursor = ikm.begin() + static_cast<std::ptrdiff_t>(Constants::X_25519_SHARED_SECRET_SIZE);
            cursor = std::copy(lo.GetBytes().begin(), lo.GetBytes().end(), cursor);
            cursor = std::copy(hi.GetBytes().begin(), hi.GetBytes().end(), cursor);
            *cursor = direction_byte;
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }));
    if (ikm_ready.IsErr()) {
        return std::move(ikm_ready).PropagateErr<SymmetricKey>();
    }

    return SymmetricKey::CreateWith([&](std::span<uint8_t> key) {
        return crypto::FlattenAccess(workspace.WithReadAccess(
            [&](std::span<const uint8_t> scratch) -> Result<Unit, ProtocolFailure> {
                auto ikm = scratch.subspan(IKM_OFFSET, IKM_SIZE);
                auto derived = crypto::Hkdf::DeriveKey(
                    ikm, key, {}, DomainSeparation::AsBytes(DomainSeparation::KEY_EXCHANGE_INFO));
                if (derived.IsOk()) {
                    debug::LogKeyExchange(
                        direction == KeyDirection::Outbound ? debug::Role::Sender : debug::Role::Recipient,
                        direction == KeyDirection::Outbound,
                        own_public.AsSpan(),
                        peer_public.AsSpan(),
                        ikm.subspan(0, Constants::X_25519_SHARED_SECRET_SIZE),
                        direction_byte,
                        key);
                }
                return derived;
            }));
    });
}

} // namespace dhole::protocol
