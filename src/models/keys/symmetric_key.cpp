#include "dhole/models/keys/symmetric_key.hpp"
#include "dhole/crypto/sodium_interop.hpp"

#include <algorithm>
#include <format>

namespace dhole::protocol::models {

Result<crypto::SecureMemoryHandle, ProtocolFailure> SymmetricKey::Allocate() {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto handle = crypto::SecureMemoryHandle::Allocate(Constants::SYMMETRIC_KEY_SIZE);
    if (handle.IsErr()) {
        return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Ok(std::move(handle).Unwrap());
}

Result<SymmetricKey, ProtocolFailure> SymmetricKey::Generate() {
    return CreateWith([](std::span<uint8_t> key) {
        return crypto::SodiumInterop::FillRandom(key);
    });
}

Result<SymmetricKey, ProtocolFailure> SymmetricKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::SYMMETRIC_KEY_SIZE) {
        return Result<SymmetricKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyLength(
                std::format("Symmetric key must be {} bytes, got {}",
                    Constants::SYMMETRIC_KEY_SIZE, bytes.size())));
    }
    return CreateWith([bytes](std::span<uint8_t> key) {
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    });
}

bool SymmetricKey::ConstantTimeEquals(const SymmetricKey& other) const {
    auto equal = WithKey([&other](std::span<const uint8_t> mine) {
        return other.WithKey([mine](std::span<const uint8_t> theirs) -> Result<bool, ProtocolFailure> {
            auto compared = crypto::SodiumInterop::ConstantTimeEquals(mine, theirs);
            if (compared.IsErr()) {
                return Result<bool, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(compared.UnwrapErr()));
            }
            return Result<bool, ProtocolFailure>::Ok(compared.Unwrap());
        });
    });
    return equal.IsOk() && equal.Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> SymmetricKey::ExportBytes() const {
    auto bytes = key_.ReadBytes(Constants::SYMMETRIC_KEY_SIZE);
    if (bytes.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(bytes.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes).Unwrap());
}

} // namespace dhole::protocol::models
