#include "dhole/security/validation/dh_validator.hpp"

#include <format>

namespace dhole::protocol::security {

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyLength(
                std::format("Invalid X25519 public key size: expected {}, got {}",
                    Constants::X_25519_PUBLIC_KEY_SIZE, public_key.size())));
    }
    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey("X25519 public key is a small-order point"));
    }
    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DegenerateKey("X25519 public key is not a valid Curve25519 field element"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    // Accumulate over the whole table so timing does not reveal which entry matched
    uint8_t any_match = 0;
    for (const auto& point : SMALL_ORDER_POINTS) {
        uint8_t diff = 0;
        for (size_t i = 0; i + 1 < point.size(); ++i) {
            diff |= static_cast<uint8_t>(public_key[i] ^ point[i]);
        }
        diff |= static_cast<uint8_t>((public_key[point.size() - 1] & 0x7f) ^ point[point.size() - 1]);
        any_match |= static_cast<uint8_t>(diff == 0);
    }
    return any_match != 0;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    // Compare 32-bit little-endian words from the most significant down,
    // with bit 255 cleared
    for (size_t w = Constants::FIELD_256_WORD_COUNT; w-- > 0;) {
        const size_t offset = w * Constants::WORD_SIZE;
        uint32_t key_word = 0;
        uint32_t prime_word = 0;
        for (size_t b = Constants::WORD_SIZE; b-- > 0;) {
            key_word = (key_word << 8) | public_key[offset + b];
            prime_word = (prime_word << 8) | CURVE_25519_PRIME[offset + b];
        }
        if (w == Constants::FIELD_256_WORD_COUNT - 1) {
            key_word &= Constants::FIELD_ELEMENT_MASK;
        }
        if (key_word != prime_word) {
            return key_word < prime_word;
        }
    }
    return false;
}

} // namespace dhole::protocol::security
