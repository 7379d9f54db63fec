#pragma once
#include <string>
#include <string_view>
namespace dhole::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    InvalidKeyLength,
    DegenerateKey,
    UnsupportedVersion,
    Authentication,
    SignatureLength,
    RandomnessFailure,
    DeriveKey,
    InvalidInput
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * @brief Typed failure surfaced by every public operation
 *
 * Authentication failures deliberately carry one fixed message regardless of
 * which part of the input was corrupted.
 */
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure InvalidKeyLength(std::string msg) {
        return {ProtocolFailureType::InvalidKeyLength, std::move(msg)};
    }
    static ProtocolFailure DegenerateKey(std::string msg) {
        return {ProtocolFailureType::DegenerateKey, std::move(msg)};
    }
    static ProtocolFailure UnsupportedVersion(std::string msg) {
        return {ProtocolFailureType::UnsupportedVersion, std::move(msg)};
    }
    static ProtocolFailure Authentication();
    static ProtocolFailure SignatureLength(std::string msg) {
        return {ProtocolFailureType::SignatureLength, std::move(msg)};
    }
    static ProtocolFailure RandomnessFailure(std::string msg) {
        return {ProtocolFailureType::RandomnessFailure, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return RandomnessFailure(sf.message);
        }
        return Generic(sf.message);
    }
};

[[nodiscard]] std::string_view ToString(ProtocolFailureType type) noexcept;
}
