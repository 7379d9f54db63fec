#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
namespace dhole::protocol {
struct Constants {
    static constexpr size_t SECRET_KEY_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SYMMETRIC_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;
    static constexpr size_t MAC_SIZE = 32;

    // libsodium's expanded Ed25519 secret (seed || public key)
    static constexpr size_t ED_25519_EXPANDED_SECRET_SIZE = 64;
    static constexpr size_t X_25519_SCALAR_SIZE = 32;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t CURVE_25519_FIELD_ELEMENT_SIZE = 32;
    static constexpr size_t WORD_SIZE = 4;
    static constexpr size_t FIELD_256_WORD_COUNT = 8;
    static constexpr uint32_t FIELD_ELEMENT_MASK = 0x7FFFFFFF;

    static constexpr size_t XCHACHA20_POLY1305_KEY_SIZE = 32;
    static constexpr size_t XCHACHA20_POLY1305_NONCE_SIZE = 24;
    static constexpr size_t XCHACHA20_POLY1305_TAG_SIZE = 16;

    static constexpr size_t PREHASH_SIZE = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct WireFormat {
    static constexpr uint8_t ENCRYPTED_MESSAGE_VERSION = 0x01;
    static constexpr size_t VERSION_SIZE = 1;
    static constexpr size_t VERSION_OFFSET = 0;
    static constexpr size_t ENCRYPTED_NONCE_OFFSET = VERSION_SIZE;
    static constexpr size_t ENCRYPTED_PAYLOAD_OFFSET =
        ENCRYPTED_NONCE_OFFSET + Constants::XCHACHA20_POLY1305_NONCE_SIZE;
    static constexpr size_t ENCRYPTED_OVERHEAD =
        ENCRYPTED_PAYLOAD_OFFSET + Constants::XCHACHA20_POLY1305_TAG_SIZE;

    static constexpr size_t SEALED_EPHEMERAL_OFFSET = 0;
    static constexpr size_t SEALED_NONCE_OFFSET = Constants::PUBLIC_KEY_SIZE;
    static constexpr size_t SEALED_PAYLOAD_OFFSET =
        SEALED_NONCE_OFFSET + Constants::XCHACHA20_POLY1305_NONCE_SIZE;
    static constexpr size_t SEALED_OVERHEAD =
        SEALED_PAYLOAD_OFFSET + Constants::XCHACHA20_POLY1305_TAG_SIZE;
};
struct DomainSeparation {
    static constexpr std::string_view KEY_EXCHANGE_INFO = "Dhole-KeyExchange-v1";
    static constexpr std::string_view SIGNATURE_PREFIX = "Dhole-Signature-v1";
    static constexpr std::string_view AUTH_KEY_INFO = "Dhole-Auth-v1";
    static constexpr uint8_t DIRECTION_OUTBOUND_BIT = 0x01;
    static constexpr uint8_t DIRECTION_INBOUND_BIT = 0x00;

    /// Byte view of a label, without the terminating NUL
    static std::span<const uint8_t> AsBytes(const std::string_view label) noexcept {
        return {reinterpret_cast<const uint8_t*>(label.data()), label.size()};
    }
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr const char* ALGORITHM_HKDF = "HKDF";
    static constexpr const char* ALGORITHM_SHA256 = "SHA256";
    static constexpr const char* PARAM_DIGEST = "digest";
    static constexpr const char* PARAM_KEY = "key";
    static constexpr const char* PARAM_SALT = "salt";
    static constexpr const char* PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AUTHENTICATION_FAILED = "Message authentication failed";
    static constexpr std::string_view REFLECTED_PUBLIC_KEY = "Peer public key equals own public key";
    static constexpr std::string_view INVALID_PEER_POINT = "Peer public key is not a valid prime-order curve point";
    static constexpr std::string_view ZERO_SHARED_SECRET = "Key agreement produced an all-zero shared secret";
    static constexpr std::string_view RANDOMNESS_UNAVAILABLE = "Secure randomness source unavailable";
};
}
