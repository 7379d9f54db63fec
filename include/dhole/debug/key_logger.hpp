#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug logging of key material and wire framing.
 *
 * SECURITY WARNING: This module prints secret keys to stdout.
 * Only enable DHOLE_DEBUG_KEYS when checking key-exchange and framing
 * output against another implementation. NEVER enable in production builds.
 *
 * Enable via CMake: -DDHOLE_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace dhole::debug {

enum class Role {
    Sender,
    Recipient,
    Signer,
    Unknown
};

#ifdef DHOLE_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* RoleToString(Role role) {
    switch (role) {
        case Role::Sender: return "SENDER";
        case Role::Recipient: return "RECIPIENT";
        case Role::Signer: return "SIGNER";
        default: return "UNKNOWN";
    }
}

#define DHOLE_LOG_KEY(role, operation, key_name, data) \
    do { \
        fprintf(stdout, "[DHOLE-DEBUG] %s %s %s: %s\n", \
            ::dhole::debug::RoleToString(role), \
            operation, \
            key_name, \
            ::dhole::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define DHOLE_LOG_VALUE(role, operation, name, value) \
    do { \
        fprintf(stdout, "[DHOLE-DEBUG] %s %s %s: %s\n", \
            ::dhole::debug::RoleToString(role), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define DHOLE_LOG_MSG(role, operation, message) \
    do { \
        fprintf(stdout, "[DHOLE-DEBUG] %s %s %s\n", \
            ::dhole::debug::RoleToString(role), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define DHOLE_LOG_SECTION(role, section_name) \
    do { \
        fprintf(stdout, "[DHOLE-DEBUG] %s ========== %s ==========\n", \
            ::dhole::debug::RoleToString(role), \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Key Exchange
// ============================================================================

inline void LogKeyExchange(
    Role role,
    bool outbound,
    std::span<const uint8_t> own_public,
    std::span<const uint8_t> peer_public,
    std::span<const uint8_t> shared_secret,
    uint8_t direction_byte,
    std::span<const uint8_t> derived_key) {

    DHOLE_LOG_SECTION(role, outbound ? "KEY EXCHANGE (OUTBOUND)" : "KEY EXCHANGE (INBOUND)");
    DHOLE_LOG_KEY(role, "KX", "own_public", own_public);
    DHOLE_LOG_KEY(role, "KX", "peer_public", peer_public);
    DHOLE_LOG_KEY(role, "KX", "shared_secret", shared_secret);
    DHOLE_LOG_VALUE(role, "KX", "direction_byte", static_cast<unsigned>(direction_byte));
    DHOLE_LOG_KEY(role, "KX", "derived_key (HKDF output)", derived_key);
}

// ============================================================================
// Framing
// ============================================================================

inline void LogEncryption(
    Role role,
    uint8_t version,
    std::span<const uint8_t> nonce,
    size_t plaintext_size) {

    DHOLE_LOG_SECTION(role, "ENCRYPT");
    DHOLE_LOG_VALUE(role, "ENCRYPT", "version", static_cast<unsigned>(version));
    DHOLE_LOG_KEY(role, "ENCRYPT", "nonce", nonce);
    DHOLE_LOG_VALUE(role, "ENCRYPT", "plaintext_size", plaintext_size);
}

inline void LogDecryption(
    Role role,
    uint8_t version,
    std::span<const uint8_t> nonce,
    bool authenticated) {

    DHOLE_LOG_SECTION(role, "DECRYPT");
    DHOLE_LOG_VALUE(role, "DECRYPT", "version", static_cast<unsigned>(version));
    DHOLE_LOG_KEY(role, "DECRYPT", "nonce", nonce);
    DHOLE_LOG_MSG(role, "DECRYPT", authenticated ? "authenticated: YES" : "authenticated: NO");
}

inline void LogSeal(
    Role role,
    std::span<const uint8_t> ephemeral_public,
    std::span<const uint8_t> nonce) {

    DHOLE_LOG_SECTION(role, role == Role::Sender ? "SEAL" : "UNSEAL");
    DHOLE_LOG_KEY(role, "SEAL", "ephemeral_public", ephemeral_public);
    DHOLE_LOG_KEY(role, "SEAL", "derived_nonce", nonce);
}

inline void LogSignature(
    Role role,
    std::span<const uint8_t> prehash,
    std::span<const uint8_t> signature) {

    DHOLE_LOG_KEY(role, "SIGN", "prehash", prehash);
    DHOLE_LOG_KEY(role, "SIGN", "signature", signature);
}

#else // !DHOLE_DEBUG_KEYS

#define DHOLE_LOG_KEY(role, operation, key_name, data) ((void)0)
#define DHOLE_LOG_VALUE(role, operation, name, value) ((void)0)
#define DHOLE_LOG_MSG(role, operation, message) ((void)0)
#define DHOLE_LOG_SECTION(role, section_name) ((void)0)

inline void LogKeyExchange(Role, bool, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>, uint8_t, std::span<const uint8_t>) {}
inline void LogEncryption(Role, uint8_t, std::span<const uint8_t>, size_t) {}
inline void LogDecryption(Role, uint8_t, std::span<const uint8_t>, bool) {}
inline void LogSeal(Role, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSignature(Role, std::span<const uint8_t>, std::span<const uint8_t>) {}

#endif // DHOLE_DEBUG_KEYS

} // namespace dhole::debug
