#pragma once

#include <cstdint>

namespace dhole::protocol::enums {

/**
 * @brief Which half of a two-party channel a derived key protects
 *
 * The party that encrypts derives with Outbound; the party that decrypts
 * the same traffic derives with Inbound. Swapping roles yields the key for
 * the opposite direction, so the two traffic directions never share a key.
 */
enum class KeyDirection : uint8_t {
    Outbound = 0,
    Inbound = 1
};

constexpr const char* ToString(KeyDirection direction) noexcept {
    switch (direction) {
        case KeyDirection::Outbound:
            return "Outbound";
        case KeyDirection::Inbound:
            return "Inbound";
        default:
            return "Unknown";
    }
}

} // namespace dhole::protocol::enums
