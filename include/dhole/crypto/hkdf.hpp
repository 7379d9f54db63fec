#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dhole::protocol::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 through OpenSSL's EVP_KDF interface
 *
 * Every key the protocol derives goes through here: the directional
 * channel key (info "Dhole-KeyExchange-v1") and the MAC sub-key
 * (info "Dhole-Auth-v1"). An empty salt means HashLen zero bytes.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into a caller-owned buffer
     *
     * @param ikm Input key material, must not be empty
     * @param output Filled entirely; at most MAX_OUTPUT_LEN bytes
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace dhole::protocol::crypto
