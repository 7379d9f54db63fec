#include "dhole/crypto/hkdf.hpp"
#include "dhole/core/constants.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <format>
#include <memory>
#include <string>

namespace dhole::protocol::crypto {

namespace {
    using OpenSSL = OpenSSLConstants;

    struct EvpKdfDeleter {
        void operator()(EVP_KDF* kdf) const {
            EVP_KDF_free(kdf);
        }
    };
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EvpKdfPtr = std::unique_ptr<EVP_KDF, EvpKdfDeleter>;
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("HKDF output length {} outside [1, {}]", output.size(), MAX_OUTPUT_LEN)));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    const EvpKdfPtr kdf(EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_HKDF, nullptr));
    if (!kdf) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                std::format("Failed to fetch HKDF algorithm: {}", GetOpenSSLError())));
    }
    const EvpKdfCtxPtr ctx(EVP_KDF_CTX_new(kdf.get()));
    if (!ctx) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                std::format("Failed to create HKDF context: {}", GetOpenSSLError())));
    }

    OSSL_PARAM params[5];
    size_t count = 0;
    params[count++] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST, const_cast<char*>(OpenSSL::ALGORITHM_SHA256), 0);
    params[count++] = OSSL_PARAM_construct_octet_string(
        OpenSSL::PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[count++] = OSSL_PARAM_construct_octet_string(
            OpenSSL::PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[count++] = OSSL_PARAM_construct_octet_string(
            OpenSSL::PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[count] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey(
                std::format("HKDF key derivation failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    if (auto derived = DeriveKey(ikm, output, salt, info); derived.IsErr()) {
        return std::move(derived).PropagateErr<std::vector<uint8_t>>();
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

} // namespace dhole::protocol::crypto
