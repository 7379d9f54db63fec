#pragma once

#include "dhole/core/result.hpp"
#include "dhole/core/failures.hpp"
#include "dhole/models/keys/secret_key.hpp"
#include "dhole/models/keys/public_key.hpp"

#include <utility>

namespace dhole::protocol::models {

class KeyPair {
public:
    static Result<KeyPair, ProtocolFailure> Generate();

    explicit KeyPair(SecretKey secret_key)
        : public_key_(secret_key.GetPublicKey())
        , secret_key_(std::move(secret_key)) {}

    KeyPair(KeyPair&&) noexcept = default;
    KeyPair& operator=(KeyPair&&) noexcept = default;
    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;

    [[nodiscard]] const SecretKey& GetSecretKey() const noexcept {
        return secret_key_;
    }

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }

    [[nodiscard]] SecretKey TakeSecretKey() && {
        return std::move(secret_key_);
    }

private:
    PublicKey public_key_;
    SecretKey secret_key_;
};

} // namespace dhole::protocol::models
