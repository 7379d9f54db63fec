#include "dhole/models/keys/public_key.hpp"

#include <algorithm>
#include <format>

namespace dhole::protocol::models {

Result<PublicKey, ProtocolFailure> PublicKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::PUBLIC_KEY_SIZE) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyLength(
                std::format("Public key must be {} bytes, got {}",
                    Constants::PUBLIC_KEY_SIZE, bytes.size())));
    }
    Bytes copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return Result<PublicKey, ProtocolFailure>::Ok(PublicKey(copy));
}

} // namespace dhole::protocol::models
