#include "dhole/models/signature.hpp"

#include <algorithm>
#include <format>

namespace dhole::protocol::models {

Result<Signature, ProtocolFailure> Signature::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::SIGNATURE_SIZE) {
        return Result<Signature, ProtocolFailure>::Err(
            ProtocolFailure::SignatureLength(
                std::format("Signature must be {} bytes, got {}",
                    Constants::SIGNATURE_SIZE, bytes.size())));
    }
    Bytes copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return Result<Signature, ProtocolFailure>::Ok(Signature(copy));
}

} // namespace dhole::protocol::models
