#include "dhole/models/keys/key_pair.hpp"

namespace dhole::protocol::models {

Result<KeyPair, ProtocolFailure> KeyPair::Generate() {
    auto secret = SecretKey::Generate();
    if (secret.IsErr()) {
        return std::move(secret).PropagateErr<KeyPair>();
    }
    return Result<KeyPair, ProtocolFailure>::Ok(KeyPair(std::move(secret).Unwrap()));
}

} // namespace dhole::protocol::models
