#include "dhole/protocol/channel_codec.hpp"
#include "dhole/protocol/key_exchange.hpp"
#include "dhole/protocol/symmetric_codec.hpp"

#include <format>

namespace dhole::protocol {

Result<std::vector<uint8_t>, ProtocolFailure> ChannelCodec::Encrypt(
    std::span<const uint8_t> message,
    const models::SecretKey& sender_secret,
    const models::PublicKey& recipient_public,
    const ProtocolConfig& config) {

    if (!config.AllowsMessage(message.size())) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                std::format("Message of {} bytes exceeds configured maximum {}",
                    message.size(), config.MaxMessageBytes())));
    }

    auto key = KeyExchange::Derive(sender_secret, recipient_public, enums::KeyDirection::Outbound);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<std::vector<uint8_t>>();
    }
    return SymmetricCodec::Encrypt(message, key.Unwrap(), {}, config);
}

Result<std::vector<uint8_t>, ProtocolFailure> ChannelCodec::Decrypt(
    std::span<const uint8_t> encrypted,
    const models::SecretKey& recipient_secret,
    const models::PublicKey& sender_public,
    const ProtocolConfig& config) {

    if (auto framing = SymmetricCodec::ValidateFraming(encrypted, config); framing.IsErr()) {
        return std::move(framing).PropagateErr<std::vector<uint8_t>>();
    }

    auto key = KeyExchange::Derive(recipient_secret, sender_public, enums::KeyDirection::Inbound);
    if (key.IsErr()) {
        return std::move(key).PropagateErr<std::vector<uint8_t>>();
    }
    return SymmetricCodec::Decrypt(encrypted, key.Unwrap(), {}, config);
}

} // namespace dhole::protocol
