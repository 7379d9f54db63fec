#include <catch2/catch_test_macros.hpp>
#include "dhole/protocol/channel_codec.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::models;
using namespace dhole::protocol::test_helpers;
using dhole::protocol::configuration::ProtocolConfig;

TEST_CASE("ChannelCodec - Fox and wolf", "[channel][protocol][kat]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto fox = SecretKeyFromHex(fox_wolf::FOX_SECRET);
    const auto wolf = SecretKeyFromHex(fox_wolf::WOLF_SECRET);
    const auto message = Bytes(fox_wolf::MESSAGE);

    SECTION("Wolf decrypts the reference message from fox") {
        auto result = ChannelCodec::Decrypt(
            FromHex(fox_wolf::ENCRYPTED_FOX_TO_WOLF), wolf, fox.GetPublicKey());
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == message);
    }
    SECTION("Fox cannot decrypt its own outbound message") {
        auto result = ChannelCodec::Decrypt(
            FromHex(fox_wolf::ENCRYPTED_FOX_TO_WOLF), fox, wolf.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Authentication);
    }
    SECTION("Replies travel on the other direction key") {
        auto reply = ChannelCodec::Encrypt(message, wolf, fox.GetPublicKey()).Unwrap();
        REQUIRE(ChannelCodec::Decrypt(reply, fox, wolf.GetPublicKey()).Unwrap() == message);
        REQUIRE(ChannelCodec::Decrypt(reply, wolf, fox.GetPublicKey()).IsErr());
    }
}

TEST_CASE("ChannelCodec - Generated parties", "[channel][protocol]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto alice = GenerateKeyPair();
    const auto bob = GenerateKeyPair();
    const auto eve = GenerateKeyPair();
    const auto message = Bytes("meet at the river at dawn");

    SECTION("Round trip") {
        auto encrypted = ChannelCodec::Encrypt(message, alice.GetSecretKey(), bob.GetPublicKey());
        REQUIRE(encrypted.IsOk());
        REQUIRE(encrypted.Unwrap().size() == message.size() + WireFormat::ENCRYPTED_OVERHEAD);
        auto decrypted = ChannelCodec::Decrypt(encrypted.Unwrap(), bob.GetSecretKey(), alice.GetPublicKey());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == message);
    }
    SECTION("Wrong claimed sender") {
        auto encrypted = ChannelCodec::Encrypt(message, alice.GetSecretKey(), bob.GetPublicKey()).Unwrap();
        auto result = ChannelCodec::Decrypt(encrypted, bob.GetSecretKey(), eve.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Authentication);
    }
    SECTION("Wrong recipient") {
        auto encrypted = ChannelCodec::Encrypt(message, alice.GetSecretKey(), bob.GetPublicKey()).Unwrap();
        auto result = ChannelCodec::Decrypt(encrypted, eve.GetSecretKey(), alice.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Authentication);
    }
    SECTION("Encrypting to oneself is refused") {
        auto result = ChannelCodec::Encrypt(message, alice.GetSecretKey(), alice.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DegenerateKey);
    }
    SECTION("Malformed framing is reported before key agreement") {
        const std::vector<uint8_t> bogus = {0x07, 0x00, 0x00};
        auto result = ChannelCodec::Decrypt(bogus, bob.GetSecretKey(), bob.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnsupportedVersion);
    }
    SECTION("Configured size limit applies to both ends") {
        const auto tight = ProtocolConfig::Default().WithMaxMessageBytes(8);
        auto refused = ChannelCodec::Encrypt(message, alice.GetSecretKey(), bob.GetPublicKey(), tight);
        REQUIRE(refused.UnwrapErr().type == ProtocolFailureType::InvalidInput);

        auto encrypted = ChannelCodec::Encrypt(message, alice.GetSecretKey(), bob.GetPublicKey()).Unwrap();
        auto rejected = ChannelCodec::Decrypt(encrypted, bob.GetSecretKey(), alice.GetPublicKey(), tight);
        REQUIRE(rejected.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
