#include <catch2/catch_test_macros.hpp>
#include "dhole/protocol/signature_codec.hpp"
#include "dhole/configuration/protocol_config.hpp"
#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::models;
using namespace dhole::protocol::test_helpers;
using dhole::protocol::configuration::ProtocolConfig;

TEST_CASE("SignatureCodec - Known answers", "[signature][protocol][kat]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto fox = SecretKeyFromHex(fox_wolf::FOX_SECRET);
    const auto wolf = SecretKeyFromHex(fox_wolf::WOLF_SECRET);
    const auto message = Bytes(fox_wolf::MESSAGE);

    SECTION("Fox signature") {
        auto sig = SignatureCodec::Sign(message, fox);
        REQUIRE(sig.IsOk());
        REQUIRE(sig.Unwrap().ToVector() == FromHex(fox_wolf::FOX_SIGNATURE));
    }
    SECTION("Wolf signature") {
        REQUIRE(SignatureCodec::Sign(message, wolf).Unwrap().ToVector() == FromHex(fox_wolf::WOLF_SIGNATURE));
    }
    SECTION("Each signature verifies only under its signer") {
        const auto fox_sig = FromHex(fox_wolf::FOX_SIGNATURE);
        REQUIRE(SignatureCodec::Verify(message, fox.GetPublicKey(), fox_sig).Unwrap());
        REQUIRE_FALSE(SignatureCodec::Verify(message, wolf.GetPublicKey(), fox_sig).Unwrap());
    }
    SECTION("Not a plain Ed25519 signature over the message") {
        const auto fox_sig = FromHex(fox_wolf::FOX_SIGNATURE);
        REQUIRE_FALSE(crypto::Curve25519::VerifyDetached(fox.GetPublicKey().AsSpan(), message, fox_sig));
    }
}

TEST_CASE("SignatureCodec - Verification", "[signature][protocol]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto signer = GenerateKeyPair();
    const auto message = Bytes("signed and sealed");
    const auto signature = SignatureCodec::Sign(message, signer.GetSecretKey()).Unwrap();

    SECTION("Deterministic") {
        REQUIRE(SignatureCodec::Sign(message, signer.GetSecretKey()).Unwrap() == signature);
    }
    SECTION("Valid signature") {
        REQUIRE(SignatureCodec::Verify(message, signer.GetPublicKey(), signature));
    }
    SECTION("Altered message") {
        auto altered = message;
        altered[0] ^= 0x20;
        REQUIRE_FALSE(SignatureCodec::Verify(altered, signer.GetPublicKey(), signature));
    }
    SECTION("Altered signature") {
        auto bytes = signature.ToVector();
        bytes[10] ^= 0x01;
        REQUIRE_FALSE(SignatureCodec::Verify(message, signer.GetPublicKey(), bytes).Unwrap());
    }
    SECTION("Empty message can be signed") {
        auto empty_sig = SignatureCodec::Sign({}, signer.GetSecretKey());
        REQUIRE(empty_sig.IsOk());
        REQUIRE(SignatureCodec::Verify({}, signer.GetPublicKey(), empty_sig.Unwrap()));
    }
    SECTION("Wrong signature length is an error, not a mismatch") {
        auto bytes = signature.ToVector();
        bytes.pop_back();
        auto result = SignatureCodec::Verify(message, signer.GetPublicKey(), bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::SignatureLength);
    }
    SECTION("Messages above the codec size limit still sign and verify") {
        const std::vector<uint8_t> large(ProtocolConfig::Default().MaxMessageBytes() + 1, 0x5A);
        auto large_sig = SignatureCodec::Sign(large, signer.GetSecretKey());
        REQUIRE(large_sig.IsOk());
        REQUIRE(SignatureCodec::Verify(large, signer.GetPublicKey(), large_sig.Unwrap()));
    }
}
