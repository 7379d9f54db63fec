#include <catch2/catch_test_macros.hpp>
#include "dhole/crypto/curve25519.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <array>
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::crypto;
using dhole::protocol::test_helpers::Bytes;
using dhole::protocol::test_helpers::FromHex;

namespace {

// RFC 8032, section 7.1, TEST 1
const std::vector<uint8_t> kSeed =
    FromHex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
const std::vector<uint8_t> kPublic =
    FromHex("d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
const std::vector<uint8_t> kEmptySignature = FromHex(
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
    "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");

template<size_t N>
std::vector<uint8_t> ToVector(const std::array<uint8_t, N>& bytes) {
    return {bytes.begin(), bytes.end()};
}

}

TEST_CASE("Curve25519 - Ed25519 RFC 8032", "[crypto][curve25519][kat]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Seed derives the published public key") {
        std::array<uint8_t, Constants::PUBLIC_KEY_SIZE> pk{};
        REQUIRE(Curve25519::DerivePublicKey(kSeed, pk).IsOk());
        REQUIRE(ToVector(pk) == kPublic);
    }
    SECTION("Signature over the empty message") {
        std::array<uint8_t, Constants::SIGNATURE_SIZE> sig{};
        REQUIRE(Curve25519::SignDetached(kSeed, {}, sig).IsOk());
        REQUIRE(ToVector(sig) == kEmptySignature);
        REQUIRE(Curve25519::VerifyDetached(kPublic, {}, sig));
    }
    SECTION("Verification rejects a different message") {
        const auto message = Bytes("x");
        REQUIRE_FALSE(Curve25519::VerifyDetached(kPublic, message, kEmptySignature));
    }
    SECTION("Verification rejects malformed lengths") {
        const std::vector<uint8_t> short_pk(31, 0x00);
        const std::vector<uint8_t> short_sig(63, 0x00);
        REQUIRE_FALSE(Curve25519::VerifyDetached(short_pk, {}, kEmptySignature));
        REQUIRE_FALSE(Curve25519::VerifyDetached(kPublic, {}, short_sig));
    }
}

TEST_CASE("Curve25519 - X25519 RFC 7748", "[crypto][curve25519][kat]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Scalar multiplication test vector") {
        const auto scalar = FromHex("a546e36bf0527c9d3b16154b82465edd62144c0ac1fc5a18506a2244ba449ac4");
        const auto u = FromHex("e6db6867583030db3594c1a424b15f7c726624ec26b3353b10a903a6d0ab1c4c");
        std::array<uint8_t, Constants::X_25519_SHARED_SECRET_SIZE> shared{};
        REQUIRE(Curve25519::Ecdh(scalar, u, shared).IsOk());
        REQUIRE(ToVector(shared) ==
                FromHex("c3da55379de9c6908e94ea4df28d084f32eccf03491c71f754b4075577a28552"));
    }
    SECTION("All-zero result is rejected") {
        const auto scalar = FromHex("a546e36bf0527c9d3b16154b82465edd62144c0ac1fc5a18506a2244ba449ac4");
        const std::vector<uint8_t> zero(32, 0x00);
        std::array<uint8_t, Constants::X_25519_SHARED_SECRET_SIZE> shared{};
        auto result = Curve25519::Ecdh(scalar, zero, shared);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DegenerateKey);
    }
}

TEST_CASE("Curve25519 - Birational conversion", "[crypto][curve25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::array<uint8_t, Constants::X_25519_SCALAR_SIZE> scalar{};
    std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE> converted{};
    REQUIRE(Curve25519::ToMontgomerySecret(kSeed, scalar).IsOk());
    REQUIRE(Curve25519::ToMontgomeryPublic(kPublic, converted).IsOk());

    SECTION("Converted secret is the clamped SHA-512 half of the seed") {
        REQUIRE(ToVector(scalar) ==
                FromHex("307c83864f2833cb427a2ef1c00a013cfdff2768d980c0a3a520f006904de94f"));
    }
    SECTION("Converted public key is the Montgomery u-coordinate") {
        REQUIRE(ToVector(converted) ==
                FromHex("d85e07ec22b0ad881537c2f44d662d1a143cf830c57aca4305d85c7a90f6b62e"));
    }
    SECTION("Both conversions describe the same point") {
        std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE> from_scalar{};
        REQUIRE(crypto_scalarmult_base(from_scalar.data(), scalar.data()) == 0);
        REQUIRE(from_scalar == converted);
    }
}

TEST_CASE("Curve25519 - Input validation", "[crypto][curve25519]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Short seed") {
        const std::vector<uint8_t> seed(31, 0x01);
        std::array<uint8_t, Constants::PUBLIC_KEY_SIZE> pk{};
        auto result = Curve25519::DerivePublicKey(seed, pk);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKeyLength);
    }
    SECTION("Signature buffer of the wrong size") {
        std::array<uint8_t, 32> sig{};
        REQUIRE(Curve25519::SignDetached(kSeed, {}, sig).IsErr());
    }
    SECTION("Edwards identity point does not convert") {
        auto identity = FromHex("0100000000000000000000000000000000000000000000000000000000000000");
        std::array<uint8_t, Constants::X_25519_PUBLIC_KEY_SIZE> out{};
        auto result = Curve25519::ToMontgomeryPublic(identity, out);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DegenerateKey);
    }
}
