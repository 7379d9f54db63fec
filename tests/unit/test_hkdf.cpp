#include <catch2/catch_test_macros.hpp>
#include "dhole/crypto/hkdf.hpp"
#include "dhole/crypto/sodium_interop.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <algorithm>
#include <array>
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::crypto;
using dhole::protocol::test_helpers::Bytes;
using dhole::protocol::test_helpers::FromHex;

TEST_CASE("HKDF-SHA256 - RFC 5869 vectors", "[crypto][hkdf][kat]") {
    SECTION("Test case 1: salt and info") {
        const std::vector<uint8_t> ikm(22, 0x0b);
        const auto salt = FromHex("000102030405060708090a0b0c");
        const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
        auto okm = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
        REQUIRE(okm.IsOk());
        REQUIRE(okm.Unwrap() == FromHex(
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf"
            "34007208d5b887185865"));
    }
    SECTION("Test case 3: no salt, no info") {
        const std::vector<uint8_t> ikm(22, 0x0b);
        auto okm = Hkdf::DeriveKeyBytes(ikm, 42);
        REQUIRE(okm.IsOk());
        REQUIRE(okm.Unwrap() == FromHex(
            "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d"
            "9d201395faa4b61a96c8"));
    }
    SECTION("Span output matches vector output") {
        const std::vector<uint8_t> ikm(22, 0x0b);
        std::array<uint8_t, 42> out{};
        REQUIRE(Hkdf::DeriveKey(ikm, out).IsOk());
        REQUIRE(std::vector<uint8_t>(out.begin(), out.end()) == Hkdf::DeriveKeyBytes(ikm, 42).Unwrap());
    }
}

TEST_CASE("HKDF-SHA256 - Domain separation", "[crypto][hkdf]") {
    const std::vector<uint8_t> ikm(32, 0x42);
    SECTION("MAC sub-key label") {
        auto okm = Hkdf::DeriveKeyBytes(ikm, 32, {}, Bytes("Dhole-Auth-v1"));
        REQUIRE(okm.Unwrap() ==
                FromHex("628d16cebb9bd01021456262339ce2b7f43aca42d1db3e41dfd7e4287eeefa8c"));
    }
    SECTION("Different info yields unrelated output") {
        auto a = Hkdf::DeriveKeyBytes(ikm, 32, {}, Bytes("fox"));
        auto b = Hkdf::DeriveKeyBytes(ikm, 32, {}, Bytes("wolf"));
        REQUIRE(a.Unwrap() != b.Unwrap());
    }
    SECTION("Shorter output is a prefix of longer output") {
        auto short_okm = Hkdf::DeriveKeyBytes(ikm, 16, {}, Bytes("fox")).Unwrap();
        auto long_okm = Hkdf::DeriveKeyBytes(ikm, 64, {}, Bytes("fox")).Unwrap();
        REQUIRE(std::equal(short_okm.begin(), short_okm.end(), long_okm.begin()));
    }
}

TEST_CASE("HKDF-SHA256 - Parameter validation", "[crypto][hkdf]") {
    const std::vector<uint8_t> ikm(32, 0x42);
    SECTION("Empty input key material") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Zero-length output") {
        auto result = Hkdf::DeriveKeyBytes(ikm, 0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Maximum output length is accepted") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == Hkdf::MAX_OUTPUT_LEN);
    }
    SECTION("One byte past the maximum is rejected") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
