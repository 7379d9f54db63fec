#include <catch2/catch_test_macros.hpp>
#include "dhole/security/validation/dh_validator.hpp"
#include "dhole/core/constants.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <array>
#include <string>
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::security;
using dhole::protocol::test_helpers::FromHex;

namespace {

void RequireDegenerate(const std::vector<uint8_t>& key) {
    auto result = DhValidator::ValidateX25519PublicKey(key);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DegenerateKey);
}

}

TEST_CASE("DhValidator - Valid X25519 public keys", "[dh_validator][security]") {
    SECTION("RFC 7748 Alice public key") {
        auto key = FromHex("8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsOk());
    }
    SECTION("RFC 7748 Bob public key") {
        auto key = FromHex("de9edb7d7b7dc1b4d35b61c2ece435373f8343c85b78674dadfc7e146f882b4f");
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsOk());
    }
    SECTION("Base point u = 9") {
        std::vector<uint8_t> key(32, 0x00);
        key[0] = 0x09;
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsOk());
    }
    SECTION("Bit 255 is ignored") {
        std::vector<uint8_t> key(32, 0x00);
        key[0] = 0x09;
        key[31] = 0x80;
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsOk());
    }
}

TEST_CASE("DhValidator - Invalid key size", "[dh_validator][security]") {
    SECTION("Too short") {
        std::vector<uint8_t> key(31, 0x42);
        auto result = DhValidator::ValidateX25519PublicKey(key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKeyLength);
        REQUIRE(result.UnwrapErr().message.find("Invalid X25519 public key size") != std::string::npos);
    }
    SECTION("Too long") {
        std::vector<uint8_t> key(33, 0x42);
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).UnwrapErr().type ==
                ProtocolFailureType::InvalidKeyLength);
    }
    SECTION("Empty") {
        std::vector<uint8_t> key;
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsErr());
    }
}

TEST_CASE("DhValidator - Small-order points", "[dh_validator][security]") {
    SECTION("Zero") {
        RequireDegenerate(std::vector<uint8_t>(32, 0x00));
    }
    SECTION("One") {
        auto key = FromHex("0100000000000000000000000000000000000000000000000000000000000000");
        RequireDegenerate(key);
    }
    SECTION("Order-8 points") {
        RequireDegenerate(FromHex("e0eb7a7c3b41b8ae1656e3faf19fc46ada098deb9c32b1fd866205165f49b800"));
        RequireDegenerate(FromHex("5f9c95bca3508c24b1d0b1559c83ef5b04445cc4581c8e86d8224eddd09f1157"));
    }
    SECTION("p - 1") {
        RequireDegenerate(FromHex("ecffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f"));
    }
    SECTION("Non-canonical encodings of 0 and 1") {
        RequireDegenerate(FromHex("edffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f"));
        RequireDegenerate(FromHex("eeffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f"));
    }
    SECTION("Small-order point with bit 255 set") {
        RequireDegenerate(FromHex("0100000000000000000000000000000000000000000000000000000000000080"));
    }
    SECTION("Message names the small-order check") {
        auto result = DhValidator::ValidateX25519PublicKey(std::vector<uint8_t>(32, 0x00));
        REQUIRE(result.UnwrapErr().message.find("small-order") != std::string::npos);
    }
}

TEST_CASE("DhValidator - Field element range", "[dh_validator][security]") {
    SECTION("p + 2 is not canonical") {
        auto key = FromHex("efffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f");
        auto result = DhValidator::ValidateX25519PublicKey(key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DegenerateKey);
        REQUIRE(result.UnwrapErr().message.find("field element") != std::string::npos);
    }
    SECTION("All 0xFF is not canonical") {
        RequireDegenerate(std::vector<uint8_t>(32, 0xFF));
    }
    SECTION("p - 2 is canonical") {
        auto key = FromHex("ebffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff7f");
        REQUIRE(DhValidator::ValidateX25519PublicKey(key).IsOk());
    }
}
