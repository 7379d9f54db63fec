#include <catch2/catch_test_macros.hpp>
#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/core/constants.hpp"
#include "helpers/fox_wolf_vectors.hpp"
#include <algorithm>
#include <array>
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::crypto;
using dhole::protocol::test_helpers::Bytes;
using dhole::protocol::test_helpers::FromHex;

namespace {
    template<typename View>
    constexpr bool WipeAccepts = requires(View view) { SodiumInterop::SecureWipe(view); };
}

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Repeated Initialize calls are harmless") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Small buffer is zeroed") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Buffer above the small-buffer threshold is zeroed") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD * 4, 0xA5);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Only mutable views can be wiped") {
        STATIC_REQUIRE(WipeAccepts<std::span<uint8_t>>);
        STATIC_REQUIRE_FALSE(WipeAccepts<std::span<const uint8_t>>);
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> a = {1, 2, 3, 4, 5};
    SECTION("Equal buffers") {
        const std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Last byte differs") {
        const std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Length mismatch is unequal, not an error") {
        const std::vector<uint8_t> b = {1, 2, 3, 4};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }
    SECTION("Two empty buffers are equal") {
        const std::vector<uint8_t> empty;
        REQUIRE(SodiumInterop::ConstantTimeEquals(empty, empty).Unwrap());
    }
}

TEST_CASE("SodiumInterop - Randomness", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("GetRandomBytes returns the requested length") {
        auto result = SodiumInterop::GetRandomBytes(Constants::XCHACHA20_POLY1305_NONCE_SIZE);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == Constants::XCHACHA20_POLY1305_NONCE_SIZE);
    }
    SECTION("Zero bytes is allowed") {
        auto result = SodiumInterop::GetRandomBytes(0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().empty());
    }
    SECTION("Two draws differ") {
        auto first = SodiumInterop::GetRandomBytes(32).Unwrap();
        auto second = SodiumInterop::GetRandomBytes(32).Unwrap();
        REQUIRE(first != second);
    }
    SECTION("FillRandom overwrites the buffer") {
        std::array<uint8_t, 64> buffer{};
        REQUIRE(SodiumInterop::FillRandom(buffer).IsOk());
        REQUIRE_FALSE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Oversized request is rejected") {
        auto result = SodiumInterop::GetRandomBytes(SodiumInterop::MAX_BUFFER_SIZE + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("SodiumInterop - Generic Hash", "[sodium][crypto][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("BLAKE2b-512 of the empty string") {
        std::array<uint8_t, 64> digest{};
        REQUIRE(SodiumInterop::GenericHash(digest, {}).IsOk());
        REQUIRE(std::vector<uint8_t>(digest.begin(), digest.end()) == FromHex(
            "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
            "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce"));
    }
    SECTION("BLAKE2b-512 of \"abc\"") {
        const auto abc = Bytes("abc");
        std::array<uint8_t, 64> digest{};
        REQUIRE(SodiumInterop::GenericHash(digest, {abc}).IsOk());
        REQUIRE(std::vector<uint8_t>(digest.begin(), digest.end()) == FromHex(
            "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
            "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923"));
    }
    SECTION("Output length is part of the digest") {
        const auto abc = Bytes("abc");
        std::array<uint8_t, 24> digest{};
        REQUIRE(SodiumInterop::GenericHash(digest, {abc}).IsOk());
        REQUIRE(std::vector<uint8_t>(digest.begin(), digest.end()) ==
                FromHex("56a17e38cc371a46b12c32f18e0c61de2a84e9c2555b114e"));
    }
    SECTION("Parts are hashed as one concatenated input") {
        const auto fox = Bytes("fox");
        const auto wolf = Bytes("wolf");
        const auto foxwolf = Bytes("foxwolf");
        std::array<uint8_t, 32> split{};
        std::array<uint8_t, 32> joined{};
        REQUIRE(SodiumInterop::GenericHash(split, {fox, wolf}).IsOk());
        REQUIRE(SodiumInterop::GenericHash(joined, {foxwolf}).IsOk());
        REQUIRE(split == joined);
        REQUIRE(std::vector<uint8_t>(split.begin(), split.end()) ==
                FromHex("31fa19f7250bfd232c6f25360ac4cab12c3c8f19c7623162dcd55bb921f8912f"));
    }
    SECTION("Output shorter than 16 bytes is rejected") {
        std::array<uint8_t, 8> digest{};
        auto result = SodiumInterop::GenericHash(digest, {});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Output longer than 64 bytes is rejected") {
        std::array<uint8_t, 65> digest{};
        REQUIRE(SodiumInterop::GenericHash(digest, {}).IsErr());
    }
}
