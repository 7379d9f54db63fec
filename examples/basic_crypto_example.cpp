/**
 * @file basic_crypto_example.cpp
 * @brief Fox sends wolf an authenticated message, a sealed note and a signature
 */

#include "dhole/crypto/sodium_interop.hpp"
#include "dhole/models/keys/key_pair.hpp"
#include "dhole/protocol/channel_codec.hpp"
#include "dhole/protocol/seal_codec.hpp"
#include "dhole/protocol/signature_codec.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace dhole::protocol;
using namespace dhole::protocol::crypto;
using namespace dhole::protocol::models;

namespace {

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

std::span<const uint8_t> as_bytes(const std::string& text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::string as_text(const std::vector<uint8_t>& bytes) {
    return {bytes.begin(), bytes.end()};
}

int fail(const std::string& step, const ProtocolFailure& failure) {
    std::cerr << step << " failed: [" << ToString(failure.type) << "] "
              << failure.message << std::endl;
    return 1;
}

}

int main() {
    std::cout << "=== dhole - Basic Crypto Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating key pairs for fox and wolf..." << std::endl;
    auto fox_result = KeyPair::Generate();
    if (fox_result.IsErr()) {
        return fail("Fox key generation", fox_result.UnwrapErr());
    }
    auto wolf_result = KeyPair::Generate();
    if (wolf_result.IsErr()) {
        return fail("Wolf key generation", wolf_result.UnwrapErr());
    }
    const auto fox = std::move(fox_result).Unwrap();
    const auto wolf = std::move(wolf_result).Unwrap();
    print_hex("   Fox public key ", fox.GetPublicKey().AsSpan());
    print_hex("   Wolf public key", wolf.GetPublicKey().AsSpan());
    std::cout << "   Secret keys: [SECURE - stored in protected memory]" << std::endl;
    std::cout << std::endl;

    const std::string message = "The quick brown fox jumps over the lazy wolf";

    std::cout << "3. Fox encrypts to wolf..." << std::endl;
    auto encrypted = ChannelCodec::Encrypt(as_bytes(message), fox.GetSecretKey(), wolf.GetPublicKey());
    if (encrypted.IsErr()) {
        return fail("Encrypt", encrypted.UnwrapErr());
    }
    print_hex("   Encrypted", encrypted.Unwrap());
    auto decrypted = ChannelCodec::Decrypt(encrypted.Unwrap(), wolf.GetSecretKey(), fox.GetPublicKey());
    if (decrypted.IsErr()) {
        return fail("Decrypt", decrypted.UnwrapErr());
    }
    std::cout << "   ✓ Wolf reads: " << as_text(decrypted.Unwrap()) << std::endl;
    std::cout << std::endl;

    std::cout << "4. Anonymous note sealed to wolf..." << std::endl;
    auto sealed = SealCodec::Seal(as_bytes(message), wolf.GetPublicKey());
    if (sealed.IsErr()) {
        return fail("Seal", sealed.UnwrapErr());
    }
    print_hex("   Sealed", sealed.Unwrap());
    auto unsealed = SealCodec::Unseal(sealed.Unwrap(), wolf.GetSecretKey());
    if (unsealed.IsErr()) {
        return fail("Unseal", unsealed.UnwrapErr());
    }
    std::cout << "   ✓ Wolf reads: " << as_text(unsealed.Unwrap()) << std::endl;
    std::cout << std::endl;

    std::cout << "5. Fox signs the message..." << std::endl;
    auto signature = SignatureCodec::Sign(as_bytes(message), fox.GetSecretKey());
    if (signature.IsErr()) {
        return fail("Sign", signature.UnwrapErr());
    }
    print_hex("   Signature", signature.Unwrap().AsSpan());
    const bool by_fox = SignatureCodec::Verify(as_bytes(message), fox.GetPublicKey(), signature.Unwrap());
    const bool by_wolf = SignatureCodec::Verify(as_bytes(message), wolf.GetPublicKey(), signature.Unwrap());
    std::cout << "   Verifies under fox key:  " << (by_fox ? "true" : "false") << std::endl;
    std::cout << "   Verifies under wolf key: " << (by_wolf ? "true" : "false") << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return by_fox && !by_wolf ? 0 : 1;
}
