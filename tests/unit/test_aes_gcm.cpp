#include <catch2/catch_test_macros.hpp>
#include "peerdrop/crypto/aes_gcm.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include <vector>
using namespace peerdrop;
using namespace peerdrop::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kTransferKeyBytes, 0xAA);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
    SECTION("Encrypt and decrypt round-trip") {
        const std::vector<uint8_t> plaintext = {'c', 'h', 'u', 'n', 'k'};
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto decrypted = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext still carries a tag") {
        auto ciphertext = AesGcm::Encrypt(key, nonce, std::vector<uint8_t>{});
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == kAesGcmTagBytes);
        auto decrypted = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap().empty());
    }
    SECTION("Associated data must match") {
        const std::vector<uint8_t> plaintext(40, 0x42);
        const std::vector<uint8_t> ad = {1, 2, 3};
        const std::vector<uint8_t> other_ad = {1, 2, 4};
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext, ad).IsOk());
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext, other_ad).IsErr());
    }
}
TEST_CASE("AES-GCM - Tamper detection", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kTransferKeyBytes, 0x11);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x22);
    const std::vector<uint8_t> plaintext(64, 0x33);
    const auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext).Unwrap();
    SECTION("Every flipped ciphertext bit is rejected") {
        for (size_t byte = 0; byte < ciphertext.size(); ++byte) {
            auto tampered = ciphertext;
            tampered[byte] ^= 0x01;
            auto result = AesGcm::Decrypt(key, nonce, tampered);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Encryption);
        }
    }
    SECTION("Flipped nonce is rejected") {
        auto wrong_nonce = nonce;
        wrong_nonce[0] ^= 0x80;
        REQUIRE(AesGcm::Decrypt(key, wrong_nonce, ciphertext).IsErr());
    }
    SECTION("Wrong key is rejected") {
        const std::vector<uint8_t> other_key(kTransferKeyBytes, 0x12);
        REQUIRE(AesGcm::Decrypt(other_key, nonce, ciphertext).IsErr());
    }
    SECTION("Truncated input is rejected") {
        const std::vector<uint8_t> shorter(ciphertext.begin(), ciphertext.begin() + kAesGcmTagBytes - 1);
        REQUIRE(AesGcm::Decrypt(key, nonce, shorter).IsErr());
    }
}
TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> plaintext = {1};
    SECTION("Short key") {
        const std::vector<uint8_t> key(16, 0x00);
        const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x00);
        auto result = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::InvalidInput);
    }
    SECTION("Wrong nonce length") {
        const std::vector<uint8_t> key(kTransferKeyBytes, 0x00);
        const std::vector<uint8_t> nonce(8, 0x00);
        REQUIRE(AesGcm::Encrypt(key, nonce, plaintext).IsErr());
    }
}
