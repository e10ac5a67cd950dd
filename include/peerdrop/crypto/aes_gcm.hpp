#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace peerdrop::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP).
 *
 * Stateless primitive. The output of Encrypt is ciphertext followed by the
 * 16-byte tag; Decrypt expects the same layout and fails on any tag mismatch
 * without releasing partial plaintext.
 *
 * A (key, nonce) pair must never be used twice. Nonce management for file
 * chunks lives in ChunkSealer.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, PeerDropFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, PeerDropFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
