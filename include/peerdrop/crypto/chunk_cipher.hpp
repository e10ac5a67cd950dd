#pragma once

#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/crypto/transfer_key.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace peerdrop::crypto {

using ChunkNonce = std::array<uint8_t, kAesGcmNonceBytes>;
using NonceSalt = std::array<uint8_t, kNonceSaltBytes>;

/**
 * @brief Per-chunk nonce: 8-byte big-endian index followed by the 4-byte salt
 */
ChunkNonce CreateChunkNonce(uint64_t index, const NonceSalt& salt);

/**
 * @brief Chunk index encoded in the first 8 bytes of a chunk nonce
 */
uint64_t ChunkIndexFromNonce(std::span<const uint8_t> nonce);

struct SealedChunk {
    uint64_t index;
    ChunkNonce nonce;
    std::vector<uint8_t> ciphertext;
};

struct SealedMetadata {
    ChunkNonce nonce;
    std::vector<uint8_t> ciphertext;
};

/**
 * @brief Encrypts the chunks of one transfer
 *
 * Holds the per-transfer random salt and refuses to seal an index that is
 * not strictly greater than the previous one, so no nonce is ever reused
 * under the transfer key.
 */
class ChunkSealer {
public:
    explicit ChunkSealer(const TransferKey& key);
    ChunkSealer(const TransferKey& key, const NonceSalt& salt);

    [[nodiscard]] Result<SealedChunk, PeerDropFailure> Seal(
        uint64_t index, std::span<const uint8_t> plaintext);

    [[nodiscard]] const NonceSalt& Salt() const noexcept { return salt_; }

private:
    const TransferKey& key_;
    NonceSalt salt_;
    std::optional<uint64_t> last_index_;
};

/**
 * @brief Authenticates and decrypts one chunk
 *
 * Fails when the nonce does not carry the frame's index or when the
 * tag does not verify.
 */
[[nodiscard]] Result<std::vector<uint8_t>, PeerDropFailure> OpenChunk(
    const TransferKey& key,
    uint64_t index,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext);

/// Seals serialized file metadata under a fresh random nonce.
[[nodiscard]] Result<SealedMetadata, PeerDropFailure> SealMetadata(
    const TransferKey& key, std::span<const uint8_t> plaintext);

[[nodiscard]] Result<std::vector<uint8_t>, PeerDropFailure> OpenMetadata(
    const TransferKey& key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext);

} // namespace peerdrop::crypto
