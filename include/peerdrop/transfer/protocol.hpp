#pragma once

#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/crypto/chunk_cipher.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace peerdrop::transfer {

// ============================================================================
// Control vocabulary (frame tag 0, JSON tagged by "type")
// ============================================================================

struct FileInfo {
    std::string filename;
    uint64_t size = 0;
    uint32_t chunk_size = static_cast<uint32_t>(kChunkSize);
    uint64_t total_chunks = 0;

    static FileInfo Describe(std::string filename, uint64_t size);

    bool operator==(const FileInfo&) const = default;
};

struct EncryptedFileInfo {
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;

    bool operator==(const EncryptedFileInfo&) const = default;
};

struct Ready {
    bool operator==(const Ready&) const = default;
};

/// Header preceding a legacy cleartext chunk.
struct ChunkHeader {
    uint64_t index = 0;
    bool operator==(const ChunkHeader&) const = default;
};

struct Ack {
    uint64_t index = 0;
    bool operator==(const Ack&) const = default;
};

struct Done {
    bool operator==(const Done&) const = default;
};

struct TransferError {
    std::string message;
    bool operator==(const TransferError&) const = default;
};

using ControlMessage =
    std::variant<FileInfo, EncryptedFileInfo, Ready, ChunkHeader, Ack, Done, TransferError>;

// ============================================================================
// Binary frames
// ============================================================================

/// Tag 1: 8-byte big-endian index followed by raw payload.
struct LegacyChunk {
    uint64_t index = 0;
    std::vector<uint8_t> data;
};

/// Tag 2: 8-byte big-endian index, 12-byte nonce, ciphertext with tag.
struct EncryptedChunkFrame {
    uint64_t index = 0;
    crypto::ChunkNonce nonce{};
    std::vector<uint8_t> ciphertext;
};

using Frame = std::variant<ControlMessage, LegacyChunk, EncryptedChunkFrame>;

[[nodiscard]] uint64_t TotalChunks(uint64_t size) noexcept;

std::vector<uint8_t> EncodeControl(const ControlMessage& message);
std::vector<uint8_t> EncodeLegacyChunk(const LegacyChunk& chunk);
std::vector<uint8_t> EncodeEncryptedChunk(const EncryptedChunkFrame& chunk);

/**
 * @brief Decode one data-channel message
 *
 * Fails with Decode for an empty message, an unknown tag, a frame shorter
 * than its minimum length, or a control body that is not a known JSON message.
 */
[[nodiscard]] Result<Frame, PeerDropFailure> ParseFrame(std::span<const uint8_t> data);

/// JSON form of FileInfo, the plaintext that gets sealed into EncryptedFileInfo.
std::vector<uint8_t> SerializeFileInfo(const FileInfo& info);

[[nodiscard]] Result<FileInfo, PeerDropFailure> ParseFileInfo(std::span<const uint8_t> json);

} // namespace peerdrop::transfer
