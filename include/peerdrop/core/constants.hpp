#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace peerdrop {

inline constexpr size_t kTransferKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;
inline constexpr size_t kNonceSaltBytes = 4;
inline constexpr size_t kChunkIndexBytes = 8;
static_assert(kChunkIndexBytes + kNonceSaltBytes == kAesGcmNonceBytes,
              "Chunk nonce layout must match AES-GCM nonce size");

inline constexpr size_t kChunkSize = 16 * 1024;

inline constexpr uint8_t kFrameControl = 0;
inline constexpr uint8_t kFrameLegacyChunk = 1;
inline constexpr uint8_t kFrameEncryptedChunk = 2;
inline constexpr size_t kFrameTagBytes = 1;
inline constexpr size_t kMinLegacyChunkFrameBytes = kFrameTagBytes + kChunkIndexBytes;
inline constexpr size_t kMinEncryptedChunkFrameBytes =
    kFrameTagBytes + kChunkIndexBytes + kAesGcmNonceBytes + kAesGcmTagBytes;
static_assert(kMinEncryptedChunkFrameBytes == 37);

inline constexpr size_t kMaxPeerIdLength = 64;

inline constexpr std::string_view kDefaultSignalingHost = "0.peerjs.com";
inline constexpr uint16_t kDefaultSignalingPort = 443;
inline constexpr std::string_view kDefaultSignalingPath = "/peerjs";
inline constexpr std::string_view kDefaultSignalingApiKey = "peerjs";
inline constexpr std::chrono::seconds kDefaultHeartbeatInterval{5};

inline constexpr std::string_view kDefaultStunServer = "stun:stun.l.google.com:19302";
inline constexpr std::string_view kPeerJsTurnUser = "peerjs";
inline constexpr std::string_view kPeerJsTurnCredential = "peerjsp";

inline constexpr std::chrono::seconds kNegotiationDeadline{30};
inline constexpr std::chrono::milliseconds kChannelSettleDelay{500};
inline constexpr std::string_view kDataChannelLabel = "file-transfer";
inline constexpr std::string_view kConnectionType = "data";
inline constexpr std::string_view kBrowserName = "peerdrop";
inline constexpr std::string_view kSerialization = "binary";

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED =
        "Decryption failed: authentication tag mismatch";
};

}  // namespace peerdrop
