#include "peerdrop/transfer/protocol.hpp"
#include "peerdrop/core/format.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace peerdrop::transfer {

using json = nlohmann::json;

namespace {

constexpr const char* kTypeFileInfo = "file_info";
constexpr const char* kTypeEncryptedFileInfo = "encrypted_file_info";
constexpr const char* kTypeReady = "ready";
constexpr const char* kTypeChunk = "chunk";
constexpr const char* kTypeAck = "ack";
constexpr const char* kTypeDone = "done";
constexpr const char* kTypeError = "error";

constexpr size_t kMinControlFrameBytes = kFrameTagBytes + 1;

void AppendIndex(std::vector<uint8_t>& out, const uint64_t index) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(index >> shift));
    }
}

uint64_t ReadIndex(std::span<const uint8_t> bytes) {
    uint64_t index = 0;
    for (size_t i = 0; i < kChunkIndexBytes; ++i) {
        index = (index << 8) | bytes[i];
    }
    return index;
}

json FileInfoToJson(const FileInfo& info) {
    return json{
        {"type", kTypeFileInfo},
        {"filename", info.filename},
        {"size", info.size},
        {"chunk_size", info.chunk_size},
        {"total_chunks", info.total_chunks},
    };
}

FileInfo FileInfoFromJson(const json& j) {
    FileInfo info;
    info.filename = j.at("filename").get<std::string>();
    info.size = j.at("size").get<uint64_t>();
    info.chunk_size = j.at("chunk_size").get<uint32_t>();
    info.total_chunks = j.at("total_chunks").get<uint64_t>();
    return info;
}

json ControlToJson(const ControlMessage& message) {
    return std::visit([](const auto& m) -> json {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, FileInfo>) {
            return FileInfoToJson(m);
        } else if constexpr (std::is_same_v<T, EncryptedFileInfo>) {
            return json{{"type", kTypeEncryptedFileInfo},
                        {"nonce", m.nonce},
                        {"ciphertext", m.ciphertext}};
        } else if constexpr (std::is_same_v<T, Ready>) {
            return json{{"type", kTypeReady}};
        } else if constexpr (std::is_same_v<T, ChunkHeader>) {
            return json{{"type", kTypeChunk}, {"index", m.index}};
        } else if constexpr (std::is_same_v<T, Ack>) {
            return json{{"type", kTypeAck}, {"index", m.index}};
        } else if constexpr (std::is_same_v<T, Done>) {
            return json{{"type", kTypeDone}};
        } else {
            return json{{"type", kTypeError}, {"message", m.message}};
        }
    }, message);
}

Result<ControlMessage, PeerDropFailure> ControlFromJson(const json& j) {
    using ControlResult = Result<ControlMessage, PeerDropFailure>;
    try {
        const auto type = j.at("type").get<std::string>();
        if (type == kTypeFileInfo) {
            return ControlResult::Ok(FileInfoFromJson(j));
        }
        if (type == kTypeEncryptedFileInfo) {
            return ControlResult::Ok(EncryptedFileInfo{
                j.at("nonce").get<std::vector<uint8_t>>(),
                j.at("ciphertext").get<std::vector<uint8_t>>()});
        }
        if (type == kTypeReady) {
            return ControlResult::Ok(Ready{});
        }
        if (type == kTypeChunk) {
            return ControlResult::Ok(ChunkHeader{j.at("index").get<uint64_t>()});
        }
        if (type == kTypeAck) {
            return ControlResult::Ok(Ack{j.at("index").get<uint64_t>()});
        }
        if (type == kTypeDone) {
            return ControlResult::Ok(Done{});
        }
        if (type == kTypeError) {
            return ControlResult::Ok(TransferError{j.at("message").get<std::string>()});
        }
        return ControlResult::Err(PeerDropFailure::Decode(
            compat::format("Unknown control message type '{}'", type)));
    } catch (const json::exception& ex) {
        return ControlResult::Err(PeerDropFailure::Decode(
            compat::format("Malformed control message: {}", ex.what())));
    }
}

std::vector<uint8_t> WithTag(const uint8_t tag, const std::string& body) {
    std::vector<uint8_t> out;
    out.reserve(kFrameTagBytes + body.size());
    out.push_back(tag);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

} // namespace

FileInfo FileInfo::Describe(std::string filename, const uint64_t size) {
    FileInfo info;
    info.filename = std::move(filename);
    info.size = size;
    info.chunk_size = static_cast<uint32_t>(kChunkSize);
    info.total_chunks = TotalChunks(size);
    return info;
}

uint64_t TotalChunks(const uint64_t size) noexcept {
    return size / kChunkSize + (size % kChunkSize != 0 ? 1 : 0);
}

std::vector<uint8_t> EncodeControl(const ControlMessage& message) {
    return WithTag(kFrameControl, ControlToJson(message).dump());
}

std::vector<uint8_t> EncodeLegacyChunk(const LegacyChunk& chunk) {
    std::vector<uint8_t> out;
    out.reserve(kMinLegacyChunkFrameBytes + chunk.data.size());
    out.push_back(kFrameLegacyChunk);
    AppendIndex(out, chunk.index);
    out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    return out;
}

std::vector<uint8_t> EncodeEncryptedChunk(const EncryptedChunkFrame& chunk) {
    std::vector<uint8_t> out;
    out.reserve(kFrameTagBytes + kChunkIndexBytes + kAesGcmNonceBytes + chunk.ciphertext.size());
    out.push_back(kFrameEncryptedChunk);
    AppendIndex(out, chunk.index);
    out.insert(out.end(), chunk.nonce.begin(), chunk.nonce.end());
    out.insert(out.end(), chunk.ciphertext.begin(), chunk.ciphertext.end());
    return out;
}

Result<Frame, PeerDropFailure> ParseFrame(std::span<const uint8_t> data) {
    using FrameResult = Result<Frame, PeerDropFailure>;
    if (data.empty()) {
        return FrameResult::Err(PeerDropFailure::Decode("Empty frame"));
    }

    switch (data[0]) {
        case kFrameControl: {
            if (data.size() < kMinControlFrameBytes) {
                return FrameResult::Err(PeerDropFailure::Decode("Control frame has no body"));
            }
            const auto body = data.subspan(kFrameTagBytes);
            const json j = json::parse(body.begin(), body.end(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                return FrameResult::Err(PeerDropFailure::Decode("Control frame is not a JSON object"));
            }
            auto control = ControlFromJson(j);
            if (control.IsErr()) {
                return FrameResult::Err(std::move(control).UnwrapErr());
            }
            return FrameResult::Ok(std::move(control).Unwrap());
        }
        case kFrameLegacyChunk: {
            if (data.size() < kMinLegacyChunkFrameBytes) {
                return FrameResult::Err(PeerDropFailure::Decode(
                    compat::format("Chunk frame too short: {} bytes", data.size())));
            }
            LegacyChunk chunk;
            chunk.index = ReadIndex(data.subspan(kFrameTagBytes));
            const auto payload = data.subspan(kMinLegacyChunkFrameBytes);
            chunk.data.assign(payload.begin(), payload.end());
            return FrameResult::Ok(std::move(chunk));
        }
        case kFrameEncryptedChunk: {
            if (data.size() < kMinEncryptedChunkFrameBytes) {
                return FrameResult::Err(PeerDropFailure::Decode(
                    compat::format("Encrypted chunk frame too short: {} bytes", data.size())));
            }
            EncryptedChunkFrame chunk;
            chunk.index = ReadIndex(data.subspan(kFrameTagBytes));
            const auto nonce = data.subspan(kFrameTagBytes + kChunkIndexBytes, kAesGcmNonceBytes);
            std::copy(nonce.begin(), nonce.end(), chunk.nonce.begin());
            const auto ciphertext = data.subspan(kFrameTagBytes + kChunkIndexBytes + kAesGcmNonceBytes);
            chunk.ciphertext.assign(ciphertext.begin(), ciphertext.end());
            return FrameResult::Ok(std::move(chunk));
        }
        default:
            return FrameResult::Err(PeerDropFailure::Decode(
                compat::format("Unknown frame tag {}", data[0])));
    }
}

std::vector<uint8_t> SerializeFileInfo(const FileInfo& info) {
    const std::string text = FileInfoToJson(info).dump();
    return {text.begin(), text.end()};
}

Result<FileInfo, PeerDropFailure> ParseFileInfo(std::span<const uint8_t> bytes) {
    const json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result<FileInfo, PeerDropFailure>::Err(
            PeerDropFailure::Decode("File metadata is not a JSON object"));
    }
    try {
        return Result<FileInfo, PeerDropFailure>::Ok(FileInfoFromJson(j));
    } catch (const json::exception& ex) {
        return Result<FileInfo, PeerDropFailure>::Err(PeerDropFailure::Decode(
            compat::format("Malformed file metadata: {}", ex.what())));
    }
}

} // namespace peerdrop::transfer
