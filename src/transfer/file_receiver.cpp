#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/crypto/chunk_cipher.hpp"
#include "peerdrop/core/format.hpp"
#include "peerdrop/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace peerdrop::transfer {

namespace {

Result<std::string, PeerDropFailure> SanitizeFilename(const std::string& name) {
    const std::filesystem::path leaf = std::filesystem::path(name).filename();
    const std::string text = leaf.string();
    if (text.empty() || text == "." || text == "..") {
        return Result<std::string, PeerDropFailure>::Err(
            PeerDropFailure::Transfer(compat::format("Invalid filename '{}'", name)));
    }
    return Result<std::string, PeerDropFailure>::Ok(text);
}

Result<Unit, PeerDropFailure> ValidateFileInfo(const FileInfo& info) {
    if (info.chunk_size != kChunkSize) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Transfer(
            compat::format("File metadata uses chunk size {}, expected {}", info.chunk_size, kChunkSize)));
    }
    if (info.total_chunks != TotalChunks(info.size)) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Transfer(
            compat::format("File metadata claims {} chunks for {} bytes", info.total_chunks, info.size)));
    }
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

} // namespace

FileReceiver::FileReceiver(std::filesystem::path output_dir,
                           MessageLink link,
                           const crypto::TransferKey& key,
                           interfaces::ITransferObserver* observer)
    : output_dir_(std::move(output_dir))
    , link_(std::move(link))
    , key_(key)
    , observer_(observer) {}

Result<std::filesystem::path, PeerDropFailure> FileReceiver::Receive() {
    auto result = Run();
    if (result.IsErr()) {
        state_ = ReceiverState::Failed;
        const auto& failure = result.UnwrapErr();
        if (!peer_aborted_ && failure.type != PeerDropFailureType::ChannelClosed) {
            auto notify = link_.SendControl(TransferError{failure.Describe()});
            if (notify.IsErr()) {
                spdlog::debug("Could not report failure to peer: {}", notify.UnwrapErr().Describe());
            }
        }
        if (output_path_.has_value()) {
            std::error_code ec;
            std::filesystem::remove(*output_path_, ec);
        }
    }
    return result;
}

Result<std::filesystem::path, PeerDropFailure> FileReceiver::Run() {
    using PathResult = Result<std::filesystem::path, PeerDropFailure>;

    spdlog::info("Waiting for file info...");
    auto metadata = AwaitMetadata();
    if (metadata.IsErr()) {
        return PathResult::Err(std::move(metadata).UnwrapErr());
    }
    const FileInfo info = std::move(metadata).Unwrap();
    spdlog::info("Receiving file: {} ({} bytes, {} chunks)", info.filename, info.size, info.total_chunks);

    const auto path = output_dir_ / info.filename;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return PathResult::Err(PeerDropFailure::Io(
            compat::format("{}: cannot create file", path.string())));
    }
    output_path_ = path;
    received_.clear();

    if (auto sent = link_.SendControl(Ready{}); sent.IsErr()) {
        return PathResult::Err(std::move(sent).UnwrapErr());
    }
    state_ = ReceiverState::Ready;
    spdlog::info("Ready to receive");
    if (observer_ != nullptr) {
        observer_->OnTransferStarted(info.filename, info.size);
    }

    if (auto chunks = ReceiveChunks(info, output); chunks.IsErr()) {
        return PathResult::Err(std::move(chunks).UnwrapErr());
    }

    const uint64_t missing = info.total_chunks - static_cast<uint64_t>(received_.size());
    if (missing != 0) {
        return PathResult::Err(PeerDropFailure::Transfer(
            compat::format("Transfer ended with {} of {} chunks missing", missing, info.total_chunks)));
    }

    output.flush();
    output.close();
    if (!output) {
        return PathResult::Err(PeerDropFailure::Io(
            compat::format("{}: write failed", path.string())));
    }

    state_ = ReceiverState::Done;
    if (observer_ != nullptr) {
        observer_->OnTransferFinished(bytes_received_);
    }
    spdlog::info("File received: {} ({} bytes)", path.string(), bytes_received_);
    return PathResult::Ok(path);
}

Result<FileInfo, PeerDropFailure> FileReceiver::AwaitMetadata() {
    using InfoResult = Result<FileInfo, PeerDropFailure>;
    while (true) {
        auto message = link_.Receive();
        if (message.IsErr()) {
            return InfoResult::Err(std::move(message).UnwrapErr());
        }
        auto frame = ParseFrame(message.Unwrap());
        if (frame.IsErr()) {
            spdlog::warn("Dropping unparseable frame: {}", frame.UnwrapErr().message);
            continue;
        }
        const auto* control = std::get_if<ControlMessage>(&frame.Unwrap());
        if (control == nullptr) {
            spdlog::debug("Ignoring chunk before file info");
            continue;
        }
        if (std::holds_alternative<FileInfo>(*control)) {
            return InfoResult::Err(PeerDropFailure::Transfer(
                "Received unencrypted file metadata; refusing cleartext transfer"));
        }
        if (const auto* error = std::get_if<TransferError>(control)) {
            peer_aborted_ = true;
            return InfoResult::Err(PeerDropFailure::Transfer("Sender error: " + error->message));
        }
        const auto* sealed = std::get_if<EncryptedFileInfo>(control);
        if (sealed == nullptr) {
            spdlog::debug("Ignoring control message before file info");
            continue;
        }

        auto plaintext = crypto::OpenMetadata(key_, sealed->nonce, sealed->ciphertext);
        if (plaintext.IsErr()) {
            return InfoResult::Err(PeerDropFailure::Encryption(
                "Cannot decrypt file metadata: " + plaintext.UnwrapErr().message));
        }
        auto parsed = ParseFileInfo(plaintext.Unwrap());
        if (parsed.IsErr()) {
            return InfoResult::Err(PeerDropFailure::Transfer(parsed.UnwrapErr().message));
        }
        auto info = std::move(parsed).Unwrap();
        if (auto valid = ValidateFileInfo(info); valid.IsErr()) {
            return InfoResult::Err(std::move(valid).UnwrapErr());
        }
        auto filename = SanitizeFilename(info.filename);
        if (filename.IsErr()) {
            return InfoResult::Err(std::move(filename).UnwrapErr());
        }
        if (filename.Unwrap() != info.filename) {
            spdlog::warn("Sanitized incoming filename '{}' to '{}'", info.filename, filename.Unwrap());
        }
        info.filename = std::move(filename).Unwrap();
        return InfoResult::Ok(std::move(info));
    }
}

Result<Unit, PeerDropFailure> FileReceiver::ReceiveChunks(const FileInfo& info, std::ofstream& output) {
    while (true) {
        auto message = link_.Receive();
        if (message.IsErr()) {
            return Result<Unit, PeerDropFailure>::Err(std::move(message).UnwrapErr());
        }
        auto frame = ParseFrame(message.Unwrap());
        if (frame.IsErr()) {
            spdlog::warn("Dropping unparseable frame: {}", frame.UnwrapErr().message);
            continue;
        }

        if (const auto* chunk = std::get_if<EncryptedChunkFrame>(&frame.Unwrap())) {
            state_ = ReceiverState::Receiving;
            auto stored = StoreChunk(info, *chunk, output);
            if (stored.IsErr()) {
                return Result<Unit, PeerDropFailure>::Err(std::move(stored).UnwrapErr());
            }
            if (auto sent = link_.SendControl(Ack{chunk->index}); sent.IsErr()) {
                return sent;
            }
            continue;
        }
        if (const auto* legacy = std::get_if<LegacyChunk>(&frame.Unwrap())) {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Transfer(
                compat::format("Received unencrypted chunk {}; refusing cleartext transfer", legacy->index)));
        }

        const auto& control = std::get<ControlMessage>(frame.Unwrap());
        if (std::holds_alternative<Done>(control)) {
            spdlog::info("Transfer complete signal received");
            return Result<Unit, PeerDropFailure>::Ok(unit);
        }
        if (const auto* error = std::get_if<TransferError>(&control)) {
            peer_aborted_ = true;
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::Transfer("Sender error: " + error->message));
        }
        spdlog::debug("Ignoring control message during transfer");
    }
}

Result<uint64_t, PeerDropFailure> FileReceiver::StoreChunk(
    const FileInfo& info, const EncryptedChunkFrame& chunk, std::ofstream& output) {
    using SizeResult = Result<uint64_t, PeerDropFailure>;
    if (chunk.index >= info.total_chunks) {
        return SizeResult::Err(PeerDropFailure::Transfer(
            compat::format("Chunk {} is beyond the announced {} chunks", chunk.index, info.total_chunks)));
    }
    if (received_.contains(chunk.index)) {
        return SizeResult::Err(PeerDropFailure::Transfer(
            compat::format("Chunk {} received twice", chunk.index)));
    }
    const uint64_t expected = expected_chunk_.load();
    if (chunk.index != expected) {
        spdlog::warn("Received out-of-order chunk: expected {}, got {}", expected, chunk.index);
    }

    auto plaintext = crypto::OpenChunk(key_, chunk.index, chunk.nonce, chunk.ciphertext);
    if (plaintext.IsErr()) {
        spdlog::debug("Rejected chunk {} with nonce {}", chunk.index, logging::ToHexTruncated(chunk.nonce));
        return SizeResult::Err(std::move(plaintext).UnwrapErr());
    }
    const auto& data = plaintext.Unwrap();

    const uint64_t offset = chunk.index * info.chunk_size;
    const uint64_t expected_length = std::min<uint64_t>(info.chunk_size, info.size - offset);
    if (data.size() != expected_length) {
        return SizeResult::Err(PeerDropFailure::Transfer(
            compat::format("Chunk {} carries {} bytes, expected {}", chunk.index, data.size(), expected_length)));
    }

    output.seekp(static_cast<std::streamoff>(offset));
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!output) {
        return SizeResult::Err(PeerDropFailure::Io(
            compat::format("Failed to write chunk {}", chunk.index)));
    }

    received_.insert(chunk.index);
    bytes_received_ += data.size();
    expected_chunk_ = chunk.index + 1;
    spdlog::debug("Received and decrypted chunk {} ({} bytes)", chunk.index, data.size());
    if (observer_ != nullptr) {
        observer_->OnProgress(bytes_received_, info.size);
    }
    return SizeResult::Ok(data.size());
}

} // namespace peerdrop::transfer
