#include "peerdrop/transfer/file_sender.hpp"
#include "peerdrop/crypto/chunk_cipher.hpp"
#include "peerdrop/core/format.hpp"
#include "peerdrop/core/logging.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace peerdrop::transfer {

FileSender::FileSender(std::filesystem::path file,
                       MessageLink link,
                       const crypto::TransferKey& key,
                       interfaces::ITransferObserver* observer)
    : file_(std::move(file))
    , link_(std::move(link))
    , key_(key)
    , observer_(observer) {}

Result<Unit, PeerDropFailure> FileSender::Send() {
    auto result = Run();
    if (result.IsErr()) {
        state_ = SenderState::Failed;
        const auto& failure = result.UnwrapErr();
        if (!peer_aborted_ && failure.type != PeerDropFailureType::ChannelClosed) {
            auto notify = link_.SendControl(TransferError{failure.Describe()});
            if (notify.IsErr()) {
                spdlog::debug("Could not report failure to peer: {}", notify.UnwrapErr().Describe());
            }
        }
    }
    return result;
}

Result<Unit, PeerDropFailure> FileSender::Run() {
    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(file_, ec);
    if (ec) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Io(
            compat::format("{}: {}", file_.string(), ec.message())));
    }
    std::ifstream input(file_, std::ios::binary);
    if (!input) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Io(
            compat::format("{}: cannot open for reading", file_.string())));
    }

    std::string filename = file_.filename().string();
    if (filename.empty()) {
        filename = "unknown";
    }
    const FileInfo info = FileInfo::Describe(filename, file_size);
    spdlog::info("Sending file: {} ({} bytes, {} chunks)", info.filename, info.size, info.total_chunks);

    auto sealed = crypto::SealMetadata(key_, SerializeFileInfo(info));
    if (sealed.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(sealed).UnwrapErr());
    }
    auto metadata = std::move(sealed).Unwrap();
    spdlog::debug("Metadata nonce: {}", logging::ToHexTruncated(metadata.nonce));
    EncryptedFileInfo envelope{
        std::vector<uint8_t>(metadata.nonce.begin(), metadata.nonce.end()),
        std::move(metadata.ciphertext)};
    if (auto sent = link_.SendControl(envelope); sent.IsErr()) {
        return sent;
    }

    state_ = SenderState::AwaitingReady;
    spdlog::info("Waiting for receiver to be ready...");
    if (auto ready = AwaitReady(); ready.IsErr()) {
        return ready;
    }
    spdlog::info("Receiver is ready");

    if (observer_ != nullptr) {
        observer_->OnTransferStarted(info.filename, info.size);
    }

    crypto::ChunkSealer sealer(key_);
    std::vector<uint8_t> buffer(kChunkSize);
    uint64_t bytes_sent = 0;

    for (uint64_t index = 0; index < info.total_chunks; ++index) {
        state_ = SenderState::Sending;
        current_chunk_ = index;

        const auto length = static_cast<size_t>(
            std::min<uint64_t>(kChunkSize, file_size - bytes_sent));
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
        if (static_cast<size_t>(input.gcount()) != length) {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Io(
                compat::format("{}: short read at chunk {}", file_.string(), index)));
        }

        auto chunk = sealer.Seal(index, std::span<const uint8_t>(buffer.data(), length));
        if (chunk.IsErr()) {
            return Result<Unit, PeerDropFailure>::Err(std::move(chunk).UnwrapErr());
        }
        auto sealed_chunk = std::move(chunk).Unwrap();
        const auto frame = EncodeEncryptedChunk(
            EncryptedChunkFrame{index, sealed_chunk.nonce, std::move(sealed_chunk.ciphertext)});
        if (auto sent = link_.Send(frame); sent.IsErr()) {
            return sent;
        }

        state_ = SenderState::AwaitingAck;
        if (auto acked = AwaitAck(index); acked.IsErr()) {
            return acked;
        }

        bytes_sent += length;
        spdlog::debug("Sent chunk {} ({} bytes)", index, length);
        if (observer_ != nullptr) {
            observer_->OnProgress(bytes_sent, info.size);
        }
    }

    if (auto sent = link_.SendControl(Done{}); sent.IsErr()) {
        return sent;
    }
    state_ = SenderState::Done;
    if (observer_ != nullptr) {
        observer_->OnTransferFinished(bytes_sent);
    }
    spdlog::info("File transfer complete: {} bytes sent", bytes_sent);
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

Result<Unit, PeerDropFailure> FileSender::AwaitReady() {
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
        const auto* control = std::get_if<ControlMessage>(&frame.Unwrap());
        if (control == nullptr) {
            continue;
        }
        if (std::holds_alternative<Ready>(*control)) {
            return Result<Unit, PeerDropFailure>::Ok(unit);
        }
        if (const auto* error = std::get_if<TransferError>(control)) {
            peer_aborted_ = true;
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::Transfer("Receiver error: " + error->message));
        }
        spdlog::debug("Ignoring message while waiting for ready");
    }
}

Result<Unit, PeerDropFailure> FileSender::AwaitAck(const uint64_t index) {
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
        const auto* control = std::get_if<ControlMessage>(&frame.Unwrap());
        if (control == nullptr) {
            continue;
        }
        if (const auto* ack = std::get_if<Ack>(control)) {
            if (ack->index == index) {
                return Result<Unit, PeerDropFailure>::Ok(unit);
            }
            spdlog::debug("Ignoring ack {} while waiting for {}", ack->index, index);
            continue;
        }
        if (const auto* error = std::get_if<TransferError>(control)) {
            peer_aborted_ = true;
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::Transfer("Receiver error: " + error->message));
        }
    }
}

} // namespace peerdrop::transfer
