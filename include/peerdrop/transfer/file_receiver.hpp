#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/crypto/transfer_key.hpp"
#include "peerdrop/interfaces/i_transfer_observer.hpp"
#include "peerdrop/transfer/message_link.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>

namespace peerdrop::transfer {

enum class ReceiverState {
    AwaitingMetadata,
    Ready,
    Receiving,
    Done,
    Failed
};

/**
 * @brief Sink side of the chunked transfer
 *
 * Accepts only sealed metadata and encrypted chunks. Each chunk is written
 * at its own offset, so a chunk that arrives out of order is logged but
 * lands in the right place; the transfer only succeeds once every chunk
 * named by the metadata has been received.
 */
class FileReceiver {
public:
    FileReceiver(std::filesystem::path output_dir,
                 MessageLink link,
                 const crypto::TransferKey& key,
                 interfaces::ITransferObserver* observer = nullptr);

    /**
     * @brief Run the transfer to completion
     *
     * @return Path of the written file. A partially written file is
     *         removed on failure.
     */
    [[nodiscard]] Result<std::filesystem::path, PeerDropFailure> Receive();

    [[nodiscard]] ReceiverState State() const noexcept { return state_.load(); }
    [[nodiscard]] uint64_t ExpectedChunk() const noexcept { return expected_chunk_.load(); }

private:
    Result<FileInfo, PeerDropFailure> AwaitMetadata();
    Result<Unit, PeerDropFailure> ReceiveChunks(const FileInfo& info, std::ofstream& output);
    Result<uint64_t, PeerDropFailure> StoreChunk(
        const FileInfo& info, const EncryptedChunkFrame& chunk, std::ofstream& output);
    Result<std::filesystem::path, PeerDropFailure> Run();

    std::filesystem::path output_dir_;
    MessageLink link_;
    const crypto::TransferKey& key_;
    interfaces::ITransferObserver* observer_;
    std::atomic<ReceiverState> state_{ReceiverState::AwaitingMetadata};
    std::atomic<uint64_t> expected_chunk_{0};
    std::optional<std::filesystem::path> output_path_;
    std::set<uint64_t> received_;
    uint64_t bytes_received_ = 0;
    bool peer_aborted_ = false;
};

} // namespace peerdrop::transfer
