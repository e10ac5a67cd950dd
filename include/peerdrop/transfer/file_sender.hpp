#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/crypto/transfer_key.hpp"
#include "peerdrop/interfaces/i_transfer_observer.hpp"
#include "peerdrop/transfer/message_link.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>

namespace peerdrop::transfer {

enum class SenderState {
    Idle,
    AwaitingReady,
    Sending,
    AwaitingAck,
    Done,
    Failed
};

/**
 * @brief Source side of the chunked transfer
 *
 * Sends sealed metadata, waits for Ready, then streams the file one
 * encrypted chunk at a time, waiting for the matching Ack before the next
 * chunk goes out. At most one chunk is ever unacknowledged.
 */
class FileSender {
public:
    FileSender(std::filesystem::path file,
               MessageLink link,
               const crypto::TransferKey& key,
               interfaces::ITransferObserver* observer = nullptr);

    /**
     * @brief Run the transfer to completion
     *
     * On a local failure the peer is told with a best-effort error message.
     */
    [[nodiscard]] Result<Unit, PeerDropFailure> Send();

    [[nodiscard]] SenderState State() const noexcept { return state_.load(); }
    [[nodiscard]] uint64_t CurrentChunk() const noexcept { return current_chunk_.load(); }

private:
    Result<Unit, PeerDropFailure> Run();
    Result<Unit, PeerDropFailure> AwaitReady();
    Result<Unit, PeerDropFailure> AwaitAck(uint64_t index);

    std::filesystem::path file_;
    MessageLink link_;
    const crypto::TransferKey& key_;
    interfaces::ITransferObserver* observer_;
    std::atomic<SenderState> state_{SenderState::Idle};
    std::atomic<uint64_t> current_chunk_{0};
    bool peer_aborted_ = false;
};

} // namespace peerdrop::transfer
