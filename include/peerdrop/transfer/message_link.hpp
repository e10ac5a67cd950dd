#pragma once

#include "peerdrop/core/channel.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/interfaces/i_data_channel.hpp"
#include "peerdrop/transfer/protocol.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace peerdrop::transfer {

using InboundQueue = Channel<std::vector<uint8_t>>;

/**
 * @brief A data channel paired with the queue its inbound messages land in
 *
 * The queue is closed when the underlying channel closes, so a blocked
 * Receive() reports ChannelClosed instead of waiting forever.
 */
class MessageLink {
public:
    MessageLink(std::shared_ptr<interfaces::IDataChannel> channel,
                std::shared_ptr<InboundQueue> inbound);

    /**
     * @brief Route the channel's message and close events into a fresh queue
     */
    static MessageLink Attach(std::shared_ptr<interfaces::IDataChannel> channel);

    [[nodiscard]] Result<Unit, PeerDropFailure> Send(std::span<const uint8_t> message);

    [[nodiscard]] Result<Unit, PeerDropFailure> SendControl(const ControlMessage& message);

    /// Next inbound message, or ChannelClosed once the channel is gone and drained.
    [[nodiscard]] Result<std::vector<uint8_t>, PeerDropFailure> Receive();

    [[nodiscard]] interfaces::IDataChannel& DataChannel() const { return *channel_; }
    [[nodiscard]] InboundQueue& Inbound() const { return *inbound_; }

    void Close();

private:
    std::shared_ptr<interfaces::IDataChannel> channel_;
    std::shared_ptr<InboundQueue> inbound_;
};

} // namespace peerdrop::transfer
