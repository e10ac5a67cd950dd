#include "peerdrop/transfer/message_link.hpp"

namespace peerdrop::transfer {

MessageLink::MessageLink(std::shared_ptr<interfaces::IDataChannel> channel,
                         std::shared_ptr<InboundQueue> inbound)
    : channel_(std::move(channel))
    , inbound_(std::move(inbound)) {}

MessageLink MessageLink::Attach(std::shared_ptr<interfaces::IDataChannel> channel) {
    auto inbound = std::make_shared<InboundQueue>();
    channel->OnMessage([inbound](std::vector<uint8_t> message) {
        inbound->Send(std::move(message));
    });
    channel->OnClosed([inbound] {
        inbound->Close();
    });
    return MessageLink(std::move(channel), std::move(inbound));
}

Result<Unit, PeerDropFailure> MessageLink::Send(std::span<const uint8_t> message) {
    return channel_->Send(message);
}

Result<Unit, PeerDropFailure> MessageLink::SendControl(const ControlMessage& message) {
    const auto frame = EncodeControl(message);
    return channel_->Send(frame);
}

Result<std::vector<uint8_t>, PeerDropFailure> MessageLink::Receive() {
    auto message = inbound_->Receive();
    if (!message.has_value()) {
        return Result<std::vector<uint8_t>, PeerDropFailure>::Err(
            PeerDropFailure::ChannelClosed("Data channel closed"));
    }
    return Result<std::vector<uint8_t>, PeerDropFailure>::Ok(std::move(*message));
}

void MessageLink::Close() {
    channel_->Close();
    inbound_->Close();
}

} // namespace peerdrop::transfer
