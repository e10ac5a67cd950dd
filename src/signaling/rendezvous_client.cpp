#include "peerdrop/signaling/rendezvous_client.hpp"
#include "peerdrop/signaling/websocket_transport.hpp"
#include "peerdrop/core/format.hpp"

#include <spdlog/spdlog.h>

namespace peerdrop::signaling {

using ClientResult = Result<std::unique_ptr<RendezvousClient>, PeerDropFailure>;

RendezvousClient::RendezvousClient(identity::PeerId local_id,
                                   configuration::SignalingConfig config,
                                   std::unique_ptr<interfaces::ISignalingTransport> transport)
    : local_id_(std::move(local_id))
    , config_(std::move(config))
    , transport_(std::move(transport))
    , events_(std::make_shared<EventQueue>()) {}

RendezvousClient::~RendezvousClient() {
    Close();
}

ClientResult RendezvousClient::Connect(
    const identity::PeerId& local_id,
    const configuration::SignalingConfig& config) {
    return Connect(local_id, config, std::make_unique<WebSocketTransport>());
}

ClientResult RendezvousClient::Connect(
    const identity::PeerId& local_id,
    const configuration::SignalingConfig& config,
    std::unique_ptr<interfaces::ISignalingTransport> transport) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return ClientResult::Err(std::move(valid).UnwrapErr());
    }

    std::unique_ptr<RendezvousClient> client(
        new RendezvousClient(local_id, config, std::move(transport)));

    interfaces::SignalingEndpoint endpoint;
    endpoint.host = config.host;
    endpoint.port = config.port;
    endpoint.target = config.RequestTarget(local_id.Value(), identity::GenerateToken());

    spdlog::info("Connecting to rendezvous server: {}", config.host);
    spdlog::debug("Request target: {}", endpoint.target);

    auto events = client->events_;
    auto opened = client->transport_->Open(
        endpoint,
        [events](std::string text) {
            auto event = ParseServerMessage(text);
            if (event.IsErr()) {
                spdlog::warn("Failed to parse server message: {} - {}", event.UnwrapErr().message, text);
                return;
            }
            events->Send(std::move(event).Unwrap());
        },
        [events] {
            events->Close();
        });
    if (opened.IsErr()) {
        const auto& failure = opened.UnwrapErr();
        return ClientResult::Err(failure.type == PeerDropFailureType::Signaling
            ? failure
            : PeerDropFailure::Signaling(failure.Describe()));
    }

    client->StartKeepalive();
    return ClientResult::Ok(std::move(client));
}

Result<Unit, PeerDropFailure> RendezvousClient::WaitForOpen() {
    while (true) {
        auto event = events_->Receive();
        if (!event.has_value()) {
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::ChannelClosed("Signaling connection closed before registration"));
        }
        if (std::holds_alternative<OpenEvent>(*event)) {
            spdlog::info("Connected to rendezvous server as: {}", local_id_.Value());
            return Result<Unit, PeerDropFailure>::Ok(unit);
        }
        if (std::holds_alternative<IdTakenEvent>(*event)) {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::PeerIdTaken(local_id_.Value()));
        }
        if (std::holds_alternative<InvalidKeyEvent>(*event)) {
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::InvalidApiKey(config_.api_key));
        }
        if (const auto* error = std::get_if<ErrorEvent>(&*event)) {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Signaling(error->message));
        }
        if (std::holds_alternative<HeartbeatEvent>(*event)) {
            if (auto sent = SendHeartbeat(); sent.IsErr()) {
                return sent;
            }
            continue;
        }
        spdlog::debug("Ignoring {} while waiting for OPEN", EventName(*event));
    }
}

Result<SignalingEvent, PeerDropFailure> RendezvousClient::RecvEvent() {
    auto event = events_->Receive();
    if (!event.has_value()) {
        return Result<SignalingEvent, PeerDropFailure>::Err(
            PeerDropFailure::ChannelClosed("Signaling connection closed"));
    }
    return Result<SignalingEvent, PeerDropFailure>::Ok(std::move(*event));
}

Result<Unit, PeerDropFailure> RendezvousClient::SendOffer(
    const std::string& dst,
    const rtc::SessionDescription& description,
    const std::string& connection_id) {
    return SendRaw(MakeOffer(local_id_.Value(), dst, description, connection_id));
}

Result<Unit, PeerDropFailure> RendezvousClient::SendAnswer(
    const std::string& dst,
    const rtc::SessionDescription& description,
    const std::string& connection_id) {
    return SendRaw(MakeAnswer(local_id_.Value(), dst, description, connection_id));
}

Result<Unit, PeerDropFailure> RendezvousClient::SendCandidate(
    const std::string& dst,
    const rtc::IceCandidate& candidate,
    const std::string& connection_id) {
    return SendRaw(MakeCandidate(local_id_.Value(), dst, candidate, connection_id));
}

Result<Unit, PeerDropFailure> RendezvousClient::SendHeartbeat() {
    return SendRaw(MakeHeartbeat());
}

Result<Unit, PeerDropFailure> RendezvousClient::SendRaw(const std::string& text) {
    if (closed_) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Rendezvous client is closed"));
    }
    return transport_->SendText(text);
}

void RendezvousClient::StartKeepalive() {
    if (config_.heartbeat_interval.count() <= 0) {
        return;
    }
    keepalive_ = std::thread([this] { KeepaliveLoop(); });
}

void RendezvousClient::KeepaliveLoop() {
    std::unique_lock lock(keepalive_mutex_);
    while (!keepalive_cv_.wait_for(lock, config_.heartbeat_interval, [this] { return stopping_; })) {
        lock.unlock();
        auto sent = SendHeartbeat();
        lock.lock();
        if (sent.IsErr()) {
            spdlog::warn("Keepalive stopped, no further heartbeats will be sent: {}", sent.UnwrapErr().Describe());
            return;
        }
    }
}

void RendezvousClient::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(keepalive_mutex_);
        stopping_ = true;
    }
    keepalive_cv_.notify_all();
    if (keepalive_.joinable()) {
        keepalive_.join();
    }
    transport_->Close();
    events_->Close();
}

} // namespace peerdrop::signaling
