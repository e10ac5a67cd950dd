#pragma once

#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/channel.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/identity/peer_id.hpp"
#include "peerdrop/interfaces/i_signaling_transport.hpp"
#include "peerdrop/rtc/types.hpp"
#include "peerdrop/signaling/messages.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace peerdrop::signaling {

/**
 * @brief Client for the PeerJS rendezvous protocol
 *
 * Inbound frames are parsed on the transport's thread into typed events
 * and queued; frames that do not parse are logged and dropped. The queue
 * closes when the connection ends.
 *
 * Keepalive: every HEARTBEAT a caller takes off the queue must be answered
 * with exactly one SendHeartbeat(). WaitForOpen() does this itself. The
 * client additionally sends a heartbeat every
 * SignalingConfig::heartbeat_interval while it is open.
 */
class RendezvousClient {
public:
    using EventQueue = Channel<SignalingEvent>;

    /**
     * @brief Register at the configured server over a secure WebSocket
     */
    static Result<std::unique_ptr<RendezvousClient>, PeerDropFailure> Connect(
        const identity::PeerId& local_id,
        const configuration::SignalingConfig& config);

    static Result<std::unique_ptr<RendezvousClient>, PeerDropFailure> Connect(
        const identity::PeerId& local_id,
        const configuration::SignalingConfig& config,
        std::unique_ptr<interfaces::ISignalingTransport> transport);

    ~RendezvousClient();

    RendezvousClient(const RendezvousClient&) = delete;
    RendezvousClient& operator=(const RendezvousClient&) = delete;

    /**
     * @brief Block until the server confirms the registration
     *
     * @return PeerIdTaken, InvalidApiKey or Signaling on a negative reply,
     *         ChannelClosed if the connection ends first
     */
    [[nodiscard]] Result<Unit, PeerDropFailure> WaitForOpen();

    /// Next event, or ChannelClosed once the connection has ended.
    [[nodiscard]] Result<SignalingEvent, PeerDropFailure> RecvEvent();

    [[nodiscard]] EventQueue& Events() noexcept { return *events_; }

    [[nodiscard]] Result<Unit, PeerDropFailure> SendOffer(
        const std::string& dst,
        const rtc::SessionDescription& description,
        const std::string& connection_id);

    [[nodiscard]] Result<Unit, PeerDropFailure> SendAnswer(
        const std::string& dst,
        const rtc::SessionDescription& description,
        const std::string& connection_id);

    [[nodiscard]] Result<Unit, PeerDropFailure> SendCandidate(
        const std::string& dst,
        const rtc::IceCandidate& candidate,
        const std::string& connection_id);

    [[nodiscard]] Result<Unit, PeerDropFailure> SendHeartbeat();

    [[nodiscard]] const identity::PeerId& LocalId() const noexcept { return local_id_; }

    /// Stop the keepalive, close the connection and the event queue. Idempotent.
    void Close();

private:
    RendezvousClient(identity::PeerId local_id,
                     configuration::SignalingConfig config,
                     std::unique_ptr<interfaces::ISignalingTransport> transport);

    Result<Unit, PeerDropFailure> SendRaw(const std::string& text);
    void StartKeepalive();
    void KeepaliveLoop();

    identity::PeerId local_id_;
    configuration::SignalingConfig config_;
    std::unique_ptr<interfaces::ISignalingTransport> transport_;
    std::shared_ptr<EventQueue> events_;

    std::thread keepalive_;
    std::mutex keepalive_mutex_;
    std::condition_variable keepalive_cv_;
    bool stopping_ = false;
    std::atomic<bool> closed_{false};
};

} // namespace peerdrop::signaling
