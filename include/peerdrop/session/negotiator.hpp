#pragma once

#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/channel.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/identity/peer_id.hpp"
#include "peerdrop/interfaces/i_peer_transport.hpp"
#include "peerdrop/rtc/types.hpp"
#include "peerdrop/signaling/rendezvous_client.hpp"
#include "peerdrop/transfer/message_link.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::session {

/// An open data channel together with the peer it leads to.
struct EstablishedChannel {
    std::string remote;
    std::string connection_id;
    transfer::MessageLink link;
};

/**
 * @brief Write-once slots for the local and the remote session description
 *
 * A second write to either slot is a protocol violation and fails with
 * Connection without touching the peer transport.
 */
class DescriptionSlots {
public:
    [[nodiscard]] Result<Unit, PeerDropFailure> SetLocal(
        interfaces::IPeerTransport& transport, const rtc::SessionDescription& description);

    [[nodiscard]] Result<Unit, PeerDropFailure> SetRemote(
        interfaces::IPeerTransport& transport, const rtc::SessionDescription& description);

    [[nodiscard]] bool HasLocal() const noexcept { return local_set_; }
    [[nodiscard]] bool HasRemote() const noexcept { return remote_set_; }

private:
    bool local_set_ = false;
    bool remote_set_ = false;
};

/**
 * @brief Drives one offer/answer exchange until a data channel opens
 *
 * The exchange loop waits on the signaling events, locally gathered
 * candidates, incoming data channels, the local channel's open
 * notification and peer-connection state changes, bounded by
 * NegotiationConfig::deadline. Any failure closes the peer transport and
 * ends all network activity of the negotiator.
 *
 * One Negotiator runs at most one session.
 */
class Negotiator {
public:
    Negotiator(signaling::RendezvousClient& client,
               std::shared_ptr<interfaces::IPeerTransport> transport,
               configuration::NegotiationConfig config);
    ~Negotiator();

    Negotiator(const Negotiator&) = delete;
    Negotiator& operator=(const Negotiator&) = delete;

    /**
     * @brief Create the data channel, send an offer to remote and wait for it to open
     */
    [[nodiscard]] Result<EstablishedChannel, PeerDropFailure> RunOfferer(const identity::PeerId& remote);

    /**
     * @brief Wait for an offer, answer it and adopt the first incoming data channel
     *
     * Waiting for the offer has no deadline; heartbeats are answered meanwhile.
     */
    [[nodiscard]] Result<EstablishedChannel, PeerDropFailure> RunAnswerer();

    /// Close the peer transport. Idempotent.
    void Close();

private:
    enum class Role {
        Offerer,
        Answerer
    };

    struct Session {
        Role role;
        std::string remote;
        std::string connection_id;
        std::optional<transfer::MessageLink> local_link;
    };

    Result<EstablishedChannel, PeerDropFailure> Exchange(Session session);
    Result<Unit, PeerDropFailure> HandleSignalingEvent(const Session& session, const signaling::SignalingEvent& event);
    Result<Unit, PeerDropFailure> ApplyRemoteDescription(const rtc::SessionDescription& description);
    void AddRemoteCandidate(const rtc::IceCandidate& candidate);
    Result<Unit, PeerDropFailure> BeginSession();
    Result<EstablishedChannel, PeerDropFailure> Established(const Session& session, transfer::MessageLink link);
    Result<EstablishedChannel, PeerDropFailure> Fail(PeerDropFailure failure);

    signaling::RendezvousClient& client_;
    std::shared_ptr<interfaces::IPeerTransport> transport_;
    configuration::NegotiationConfig config_;
    DescriptionSlots slots_;

    std::shared_ptr<Channel<rtc::IceCandidate>> local_candidates_;
    std::shared_ptr<Channel<transfer::MessageLink>> incoming_channels_;
    std::shared_ptr<Channel<Unit>> channel_open_;
    std::shared_ptr<Channel<rtc::ConnectionState>> state_changes_;
    std::vector<rtc::IceCandidate> pending_remote_candidates_;

    bool started_ = false;
    bool closed_ = false;
};

} // namespace peerdrop::session
