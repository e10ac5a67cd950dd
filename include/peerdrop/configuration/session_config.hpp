#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/rtc/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace peerdrop::configuration {

/// Where and how to reach the rendezvous (PeerJS) server.
struct SignalingConfig {
    std::string host;
    uint16_t port = 443;
    std::string path;
    std::string api_key;

    /// Period of the explicit keepalive. Zero disables it; server
    /// heartbeats are still answered.
    std::chrono::milliseconds heartbeat_interval{0};

    [[nodiscard]] static SignalingConfig Default();

    [[nodiscard]] Result<Unit, PeerDropFailure> Validate() const;

    /// Request target for the registration handshake:
    /// `{path}?key={api_key}&id={peer_id}&token={token}`
    [[nodiscard]] std::string RequestTarget(const std::string& peer_id, const std::string& token) const;
};

/// ICE servers handed to the peer-transport engine.
struct PeerTransportConfig {
    std::vector<rtc::IceServer> ice_servers;

    /// Public STUN server plus the PeerJS TURN relays
    [[nodiscard]] static PeerTransportConfig Default();

    [[nodiscard]] Result<Unit, PeerDropFailure> Validate() const;
};

struct NegotiationConfig {
    /// Bound on the exchange phase after the local description is sent.
    std::chrono::milliseconds deadline{0};

    /// Pause between channel open and handing the channel to the transfer.
    std::chrono::milliseconds settle_delay{0};

    std::string channel_label;

    [[nodiscard]] static NegotiationConfig Default();

    [[nodiscard]] Result<Unit, PeerDropFailure> Validate() const;
};

struct ApplicationConfig {
    SignalingConfig signaling;
    PeerTransportConfig transport;
    NegotiationConfig negotiation;
    bool verbose = false;

    [[nodiscard]] static ApplicationConfig Default();

    [[nodiscard]] Result<Unit, PeerDropFailure> Validate() const;
};

} // namespace peerdrop::configuration
