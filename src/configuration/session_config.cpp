#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"

namespace peerdrop::configuration {

namespace {

bool ContainsUrlUnsafe(const std::string& text) {
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7F || c == '/' || c == '?' || c == '#' || c == '&' || c == '@') {
            return true;
        }
    }
    return false;
}

Result<Unit, PeerDropFailure> Invalid(std::string message) {
    return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::InvalidInput(std::move(message)));
}

} // namespace

SignalingConfig SignalingConfig::Default() {
    SignalingConfig config;
    config.host = std::string(kDefaultSignalingHost);
    config.port = kDefaultSignalingPort;
    config.path = std::string(kDefaultSignalingPath);
    config.api_key = std::string(kDefaultSignalingApiKey);
    config.heartbeat_interval = kDefaultHeartbeatInterval;
    return config;
}

Result<Unit, PeerDropFailure> SignalingConfig::Validate() const {
    if (host.empty() || ContainsUrlUnsafe(host)) {
        return Invalid(compat::format("Invalid signaling host '{}'", host));
    }
    if (port == 0) {
        return Invalid("Signaling port must be non-zero");
    }
    if (path.empty() || path.front() != '/') {
        return Invalid(compat::format("Signaling path must start with '/', got '{}'", path));
    }
    if (api_key.empty() || ContainsUrlUnsafe(api_key)) {
        return Invalid("Invalid signaling api key");
    }
    if (heartbeat_interval.count() < 0) {
        return Invalid("Heartbeat interval must not be negative");
    }
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

std::string SignalingConfig::RequestTarget(const std::string& peer_id, const std::string& token) const {
    return compat::format("{}?key={}&id={}&token={}", path, api_key, peer_id, token);
}

PeerTransportConfig PeerTransportConfig::Default() {
    PeerTransportConfig config;
    config.ice_servers.push_back(rtc::IceServer{std::string(kDefaultStunServer), {}, {}});
    for (const char* relay : {"turn:eu-0.turn.peerjs.com:3478", "turn:us-0.turn.peerjs.com:3478"}) {
        config.ice_servers.push_back(rtc::IceServer{
            relay, std::string(kPeerJsTurnUser), std::string(kPeerJsTurnCredential)});
    }
    return config;
}

Result<Unit, PeerDropFailure> PeerTransportConfig::Validate() const {
    for (const auto& server : ice_servers) {
        const bool stun = server.url.starts_with("stun:") || server.url.starts_with("stuns:");
        const bool turn = server.url.starts_with("turn:") || server.url.starts_with("turns:");
        if (!stun && !turn) {
            return Invalid(compat::format("Unsupported ICE server url '{}'", server.url));
        }
        if (turn && (server.username.empty() || server.credential.empty())) {
            return Invalid(compat::format("TURN server '{}' needs credentials", server.url));
        }
    }
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

NegotiationConfig NegotiationConfig::Default() {
    NegotiationConfig config;
    config.deadline = kNegotiationDeadline;
    config.settle_delay = kChannelSettleDelay;
    config.channel_label = std::string(kDataChannelLabel);
    return config;
}

Result<Unit, PeerDropFailure> NegotiationConfig::Validate() const {
    if (deadline.count() <= 0) {
        return Invalid("Negotiation deadline must be positive");
    }
    if (settle_delay.count() < 0) {
        return Invalid("Settle delay must not be negative");
    }
    if (channel_label.empty()) {
        return Invalid("Data channel label must not be empty");
    }
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

ApplicationConfig ApplicationConfig::Default() {
    ApplicationConfig config;
    config.signaling = SignalingConfig::Default();
    config.transport = PeerTransportConfig::Default();
    config.negotiation = NegotiationConfig::Default();
    return config;
}

Result<Unit, PeerDropFailure> ApplicationConfig::Validate() const {
    if (auto result = signaling.Validate(); result.IsErr()) {
        return result;
    }
    if (auto result = transport.Validate(); result.IsErr()) {
        return result;
    }
    return negotiation.Validate();
}

} // namespace peerdrop::configuration
