#pragma once

#include "peerdrop/interfaces/i_signaling_transport.hpp"

#include <memory>

namespace peerdrop::signaling {

/**
 * @brief Secure WebSocket (wss://) connection built on Boost.Beast
 *
 * Open() connects on the calling thread with each setup step bounded by a
 * timeout, then a dedicated io thread runs the read loop and serialises
 * writes. SendText() blocks
 * until its frame has been written.
 */
class WebSocketTransport final : public interfaces::ISignalingTransport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    [[nodiscard]] Result<Unit, PeerDropFailure> Open(
        const interfaces::SignalingEndpoint& endpoint,
        TextHandler on_text,
        ClosedHandler on_closed) override;

    [[nodiscard]] Result<Unit, PeerDropFailure> SendText(const std::string& text) override;

    void Close() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace peerdrop::signaling
