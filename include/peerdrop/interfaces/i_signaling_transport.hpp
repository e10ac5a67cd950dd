#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <string>
namespace peerdrop::interfaces {
struct SignalingEndpoint {
    std::string host;
    uint16_t port = 443;
    /// Request target: path plus query string.
    std::string target;
};
/**
 * Text-message pipe to the rendezvous server.
 *
 * on_text runs for every inbound text frame; on_closed runs exactly once,
 * after the last on_text, when the connection ends for any reason.
 */
class ISignalingTransport {
public:
    using TextHandler = std::function<void(std::string)>;
    using ClosedHandler = std::function<void()>;
    virtual ~ISignalingTransport() = default;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> Open(
        const SignalingEndpoint& endpoint, TextHandler on_text, ClosedHandler on_closed) = 0;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> SendText(const std::string& text) = 0;
    virtual void Close() = 0;
};
}
