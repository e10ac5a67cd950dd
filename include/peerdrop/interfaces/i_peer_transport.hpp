#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/interfaces/i_data_channel.hpp"
#include "peerdrop/rtc/types.hpp"
#include <functional>
#include <memory>
#include <string>
namespace peerdrop::interfaces {
/**
 * Capability surface of the connectivity engine (ICE, DTLS, SCTP).
 *
 * Callbacks may fire on engine threads; implementations must accept
 * handler registration before any description is set.
 */
class IPeerTransport {
public:
    virtual ~IPeerTransport() = default;
    [[nodiscard]] virtual Result<std::shared_ptr<IDataChannel>, PeerDropFailure> CreateDataChannel(
        const std::string& label) = 0;
    [[nodiscard]] virtual Result<rtc::SessionDescription, PeerDropFailure> CreateOffer() = 0;
    [[nodiscard]] virtual Result<rtc::SessionDescription, PeerDropFailure> CreateAnswer() = 0;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> SetLocalDescription(
        const rtc::SessionDescription& description) = 0;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> SetRemoteDescription(
        const rtc::SessionDescription& description) = 0;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> AddCandidate(const rtc::IceCandidate& candidate) = 0;
    virtual void OnCandidate(std::function<void(rtc::IceCandidate)> handler) = 0;
    virtual void OnConnectionStateChange(std::function<void(rtc::ConnectionState)> handler) = 0;
    virtual void OnIncomingDataChannel(std::function<void(std::shared_ptr<IDataChannel>)> handler) = 0;
    virtual void Close() = 0;
};
}
