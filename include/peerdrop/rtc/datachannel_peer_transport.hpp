#pragma once

#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/interfaces/i_data_channel.hpp"
#include "peerdrop/interfaces/i_peer_transport.hpp"
#include "peerdrop/rtc/types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace rtc {
class DataChannel;
class PeerConnection;
}

namespace peerdrop::rtc {

/**
 * @brief IDataChannel over a libdatachannel data channel
 *
 * Text and binary messages are both delivered as raw bytes.
 */
class DataChannelAdapter final : public interfaces::IDataChannel {
public:
    explicit DataChannelAdapter(std::shared_ptr<::rtc::DataChannel> channel);
    ~DataChannelAdapter() override;

    [[nodiscard]] std::string Label() const override;
    [[nodiscard]] bool IsOpen() const override;
    [[nodiscard]] Result<Unit, PeerDropFailure> Send(std::span<const uint8_t> message) override;
    void OnOpen(std::function<void()> handler) override;
    void OnMessage(std::function<void(std::vector<uint8_t>)> handler) override;
    void OnClosed(std::function<void()> handler) override;
    void Close() override;

private:
    std::shared_ptr<::rtc::DataChannel> channel_;
};

/**
 * @brief IPeerTransport backed by a libdatachannel PeerConnection
 *
 * Automatic negotiation is disabled: CreateOffer() and CreateAnswer()
 * generate and apply the local description in one step, and the following
 * SetLocalDescription() only confirms it. Engine exceptions are reported
 * as Connection failures.
 */
class DataChannelPeerTransport final : public interfaces::IPeerTransport {
public:
    [[nodiscard]] static Result<std::shared_ptr<DataChannelPeerTransport>, PeerDropFailure> Create(
        const configuration::PeerTransportConfig& config);

    ~DataChannelPeerTransport() override;

    DataChannelPeerTransport(const DataChannelPeerTransport&) = delete;
    DataChannelPeerTransport& operator=(const DataChannelPeerTransport&) = delete;

    [[nodiscard]] Result<std::shared_ptr<interfaces::IDataChannel>, PeerDropFailure> CreateDataChannel(
        const std::string& label) override;
    [[nodiscard]] Result<SessionDescription, PeerDropFailure> CreateOffer() override;
    [[nodiscard]] Result<SessionDescription, PeerDropFailure> CreateAnswer() override;
    [[nodiscard]] Result<Unit, PeerDropFailure> SetLocalDescription(const SessionDescription& description) override;
    [[nodiscard]] Result<Unit, PeerDropFailure> SetRemoteDescription(const SessionDescription& description) override;
    [[nodiscard]] Result<Unit, PeerDropFailure> AddCandidate(const IceCandidate& candidate) override;
    void OnCandidate(std::function<void(IceCandidate)> handler) override;
    void OnConnectionStateChange(std::function<void(ConnectionState)> handler) override;
    void OnIncomingDataChannel(std::function<void(std::shared_ptr<interfaces::IDataChannel>)> handler) override;
    void Close() override;

private:
    explicit DataChannelPeerTransport(std::shared_ptr<::rtc::PeerConnection> connection);

    Result<SessionDescription, PeerDropFailure> GenerateLocal(DescriptionType type);

    std::shared_ptr<::rtc::PeerConnection> connection_;
};

/// Route libdatachannel's own log output through spdlog at warning level.
void InitEngineLogging();

} // namespace peerdrop::rtc
