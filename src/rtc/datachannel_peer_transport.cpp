#include "peerdrop/rtc/datachannel_peer_transport.hpp"
#include "peerdrop/core/format.hpp"

#include <rtc/rtc.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <mutex>
#include <variant>

namespace peerdrop::rtc {

namespace {

PeerDropFailure EngineFailure(const std::exception& ex) {
    return PeerDropFailure::Connection(ex.what());
}

ConnectionState FromEngineState(const ::rtc::PeerConnection::State state) {
    switch (state) {
        case ::rtc::PeerConnection::State::New: return ConnectionState::New;
        case ::rtc::PeerConnection::State::Connecting: return ConnectionState::Connecting;
        case ::rtc::PeerConnection::State::Connected: return ConnectionState::Connected;
        case ::rtc::PeerConnection::State::Disconnected: return ConnectionState::Disconnected;
        case ::rtc::PeerConnection::State::Failed: return ConnectionState::Failed;
        case ::rtc::PeerConnection::State::Closed: return ConnectionState::Closed;
    }
    return ConnectionState::Failed;
}

::rtc::Description::Type ToEngineType(const DescriptionType type) {
    return type == DescriptionType::Offer ? ::rtc::Description::Type::Offer
                                          : ::rtc::Description::Type::Answer;
}

std::vector<uint8_t> ToBytes(const ::rtc::message_variant& message) {
    if (const auto* binary = std::get_if<::rtc::binary>(&message)) {
        std::vector<uint8_t> bytes(binary->size());
        for (size_t i = 0; i < binary->size(); ++i) {
            bytes[i] = static_cast<uint8_t>((*binary)[i]);
        }
        return bytes;
    }
    const auto& text = std::get<std::string>(message);
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

// ============================================================================
// DataChannelAdapter
// ============================================================================

DataChannelAdapter::DataChannelAdapter(std::shared_ptr<::rtc::DataChannel> channel)
    : channel_(std::move(channel)) {}

DataChannelAdapter::~DataChannelAdapter() {
    channel_->resetCallbacks();
}

std::string DataChannelAdapter::Label() const {
    return channel_->label();
}

bool DataChannelAdapter::IsOpen() const {
    return channel_->isOpen();
}

Result<Unit, PeerDropFailure> DataChannelAdapter::Send(std::span<const uint8_t> message) {
    if (!channel_->isOpen()) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::ChannelClosed("Data channel is not open"));
    }
    return Result<Unit, PeerDropFailure>::Try(
        [&] {
            channel_->send(reinterpret_cast<const std::byte*>(message.data()), message.size());
        },
        EngineFailure);
}

void DataChannelAdapter::OnOpen(std::function<void()> handler) {
    channel_->onOpen(std::move(handler));
}

void DataChannelAdapter::OnMessage(std::function<void(std::vector<uint8_t>)> handler) {
    channel_->onMessage([handler = std::move(handler)](::rtc::message_variant message) {
        handler(ToBytes(message));
    });
}

void DataChannelAdapter::OnClosed(std::function<void()> handler) {
    channel_->onClosed(std::move(handler));
}

void DataChannelAdapter::Close() {
    try {
        channel_->close();
    } catch (const std::exception& ex) {
        spdlog::debug("Data channel close: {}", ex.what());
    }
}

// ============================================================================
// DataChannelPeerTransport
// ============================================================================

Result<std::shared_ptr<DataChannelPeerTransport>, PeerDropFailure> DataChannelPeerTransport::Create(
    const configuration::PeerTransportConfig& config) {
    using CreateResult = Result<std::shared_ptr<DataChannelPeerTransport>, PeerDropFailure>;

    if (auto valid = config.Validate(); valid.IsErr()) {
        return CreateResult::Err(std::move(valid).UnwrapErr());
    }

    return CreateResult::Try(
        [&] {
            ::rtc::Configuration engine_config;
            engine_config.disableAutoNegotiation = true;
            for (const auto& server : config.ice_servers) {
                ::rtc::IceServer ice_server(server.url);
                if (!server.username.empty()) {
                    ice_server.username = server.username;
                    ice_server.password = server.credential;
                }
                engine_config.iceServers.push_back(std::move(ice_server));
            }
            auto connection = std::make_shared<::rtc::PeerConnection>(engine_config);
            return std::shared_ptr<DataChannelPeerTransport>(
                new DataChannelPeerTransport(std::move(connection)));
        },
        EngineFailure);
}

DataChannelPeerTransport::DataChannelPeerTransport(std::shared_ptr<::rtc::PeerConnection> connection)
    : connection_(std::move(connection)) {}

DataChannelPeerTransport::~DataChannelPeerTransport() {
    Close();
}

Result<std::shared_ptr<interfaces::IDataChannel>, PeerDropFailure> DataChannelPeerTransport::CreateDataChannel(
    const std::string& label) {
    return Result<std::shared_ptr<interfaces::IDataChannel>, PeerDropFailure>::Try(
        [&]() -> std::shared_ptr<interfaces::IDataChannel> {
            return std::make_shared<DataChannelAdapter>(connection_->createDataChannel(label));
        },
        EngineFailure);
}

Result<SessionDescription, PeerDropFailure> DataChannelPeerTransport::GenerateLocal(const DescriptionType type) {
    using DescriptionResult = Result<SessionDescription, PeerDropFailure>;

    auto applied = Result<Unit, PeerDropFailure>::Try(
        [&] { connection_->setLocalDescription(ToEngineType(type)); },
        EngineFailure);
    if (applied.IsErr()) {
        return DescriptionResult::Err(std::move(applied).UnwrapErr());
    }

    const auto local = connection_->localDescription();
    if (!local.has_value()) {
        return DescriptionResult::Err(PeerDropFailure::Connection(compat::format(
            "No local {} was generated", ToString(type))));
    }
    return DescriptionResult::Ok(SessionDescription{type, std::string(*local)});
}

Result<SessionDescription, PeerDropFailure> DataChannelPeerTransport::CreateOffer() {
    return GenerateLocal(DescriptionType::Offer);
}

Result<SessionDescription, PeerDropFailure> DataChannelPeerTransport::CreateAnswer() {
    return GenerateLocal(DescriptionType::Answer);
}

Result<Unit, PeerDropFailure> DataChannelPeerTransport::SetLocalDescription(const SessionDescription& description) {
    const auto local = connection_->localDescription();
    if (!local.has_value() || local->type() != ToEngineType(description.type)) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Connection(compat::format(
            "Local {} was not generated by this transport", ToString(description.type))));
    }
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

Result<Unit, PeerDropFailure> DataChannelPeerTransport::SetRemoteDescription(const SessionDescription& description) {
    return Result<Unit, PeerDropFailure>::Try(
        [&] {
            connection_->setRemoteDescription(
                ::rtc::Description(description.sdp, std::string(ToString(description.type))));
        },
        EngineFailure);
}

Result<Unit, PeerDropFailure> DataChannelPeerTransport::AddCandidate(const IceCandidate& candidate) {
    return Result<Unit, PeerDropFailure>::Try(
        [&] {
            connection_->addRemoteCandidate(
                ::rtc::Candidate(candidate.candidate, candidate.sdp_mid.value_or("")));
        },
        EngineFailure);
}

void DataChannelPeerTransport::OnCandidate(std::function<void(IceCandidate)> handler) {
    connection_->onLocalCandidate([handler = std::move(handler)](::rtc::Candidate candidate) {
        IceCandidate local;
        local.candidate = candidate.candidate();
        local.sdp_mid = candidate.mid();
        // Data-only sessions carry a single application m-line.
        local.sdp_mline_index = 0;
        handler(std::move(local));
    });
}

void DataChannelPeerTransport::OnConnectionStateChange(std::function<void(ConnectionState)> handler) {
    connection_->onStateChange([handler = std::move(handler)](::rtc::PeerConnection::State state) {
        handler(FromEngineState(state));
    });
}

void DataChannelPeerTransport::OnIncomingDataChannel(
    std::function<void(std::shared_ptr<interfaces::IDataChannel>)> handler) {
    connection_->onDataChannel([handler = std::move(handler)](std::shared_ptr<::rtc::DataChannel> channel) {
        handler(std::make_shared<DataChannelAdapter>(std::move(channel)));
    });
}

void DataChannelPeerTransport::Close() {
    try {
        connection_->close();
    } catch (const std::exception& ex) {
        spdlog::debug("Peer connection close: {}", ex.what());
    }
}

void InitEngineLogging() {
    static std::once_flag once;
    std::call_once(once, [] {
        ::rtc::InitLogger(::rtc::LogLevel::Warning, [](::rtc::LogLevel level, std::string message) {
            if (level <= ::rtc::LogLevel::Error) {
                spdlog::error("[rtc] {}", message);
            } else {
                spdlog::warn("[rtc] {}", message);
            }
        });
    });
}

} // namespace peerdrop::rtc
