#include "peerdrop/session/negotiator.hpp"
#include "peerdrop/core/format.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

namespace peerdrop::session {

using NegotiationResult = Result<EstablishedChannel, PeerDropFailure>;

namespace {

void LogDroppedCandidate(const PeerDropFailure& failure) {
    spdlog::warn("Dropped remote candidate: {}", failure.Describe());
}

} // namespace

// ============================================================================
// DescriptionSlots
// ============================================================================

Result<Unit, PeerDropFailure> DescriptionSlots::SetLocal(
    interfaces::IPeerTransport& transport, const rtc::SessionDescription& description) {
    if (local_set_) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Connection("Local description already set"));
    }
    if (auto applied = transport.SetLocalDescription(description); applied.IsErr()) {
        return applied;
    }
    local_set_ = true;
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

Result<Unit, PeerDropFailure> DescriptionSlots::SetRemote(
    interfaces::IPeerTransport& transport, const rtc::SessionDescription& description) {
    if (remote_set_) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Connection("Remote description already set"));
    }
    if (auto applied = transport.SetRemoteDescription(description); applied.IsErr()) {
        return applied;
    }
    remote_set_ = true;
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

// ============================================================================
// Negotiator
// ============================================================================

Negotiator::Negotiator(signaling::RendezvousClient& client,
                       std::shared_ptr<interfaces::IPeerTransport> transport,
                       configuration::NegotiationConfig config)
    : client_(client)
    , transport_(std::move(transport))
    , config_(std::move(config))
    , local_candidates_(std::make_shared<Channel<rtc::IceCandidate>>())
    , incoming_channels_(std::make_shared<Channel<transfer::MessageLink>>())
    , channel_open_(std::make_shared<Channel<Unit>>())
    , state_changes_(std::make_shared<Channel<rtc::ConnectionState>>()) {
    transport_->OnCandidate([candidates = local_candidates_](rtc::IceCandidate candidate) {
        candidates->Send(std::move(candidate));
    });
    transport_->OnConnectionStateChange([states = state_changes_](const rtc::ConnectionState state) {
        states->Send(state);
    });
    // Attach on the engine thread so nothing sent right after open is lost.
    transport_->OnIncomingDataChannel([incoming = incoming_channels_](
                                          std::shared_ptr<interfaces::IDataChannel> channel) {
        incoming->Send(transfer::MessageLink::Attach(std::move(channel)));
    });
}

Negotiator::~Negotiator() {
    Close();
}

void Negotiator::Close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    transport_->Close();
    local_candidates_->Close();
    incoming_channels_->Close();
    channel_open_->Close();
    state_changes_->Close();
}

Result<Unit, PeerDropFailure> Negotiator::BeginSession() {
    if (closed_) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Connection("Negotiator is closed"));
    }
    if (started_) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::InvalidInput("Negotiator already ran a session"));
    }
    started_ = true;
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

NegotiationResult Negotiator::RunOfferer(const identity::PeerId& remote) {
    if (auto begun = BeginSession(); begun.IsErr()) {
        return NegotiationResult::Err(std::move(begun).UnwrapErr());
    }

    auto created = transport_->CreateDataChannel(config_.channel_label);
    if (created.IsErr()) {
        return Fail(std::move(created).UnwrapErr());
    }
    auto channel = std::move(created).Unwrap();
    auto link = transfer::MessageLink::Attach(channel);
    channel->OnOpen([open = channel_open_] {
        open->Send(unit);
    });
    if (channel->IsOpen()) {
        channel_open_->Send(unit);
    }

    auto offer = transport_->CreateOffer();
    if (offer.IsErr()) {
        return Fail(std::move(offer).UnwrapErr());
    }
    const auto description = std::move(offer).Unwrap();
    if (auto applied = slots_.SetLocal(*transport_, description); applied.IsErr()) {
        return Fail(std::move(applied).UnwrapErr());
    }

    const std::string connection_id = identity::GenerateConnectionId();
    if (auto sent = client_.SendOffer(remote.Value(), description, connection_id); sent.IsErr()) {
        return Fail(std::move(sent).UnwrapErr());
    }
    spdlog::info("Sent offer to {}", remote.Value());
    spdlog::debug("Offer SDP length: {}", description.sdp.size());

    return Exchange(Session{Role::Offerer, remote.Value(), connection_id, std::move(link)});
}

NegotiationResult Negotiator::RunAnswerer() {
    if (auto begun = BeginSession(); begun.IsErr()) {
        return NegotiationResult::Err(std::move(begun).UnwrapErr());
    }

    std::optional<signaling::OfferEvent> offer;
    while (!offer.has_value()) {
        auto received = client_.RecvEvent();
        if (received.IsErr()) {
            return Fail(std::move(received).UnwrapErr());
        }
        auto event = std::move(received).Unwrap();
        if (auto* incoming = std::get_if<signaling::OfferEvent>(&event)) {
            offer = std::move(*incoming);
        } else if (std::holds_alternative<signaling::HeartbeatEvent>(event)) {
            if (auto sent = client_.SendHeartbeat(); sent.IsErr()) {
                return Fail(std::move(sent).UnwrapErr());
            }
        } else if (const auto* error = std::get_if<signaling::ErrorEvent>(&event)) {
            return Fail(PeerDropFailure::Signaling(error->message));
        } else {
            spdlog::debug("Ignoring {} while waiting for an offer", signaling::EventName(event));
        }
    }

    spdlog::info("Received offer from {}", offer->src);
    spdlog::debug("Offer SDP length: {}", offer->description.sdp.size());

    if (auto applied = ApplyRemoteDescription(offer->description); applied.IsErr()) {
        return Fail(std::move(applied).UnwrapErr());
    }
    auto answer = transport_->CreateAnswer();
    if (answer.IsErr()) {
        return Fail(std::move(answer).UnwrapErr());
    }
    const auto description = std::move(answer).Unwrap();
    if (auto applied = slots_.SetLocal(*transport_, description); applied.IsErr()) {
        return Fail(std::move(applied).UnwrapErr());
    }
    if (auto sent = client_.SendAnswer(offer->src, description, offer->connection_id); sent.IsErr()) {
        return Fail(std::move(sent).UnwrapErr());
    }
    spdlog::info("Sent answer to {}", offer->src);

    return Exchange(Session{Role::Answerer, offer->src, offer->connection_id, std::nullopt});
}

NegotiationResult Negotiator::Exchange(Session session) {
    Selector selector;
    const size_t signaling_slot = selector.Watch(client_.Events());
    const size_t candidate_slot = selector.Watch(*local_candidates_);
    const size_t incoming_slot = selector.Watch(*incoming_channels_);
    const size_t open_slot = selector.Watch(*channel_open_);
    const size_t state_slot = selector.Watch(*state_changes_);

    const auto deadline = std::chrono::steady_clock::now() + config_.deadline;
    while (true) {
        const auto slot = selector.WaitUntil(deadline);
        if (!slot.has_value()) {
            return Fail(PeerDropFailure::Timeout(compat::format(
                "No data channel with {} within {} ms", session.remote, config_.deadline.count())));
        }

        if (*slot == signaling_slot) {
            auto event = client_.Events().TryReceive();
            if (!event.has_value()) {
                return Fail(PeerDropFailure::Signaling("Rendezvous connection closed during negotiation"));
            }
            if (auto handled = HandleSignalingEvent(session, *event); handled.IsErr()) {
                return Fail(std::move(handled).UnwrapErr());
            }
        } else if (*slot == candidate_slot) {
            auto candidate = local_candidates_->TryReceive();
            if (!candidate.has_value()) {
                return Fail(PeerDropFailure::Connection("Peer transport closed"));
            }
            auto sent = client_.SendCandidate(session.remote, *candidate, session.connection_id);
            sent.InspectErr([](const PeerDropFailure& failure) {
                spdlog::warn("Could not relay local candidate: {}", failure.Describe());
            });
        } else if (*slot == incoming_slot) {
            auto link = incoming_channels_->TryReceive();
            if (!link.has_value()) {
                return Fail(PeerDropFailure::Connection("Peer transport closed"));
            }
            if (session.role == Role::Answerer) {
                spdlog::info("Received data channel: {}", link->DataChannel().Label());
                return Established(session, std::move(*link));
            }
            spdlog::debug("Ignoring remote data channel {}", link->DataChannel().Label());
        } else if (*slot == open_slot) {
            if (!channel_open_->TryReceive().has_value()) {
                return Fail(PeerDropFailure::Connection("Peer transport closed"));
            }
            if (session.role == Role::Offerer && session.local_link.has_value()) {
                spdlog::info("Data channel opened");
                return Established(session, std::move(*session.local_link));
            }
        } else if (*slot == state_slot) {
            auto state = state_changes_->TryReceive();
            if (!state.has_value()) {
                return Fail(PeerDropFailure::Connection("Peer transport closed"));
            }
            spdlog::debug("Peer connection state: {}", rtc::ToString(*state));
            if (*state == rtc::ConnectionState::Failed) {
                return Fail(PeerDropFailure::Connection("Peer connection failed"));
            }
            if (*state == rtc::ConnectionState::Closed) {
                return Fail(PeerDropFailure::Connection("Peer connection closed"));
            }
        }
    }
}

Result<Unit, PeerDropFailure> Negotiator::HandleSignalingEvent(
    const Session& session, const signaling::SignalingEvent& event) {
    return std::visit([&](const auto& message) -> Result<Unit, PeerDropFailure> {
        using Event = std::decay_t<decltype(message)>;

        if constexpr (std::is_same_v<Event, signaling::AnswerEvent>) {
            if (session.role != Role::Offerer || message.src != session.remote) {
                spdlog::debug("Ignoring answer from {}", message.src);
                return Result<Unit, PeerDropFailure>::Ok(unit);
            }
            spdlog::info("Received answer from {}", message.src);
            return ApplyRemoteDescription(message.description);
        } else if constexpr (std::is_same_v<Event, signaling::OfferEvent>) {
            if (message.src != session.remote) {
                spdlog::debug("Ignoring offer from {}", message.src);
                return Result<Unit, PeerDropFailure>::Ok(unit);
            }
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::Connection("Unexpected offer during negotiation"));
        } else if constexpr (std::is_same_v<Event, signaling::CandidateEvent>) {
            if (message.src != session.remote) {
                spdlog::debug("Ignoring candidate from {}", message.src);
                return Result<Unit, PeerDropFailure>::Ok(unit);
            }
            AddRemoteCandidate(message.candidate);
            return Result<Unit, PeerDropFailure>::Ok(unit);
        } else if constexpr (std::is_same_v<Event, signaling::HeartbeatEvent>) {
            return client_.SendHeartbeat();
        } else if constexpr (std::is_same_v<Event, signaling::LeaveEvent>) {
            if (message.src != session.remote) {
                return Result<Unit, PeerDropFailure>::Ok(unit);
            }
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Connection(
                compat::format("Peer {} left", message.src)));
        } else if constexpr (std::is_same_v<Event, signaling::ExpireEvent>) {
            return Result<Unit, PeerDropFailure>::Err(
                PeerDropFailure::Connection("Connection expired - peer not found"));
        } else if constexpr (std::is_same_v<Event, signaling::ErrorEvent>) {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Signaling(message.message));
        } else {
            spdlog::debug("Ignoring {} during negotiation", signaling::EventName(event));
            return Result<Unit, PeerDropFailure>::Ok(unit);
        }
    }, event);
}

Result<Unit, PeerDropFailure> Negotiator::ApplyRemoteDescription(const rtc::SessionDescription& description) {
    if (auto applied = slots_.SetRemote(*transport_, description); applied.IsErr()) {
        return applied;
    }
    for (const auto& candidate : pending_remote_candidates_) {
        auto added = transport_->AddCandidate(candidate);
        added.InspectErr(LogDroppedCandidate);
    }
    pending_remote_candidates_.clear();
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

void Negotiator::AddRemoteCandidate(const rtc::IceCandidate& candidate) {
    // Candidates can overtake the answer on the rendezvous server.
    if (!slots_.HasRemote()) {
        pending_remote_candidates_.push_back(candidate);
        return;
    }
    auto added = transport_->AddCandidate(candidate);
    added.InspectErr(LogDroppedCandidate);
}

NegotiationResult Negotiator::Established(const Session& session, transfer::MessageLink link) {
    if (config_.settle_delay.count() > 0) {
        std::this_thread::sleep_for(config_.settle_delay);
    }
    return NegotiationResult::Ok(EstablishedChannel{session.remote, session.connection_id, std::move(link)});
}

NegotiationResult Negotiator::Fail(PeerDropFailure failure) {
    spdlog::debug("Negotiation failed: {}", failure.Describe());
    Close();
    return NegotiationResult::Err(std::move(failure));
}

} // namespace peerdrop::session
