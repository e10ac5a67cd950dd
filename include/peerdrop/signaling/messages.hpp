#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"
#include "peerdrop/rtc/types.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace peerdrop::signaling {

// ============================================================================
// Inbound events
// ============================================================================

struct OpenEvent {};
struct IdTakenEvent {};
struct InvalidKeyEvent {};

struct ErrorEvent {
    std::string message;
};

struct OfferEvent {
    std::string src;
    rtc::SessionDescription description;
    std::string connection_id;
};

struct AnswerEvent {
    std::string src;
    rtc::SessionDescription description;
    std::string connection_id;
};

struct CandidateEvent {
    std::string src;
    rtc::IceCandidate candidate;
    std::string connection_id;
};

struct LeaveEvent {
    std::string src;
};

struct ExpireEvent {};
struct HeartbeatEvent {};

using SignalingEvent = std::variant<
    OpenEvent,
    IdTakenEvent,
    InvalidKeyEvent,
    ErrorEvent,
    OfferEvent,
    AnswerEvent,
    CandidateEvent,
    LeaveEvent,
    ExpireEvent,
    HeartbeatEvent>;

/// Wire name of the event ("OPEN", "OFFER", ...).
[[nodiscard]] std::string_view EventName(const SignalingEvent& event) noexcept;

/**
 * @brief Parse one text frame from the rendezvous server
 *
 * Fails with Decode when the frame is not JSON, has an unknown type, or
 * lacks a field its type requires.
 */
[[nodiscard]] Result<SignalingEvent, PeerDropFailure> ParseServerMessage(std::string_view text);

// ============================================================================
// Outbound messages
// ============================================================================

std::string MakeHeartbeat();

std::string MakeOffer(const std::string& src,
                      const std::string& dst,
                      const rtc::SessionDescription& description,
                      const std::string& connection_id);

std::string MakeAnswer(const std::string& src,
                       const std::string& dst,
                       const rtc::SessionDescription& description,
                       const std::string& connection_id);

std::string MakeCandidate(const std::string& src,
                          const std::string& dst,
                          const rtc::IceCandidate& candidate,
                          const std::string& connection_id);

} // namespace peerdrop::signaling
