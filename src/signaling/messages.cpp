#include "peerdrop/signaling/messages.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace peerdrop::signaling {

using json = nlohmann::json;

namespace {

rtc::SessionDescription DescriptionFromPayload(const json& payload, const rtc::DescriptionType expected) {
    const json& sdp = payload.at("sdp");
    rtc::SessionDescription description;
    description.sdp = sdp.at("sdp").get<std::string>();
    const auto type = rtc::ParseDescriptionType(sdp.at("type").get<std::string>());
    if (!type.has_value() || *type != expected) {
        throw std::invalid_argument(compat::format(
            "session description type '{}' where '{}' was expected",
            sdp.at("type").get<std::string>(), rtc::ToString(expected)));
    }
    description.type = *type;
    return description;
}

rtc::IceCandidate CandidateFromPayload(const json& payload) {
    const json& candidate = payload.at("candidate");
    rtc::IceCandidate result;
    result.candidate = candidate.at("candidate").get<std::string>();
    if (const auto mid = candidate.find("sdpMid"); mid != candidate.end() && !mid->is_null()) {
        result.sdp_mid = mid->get<std::string>();
    }
    if (const auto index = candidate.find("sdpMLineIndex"); index != candidate.end() && !index->is_null()) {
        result.sdp_mline_index = index->get<uint16_t>();
    }
    return result;
}

std::string ConnectionIdOf(const json& payload) {
    return payload.at("connectionId").get<std::string>();
}

SignalingEvent EventFromJson(const json& message) {
    const auto type = message.at("type").get<std::string>();
    if (type == "OPEN") {
        return OpenEvent{};
    }
    if (type == "ID-TAKEN") {
        return IdTakenEvent{};
    }
    if (type == "INVALID-KEY") {
        return InvalidKeyEvent{};
    }
    if (type == "ERROR") {
        ErrorEvent event{"Unknown error"};
        if (const auto payload = message.find("payload"); payload != message.end() && payload->is_object()) {
            if (const auto msg = payload->find("msg"); msg != payload->end() && msg->is_string()) {
                event.message = msg->get<std::string>();
            }
        }
        return event;
    }
    if (type == "OFFER") {
        const json& payload = message.at("payload");
        return OfferEvent{message.at("src").get<std::string>(),
                          DescriptionFromPayload(payload, rtc::DescriptionType::Offer),
                          ConnectionIdOf(payload)};
    }
    if (type == "ANSWER") {
        const json& payload = message.at("payload");
        return AnswerEvent{message.at("src").get<std::string>(),
                           DescriptionFromPayload(payload, rtc::DescriptionType::Answer),
                           ConnectionIdOf(payload)};
    }
    if (type == "CANDIDATE") {
        const json& payload = message.at("payload");
        return CandidateEvent{message.at("src").get<std::string>(),
                              CandidateFromPayload(payload),
                              ConnectionIdOf(payload)};
    }
    if (type == "LEAVE") {
        return LeaveEvent{message.at("src").get<std::string>()};
    }
    if (type == "EXPIRE") {
        return ExpireEvent{};
    }
    if (type == "HEARTBEAT") {
        return HeartbeatEvent{};
    }
    throw std::invalid_argument(compat::format("unknown message type '{}'", type));
}

json SdpPayload(const rtc::SessionDescription& description, const std::string& connection_id) {
    return json{
        {"sdp", {{"sdp", description.sdp}, {"type", std::string(rtc::ToString(description.type))}}},
        {"type", std::string(kConnectionType)},
        {"connectionId", connection_id},
        {"browser", std::string(kBrowserName)},
    };
}

std::string Envelope(const char* type, const std::string& src, const std::string& dst, json payload) {
    return json{{"type", type}, {"src", src}, {"dst", dst}, {"payload", std::move(payload)}}.dump();
}

} // namespace

std::string_view EventName(const SignalingEvent& event) noexcept {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, OpenEvent>) return "OPEN";
        else if constexpr (std::is_same_v<T, IdTakenEvent>) return "ID-TAKEN";
        else if constexpr (std::is_same_v<T, InvalidKeyEvent>) return "INVALID-KEY";
        else if constexpr (std::is_same_v<T, ErrorEvent>) return "ERROR";
        else if constexpr (std::is_same_v<T, OfferEvent>) return "OFFER";
        else if constexpr (std::is_same_v<T, AnswerEvent>) return "ANSWER";
        else if constexpr (std::is_same_v<T, CandidateEvent>) return "CANDIDATE";
        else if constexpr (std::is_same_v<T, LeaveEvent>) return "LEAVE";
        else if constexpr (std::is_same_v<T, ExpireEvent>) return "EXPIRE";
        else return "HEARTBEAT";
    }, event);
}

Result<SignalingEvent, PeerDropFailure> ParseServerMessage(std::string_view text) {
    const json message = json::parse(text.begin(), text.end(), nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return Result<SignalingEvent, PeerDropFailure>::Err(
            PeerDropFailure::Decode("Server message is not a JSON object"));
    }
    try {
        return Result<SignalingEvent, PeerDropFailure>::Ok(EventFromJson(message));
    } catch (const json::exception& ex) {
        return Result<SignalingEvent, PeerDropFailure>::Err(
            PeerDropFailure::Decode(compat::format("Malformed server message: {}", ex.what())));
    } catch (const std::invalid_argument& ex) {
        return Result<SignalingEvent, PeerDropFailure>::Err(
            PeerDropFailure::Decode(compat::format("Malformed server message: {}", ex.what())));
    }
}

std::string MakeHeartbeat() {
    return json{{"type", "HEARTBEAT"}}.dump();
}

std::string MakeOffer(const std::string& src,
                      const std::string& dst,
                      const rtc::SessionDescription& description,
                      const std::string& connection_id) {
    json payload = SdpPayload(description, connection_id);
    payload["label"] = connection_id;
    payload["reliable"] = true;
    payload["serialization"] = std::string(kSerialization);
    return Envelope("OFFER", src, dst, std::move(payload));
}

std::string MakeAnswer(const std::string& src,
                       const std::string& dst,
                       const rtc::SessionDescription& description,
                       const std::string& connection_id) {
    return Envelope("ANSWER", src, dst, SdpPayload(description, connection_id));
}

std::string MakeCandidate(const std::string& src,
                          const std::string& dst,
                          const rtc::IceCandidate& candidate,
                          const std::string& connection_id) {
    json inner{{"candidate", candidate.candidate}};
    inner["sdpMLineIndex"] = candidate.sdp_mline_index.has_value()
        ? json(*candidate.sdp_mline_index) : json(nullptr);
    inner["sdpMid"] = candidate.sdp_mid.has_value() ? json(*candidate.sdp_mid) : json(nullptr);
    json payload{
        {"candidate", std::move(inner)},
        {"type", std::string(kConnectionType)},
        {"connectionId", connection_id},
    };
    return Envelope("CANDIDATE", src, dst, std::move(payload));
}

} // namespace peerdrop::signaling
