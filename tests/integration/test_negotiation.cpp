#include <catch2/catch_test_macros.hpp>
#include "peerdrop/session/negotiator.hpp"
#include "helpers/fake_peer_transport.hpp"
#include "helpers/fake_signaling_transport.hpp"
#include <nlohmann/json.hpp>
#include <future>
#include <string>
#include <thread>

using namespace peerdrop;
using namespace peerdrop::session;
using peerdrop::test_helpers::FakePeerTransport;
using peerdrop::test_helpers::FakeSignalingTransport;
using nlohmann::json;
using namespace std::chrono_literals;

namespace {

constexpr const char* kLocalId = "brave-otter";
constexpr const char* kRemoteId = "calm-river";

std::string OfferFrom(const std::string& src, const std::string& connection_id) {
    return json{{"type", "OFFER"}, {"src", src}, {"dst", kLocalId},
                {"payload", {{"sdp", {{"type", "offer"}, {"sdp", "v=0 remote-offer"}}},
                             {"type", "data"}, {"connectionId", connection_id}}}}.dump();
}

std::string AnswerFrom(const std::string& src, const std::string& connection_id) {
    return json{{"type", "ANSWER"}, {"src", src}, {"dst", kLocalId},
                {"payload", {{"sdp", {{"type", "answer"}, {"sdp", "v=0 remote-answer"}}},
                             {"type", "data"}, {"connectionId", connection_id}}}}.dump();
}

std::string CandidateFrom(const std::string& src, const std::string& connection_id, const std::string& line) {
    return json{{"type", "CANDIDATE"}, {"src", src}, {"dst", kLocalId},
                {"payload", {{"candidate", {{"candidate", line}, {"sdpMid", "0"}, {"sdpMLineIndex", 0}}},
                             {"type", "data"}, {"connectionId", connection_id}}}}.dump();
}

struct Harness {
    std::shared_ptr<FakeSignalingTransport::Server> server;
    std::unique_ptr<signaling::RendezvousClient> client;
    std::shared_ptr<FakePeerTransport> transport;
    std::unique_ptr<Negotiator> negotiator;

    explicit Harness(const std::chrono::milliseconds deadline = 5s) {
        auto signaling_transport = std::make_unique<FakeSignalingTransport>();
        server = signaling_transport->Handle();
        auto config = configuration::SignalingConfig::Default();
        config.heartbeat_interval = 0ms;
        auto connected = signaling::RendezvousClient::Connect(
            identity::PeerId::Parse(kLocalId).Unwrap(), config, std::move(signaling_transport));
        REQUIRE(connected.IsOk());
        client = std::move(connected).Unwrap();
        server->Push(R"({"type":"OPEN"})");
        REQUIRE(client->WaitForOpen().IsOk());

        auto negotiation = configuration::NegotiationConfig::Default();
        negotiation.deadline = deadline;
        negotiation.settle_delay = 0ms;
        transport = std::make_shared<FakePeerTransport>();
        negotiator = std::make_unique<Negotiator>(*client, transport, negotiation);
    }

    std::future<Result<EstablishedChannel, PeerDropFailure>> StartOfferer() {
        return std::async(std::launch::async, [this] {
            return negotiator->RunOfferer(identity::PeerId::Parse(kRemoteId).Unwrap());
        });
    }

    std::future<Result<EstablishedChannel, PeerDropFailure>> StartAnswerer() {
        return std::async(std::launch::async, [this] { return negotiator->RunAnswerer(); });
    }

    /// Wait for the outbound OFFER and return its connection id.
    std::string AwaitOffer() {
        const auto offer = server->WaitForSent("\"OFFER\"");
        REQUIRE(offer.has_value());
        const auto j = json::parse(*offer);
        REQUIRE(j.at("src") == kLocalId);
        REQUIRE(j.at("dst") == kRemoteId);
        REQUIRE(j.at("payload").at("sdp").at("sdp") == "v=0 fake-offer");
        return j.at("payload").at("connectionId").get<std::string>();
    }
};

std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

} // namespace

TEST_CASE("Negotiation - Answerer", "[integration][negotiation]") {
    Harness harness;
    auto running = harness.StartAnswerer();

    harness.server->Push(R"({"type":"HEARTBEAT"})");
    REQUIRE(harness.server->WaitForSent("HEARTBEAT").has_value());

    harness.server->Push(OfferFrom(kRemoteId, "dc_remote"));
    REQUIRE(harness.transport->WaitForRemoteDescription());
    const auto remote = harness.transport->RemoteDescriptions();
    REQUIRE(remote.size() == 1);
    REQUIRE(remote[0].type == rtc::DescriptionType::Offer);
    REQUIRE(remote[0].sdp == "v=0 remote-offer");

    const auto answer = harness.server->WaitForSent("\"ANSWER\"");
    REQUIRE(answer.has_value());
    const auto answer_json = json::parse(*answer);
    REQUIRE(answer_json.at("dst") == kRemoteId);
    REQUIRE(answer_json.at("payload").at("connectionId") == "dc_remote");
    REQUIRE(answer_json.at("payload").at("sdp").at("type") == "answer");

    harness.transport->EmitCandidate(rtc::IceCandidate{"candidate:local", "0", 0});
    const auto relayed = harness.server->WaitForSent("candidate:local");
    REQUIRE(relayed.has_value());
    const auto relayed_json = json::parse(*relayed);
    REQUIRE(relayed_json.at("type") == "CANDIDATE");
    REQUIRE(relayed_json.at("dst") == kRemoteId);
    REQUIRE(relayed_json.at("payload").at("connectionId") == "dc_remote");

    harness.server->Push(CandidateFrom(kRemoteId, "dc_remote", "candidate:remote"));
    REQUIRE(harness.transport->WaitForRemoteCandidates(1));
    REQUIRE(harness.transport->RemoteCandidates()[0].candidate == "candidate:remote");

    auto remote_end = harness.transport->EmitIncomingChannel("file-transfer");
    REQUIRE(remote_end->Send(Bytes("first message")).IsOk());

    auto established = running.get();
    REQUIRE(established.IsOk());
    auto channel = std::move(established).Unwrap();
    REQUIRE(channel.remote == kRemoteId);
    REQUIRE(channel.connection_id == "dc_remote");
    auto first = channel.link.Receive();
    REQUIRE(first.IsOk());
    REQUIRE(first.Unwrap() == Bytes("first message"));

    SECTION("A negotiator runs one session only") {
        auto again = harness.negotiator->RunAnswerer();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == PeerDropFailureType::InvalidInput);
    }
}

TEST_CASE("Negotiation - Answerer failures before the offer", "[integration][negotiation]") {
    Harness harness;
    auto running = harness.StartAnswerer();

    SECTION("Server error") {
        harness.server->Push(R"({"type":"ERROR","payload":{"msg":"rate limited"}})");
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Signaling);
        REQUIRE(harness.transport->CloseCalls() == 1);
    }

    SECTION("Rendezvous connection lost") {
        harness.server->Disconnect();
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::ChannelClosed);
    }

    SECTION("Unrelated events are ignored") {
        harness.server->Push(R"({"type":"LEAVE","src":"someone"})");
        harness.server->Push(AnswerFrom(kRemoteId, "dc_x"));
        harness.server->Push(OfferFrom(kRemoteId, "dc_x"));
        REQUIRE(harness.server->WaitForSent("\"ANSWER\"").has_value());
        harness.transport->EmitIncomingChannel("file-transfer");
        REQUIRE(running.get().IsOk());
    }
}

TEST_CASE("Negotiation - Offerer", "[integration][negotiation]") {
    Harness harness;
    auto running = harness.StartOfferer();
    const auto connection_id = harness.AwaitOffer();
    REQUIRE_FALSE(connection_id.empty());
    REQUIRE(harness.transport->LocalDescriptions().size() == 1);

    // Candidates can reach us before the answer does.
    harness.server->Push(CandidateFrom(kRemoteId, connection_id, "candidate:early"));
    std::this_thread::sleep_for(100ms);
    REQUIRE(harness.transport->RemoteCandidates().empty());

    harness.server->Push(AnswerFrom("stranger", connection_id));
    std::this_thread::sleep_for(100ms);
    REQUIRE(harness.transport->RemoteDescriptions().empty());

    harness.server->Push(AnswerFrom(kRemoteId, connection_id));
    REQUIRE(harness.transport->WaitForRemoteDescription());
    REQUIRE(harness.transport->WaitForRemoteCandidates(1));
    REQUIRE(harness.transport->RemoteCandidates()[0].candidate == "candidate:early");

    harness.transport->EmitState(rtc::ConnectionState::Connecting);
    harness.transport->EmitState(rtc::ConnectionState::Connected);
    auto remote_end = harness.transport->OpenLocalChannel();

    auto established = running.get();
    REQUIRE(established.IsOk());
    auto channel = std::move(established).Unwrap();
    REQUIRE(channel.remote == kRemoteId);
    REQUIRE(channel.connection_id == connection_id);
    REQUIRE(channel.link.DataChannel().Label() == "file-transfer");

    REQUIRE(remote_end->Send(Bytes("hello")).IsOk());
    auto received = channel.link.Receive();
    REQUIRE(received.IsOk());
    REQUIRE(received.Unwrap() == Bytes("hello"));
    REQUIRE(channel.link.Send(Bytes("back")).IsOk());
    REQUIRE(remote_end->Sent().size() == 1);
}

TEST_CASE("Negotiation - Offerer failures", "[integration][negotiation]") {
    SECTION("Duplicate answer") {
        Harness harness;
        auto running = harness.StartOfferer();
        const auto connection_id = harness.AwaitOffer();
        harness.server->Push(AnswerFrom(kRemoteId, connection_id));
        harness.server->Push(AnswerFrom(kRemoteId, connection_id));
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Connection);
        REQUIRE(harness.transport->RemoteDescriptions().size() == 1);
        REQUIRE(harness.transport->CloseCalls() == 1);
    }

    SECTION("Unexpected offer from the remote") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.server->Push(OfferFrom(kRemoteId, "dc_other"));
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Connection);
    }

    SECTION("Remote leaves") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.server->Push(R"({"type":"LEAVE","src":"somebody-else"})");
        harness.server->Push(R"({"type":"LEAVE","src":"calm-river"})");
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Connection);
        REQUIRE(result.UnwrapErr().message == "Peer calm-river left");
    }

    SECTION("Remote id never registered") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.server->Push(R"({"type":"EXPIRE"})");
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "Connection expired - peer not found");
    }

    SECTION("Server error") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.server->Push(R"({"type":"ERROR","payload":{"msg":"boom"}})");
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Signaling);
    }

    SECTION("Peer connection fails") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.transport->EmitState(rtc::ConnectionState::Failed);
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Connection);
    }

    SECTION("Rendezvous connection lost") {
        Harness harness;
        auto running = harness.StartOfferer();
        harness.AwaitOffer();
        harness.server->Disconnect();
        auto result = running.get();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Signaling);
    }
}

TEST_CASE("Negotiation - Deadline", "[integration][negotiation]") {
    Harness harness(150ms);
    auto running = harness.StartOfferer();
    harness.AwaitOffer();

    auto result = running.get();
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == PeerDropFailureType::Timeout);
    REQUIRE(harness.transport->CloseCalls() == 1);

    // Late engine events after the timeout produce no traffic.
    const auto sent_before = harness.server->SentCount();
    harness.transport->EmitCandidate(rtc::IceCandidate{"candidate:late", "0", 0});
    std::this_thread::sleep_for(50ms);
    REQUIRE(harness.server->SentCount() == sent_before);

    auto again = harness.negotiator->RunOfferer(identity::PeerId::Parse(kRemoteId).Unwrap());
    REQUIRE(again.IsErr());
    REQUIRE(harness.transport->CloseCalls() == 1);
}

TEST_CASE("Negotiation - Description slots are write-once", "[negotiation]") {
    FakePeerTransport transport;
    DescriptionSlots slots;
    const rtc::SessionDescription offer{rtc::DescriptionType::Offer, "v=0"};
    const rtc::SessionDescription answer{rtc::DescriptionType::Answer, "v=0"};

    REQUIRE_FALSE(slots.HasLocal());
    REQUIRE(slots.SetLocal(transport, offer).IsOk());
    REQUIRE(slots.HasLocal());
    auto second_local = slots.SetLocal(transport, offer);
    REQUIRE(second_local.IsErr());
    REQUIRE(second_local.UnwrapErr().type == PeerDropFailureType::Connection);
    REQUIRE(transport.LocalDescriptions().size() == 1);

    REQUIRE(slots.SetRemote(transport, answer).IsOk());
    REQUIRE(slots.SetRemote(transport, answer).IsErr());
    REQUIRE(transport.RemoteDescriptions().size() == 1);
}

TEST_CASE("Negotiation - Liveness while exchanging descriptions", "[integration][negotiation]") {
    Harness harness;
    auto running = harness.StartOfferer();
    const auto connection_id = harness.AwaitOffer();
    harness.server->Push(AnswerFrom(kRemoteId, connection_id));
    REQUIRE(harness.transport->WaitForRemoteDescription());

    const auto count_containing = [&](const std::string& needle) {
        size_t count = 0;
        for (const auto& text : harness.server->Sent()) {
            if (text.find(needle) != std::string::npos) {
                ++count;
            }
        }
        return count;
    };

    SECTION("Each heartbeat is answered exactly once") {
        harness.server->Push(R"({"type":"HEARTBEAT"})");
        // Events are handled in order, so the candidate marks the heartbeat as processed.
        harness.server->Push(CandidateFrom(kRemoteId, connection_id, "candidate:after-heartbeat"));
        REQUIRE(harness.transport->WaitForRemoteCandidates(1));
        REQUIRE(count_containing("HEARTBEAT") == 1);

        harness.server->Push(R"({"type":"HEARTBEAT"})");
        harness.server->Push(CandidateFrom(kRemoteId, connection_id, "candidate:after-second"));
        REQUIRE(harness.transport->WaitForRemoteCandidates(2));
        REQUIRE(count_containing("HEARTBEAT") == 2);

        harness.transport->OpenLocalChannel();
        REQUIRE(running.get().IsOk());
    }

    SECTION("A failed candidate relay does not end the session") {
        harness.server->FailNextSendContaining("candidate:lost");
        harness.transport->EmitCandidate(rtc::IceCandidate{"candidate:lost", "0", 0});
        harness.transport->EmitCandidate(rtc::IceCandidate{"candidate:kept", "0", 0});
        REQUIRE(harness.server->WaitForSent("candidate:kept").has_value());
        REQUIRE(count_containing("candidate:lost") == 0);

        harness.transport->OpenLocalChannel();
        auto established = running.get();
        REQUIRE(established.IsOk());
        REQUIRE(harness.transport->CloseCalls() == 0);
    }
}
