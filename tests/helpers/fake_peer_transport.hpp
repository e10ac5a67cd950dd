#pragma once
#include "helpers/in_memory_data_channel.hpp"
#include "peerdrop/interfaces/i_peer_transport.hpp"
#include "peerdrop/rtc/types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::test_helpers {

using interfaces::IPeerTransport;

/**
 * Scripted connectivity engine.
 *
 * Records every description and candidate applied to it; the test fires
 * the engine-side events (local candidates, state changes, incoming or
 * opened channels) by hand.
 */
class FakePeerTransport final : public IPeerTransport {
public:
    [[nodiscard]] Result<std::shared_ptr<IDataChannel>, PeerDropFailure> CreateDataChannel(
        const std::string& label) override {
        auto [local, remote] = InMemoryDataChannel::CreatePair(label, false);
        std::lock_guard lock(mutex_);
        local_channel_ = local;
        remote_end_ = remote;
        return Result<std::shared_ptr<IDataChannel>, PeerDropFailure>::Ok(local);
    }

    [[nodiscard]] Result<rtc::SessionDescription, PeerDropFailure> CreateOffer() override {
        return Result<rtc::SessionDescription, PeerDropFailure>::Ok(
            rtc::SessionDescription{rtc::DescriptionType::Offer, "v=0 fake-offer"});
    }

    [[nodiscard]] Result<rtc::SessionDescription, PeerDropFailure> CreateAnswer() override {
        std::lock_guard lock(mutex_);
        if (remote_descriptions_.empty()) {
            return Result<rtc::SessionDescription, PeerDropFailure>::Err(
                PeerDropFailure::Connection("no remote offer"));
        }
        return Result<rtc::SessionDescription, PeerDropFailure>::Ok(
            rtc::SessionDescription{rtc::DescriptionType::Answer, "v=0 fake-answer"});
    }

    [[nodiscard]] Result<Unit, PeerDropFailure> SetLocalDescription(
        const rtc::SessionDescription& description) override {
        std::lock_guard lock(mutex_);
        local_descriptions_.push_back(description);
        return Result<Unit, PeerDropFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, PeerDropFailure> SetRemoteDescription(
        const rtc::SessionDescription& description) override {
        {
            std::lock_guard lock(mutex_);
            remote_descriptions_.push_back(description);
        }
        changed_.notify_all();
        return Result<Unit, PeerDropFailure>::Ok(unit);
    }

    [[nodiscard]] Result<Unit, PeerDropFailure> AddCandidate(const rtc::IceCandidate& candidate) override {
        {
            std::lock_guard lock(mutex_);
            remote_candidates_.push_back(candidate);
        }
        changed_.notify_all();
        return Result<Unit, PeerDropFailure>::Ok(unit);
    }

    void OnCandidate(std::function<void(rtc::IceCandidate)> handler) override {
        std::lock_guard lock(mutex_);
        on_candidate_ = std::move(handler);
    }

    void OnConnectionStateChange(std::function<void(rtc::ConnectionState)> handler) override {
        std::lock_guard lock(mutex_);
        on_state_ = std::move(handler);
    }

    void OnIncomingDataChannel(std::function<void(std::shared_ptr<IDataChannel>)> handler) override {
        std::lock_guard lock(mutex_);
        on_incoming_ = std::move(handler);
    }

    void Close() override {
        std::lock_guard lock(mutex_);
        ++close_calls_;
    }

    // ------------------------------------------------------------------
    // Engine-side events
    // ------------------------------------------------------------------

    void EmitCandidate(rtc::IceCandidate candidate) {
        std::function<void(rtc::IceCandidate)> handler;
        {
            std::lock_guard lock(mutex_);
            handler = on_candidate_;
        }
        if (handler) {
            handler(std::move(candidate));
        }
    }

    void EmitState(const rtc::ConnectionState state) {
        std::function<void(rtc::ConnectionState)> handler;
        {
            std::lock_guard lock(mutex_);
            handler = on_state_;
        }
        if (handler) {
            handler(state);
        }
    }

    /// Announce a channel opened by the remote side; returns the remote end.
    std::shared_ptr<InMemoryDataChannel> EmitIncomingChannel(const std::string& label) {
        auto [local, remote] = InMemoryDataChannel::CreatePair(label, true);
        std::function<void(std::shared_ptr<IDataChannel>)> handler;
        {
            std::lock_guard lock(mutex_);
            handler = on_incoming_;
            remote_end_ = remote;
        }
        if (handler) {
            handler(local);
        }
        return remote;
    }

    /// Open the locally created channel; returns the remote end.
    std::shared_ptr<InMemoryDataChannel> OpenLocalChannel() {
        std::shared_ptr<InMemoryDataChannel> local;
        std::shared_ptr<InMemoryDataChannel> remote;
        {
            std::lock_guard lock(mutex_);
            local = local_channel_;
            remote = remote_end_;
        }
        remote->MarkOpen();
        local->MarkOpen();
        return remote;
    }

    bool WaitForRemoteDescription(const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return !remote_descriptions_.empty(); });
    }

    bool WaitForRemoteCandidates(const size_t count,
                                 const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return remote_candidates_.size() >= count; });
    }

    [[nodiscard]] std::vector<rtc::SessionDescription> LocalDescriptions() const {
        std::lock_guard lock(mutex_);
        return local_descriptions_;
    }

    [[nodiscard]] std::vector<rtc::SessionDescription> RemoteDescriptions() const {
        std::lock_guard lock(mutex_);
        return remote_descriptions_;
    }

    [[nodiscard]] std::vector<rtc::IceCandidate> RemoteCandidates() const {
        std::lock_guard lock(mutex_);
        return remote_candidates_;
    }

    [[nodiscard]] int CloseCalls() const {
        std::lock_guard lock(mutex_);
        return close_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::function<void(rtc::IceCandidate)> on_candidate_;
    std::function<void(rtc::ConnectionState)> on_state_;
    std::function<void(std::shared_ptr<IDataChannel>)> on_incoming_;
    std::shared_ptr<InMemoryDataChannel> local_channel_;
    std::shared_ptr<InMemoryDataChannel> remote_end_;
    std::vector<rtc::SessionDescription> local_descriptions_;
    std::vector<rtc::SessionDescription> remote_descriptions_;
    std::vector<rtc::IceCandidate> remote_candidates_;
    int close_calls_ = 0;
};

} // namespace peerdrop::test_helpers
