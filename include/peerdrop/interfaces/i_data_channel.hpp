#pragma once
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>
namespace peerdrop::interfaces {
/// Ordered, reliable message pipe between the two peers.
class IDataChannel {
public:
    virtual ~IDataChannel() = default;
    [[nodiscard]] virtual std::string Label() const = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
    [[nodiscard]] virtual Result<Unit, PeerDropFailure> Send(std::span<const uint8_t> message) = 0;
    virtual void OnOpen(std::function<void()> handler) = 0;
    virtual void OnMessage(std::function<void(std::vector<uint8_t>)> handler) = 0;
    virtual void OnClosed(std::function<void()> handler) = 0;
    virtual void Close() = 0;
};
}
