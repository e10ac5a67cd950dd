#pragma once
#include <cstdint>
#include <string>
namespace peerdrop::interfaces {
/// Progress sink for a running transfer. Has no effect on the protocol.
class ITransferObserver {
public:
    virtual ~ITransferObserver() = default;
    virtual void OnTransferStarted(const std::string& filename, uint64_t total_bytes) = 0;
    virtual void OnProgress(uint64_t transferred_bytes, uint64_t total_bytes) = 0;
    virtual void OnTransferFinished(uint64_t transferred_bytes) = 0;
};
}
