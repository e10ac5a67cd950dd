#pragma once

#include "peerdrop/interfaces/i_transfer_observer.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace peerdrop::app {

/// Single-line progress display, redrawn when the percentage changes.
class ConsoleProgress final : public interfaces::ITransferObserver {
public:
    explicit ConsoleProgress(std::ostream& out) : out_(out) {}

    void OnTransferStarted(const std::string& filename, uint64_t total_bytes) override;
    void OnProgress(uint64_t transferred_bytes, uint64_t total_bytes) override;
    void OnTransferFinished(uint64_t transferred_bytes) override;

private:
    std::ostream& out_;
    int last_percent_ = -1;
};

} // namespace peerdrop::app
