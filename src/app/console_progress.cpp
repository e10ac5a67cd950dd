#include "peerdrop/app/console_progress.hpp"
#include "peerdrop/core/format.hpp"

namespace peerdrop::app {

namespace {

constexpr int kBarWidth = 30;

std::string HumanBytes(const uint64_t bytes) {
    if (bytes >= 1024 * 1024) {
        return compat::format("{:.1f} MiB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    if (bytes >= 1024) {
        return compat::format("{:.1f} KiB", static_cast<double>(bytes) / 1024.0);
    }
    return compat::format("{} B", bytes);
}

} // namespace

void ConsoleProgress::OnTransferStarted(const std::string& filename, const uint64_t total_bytes) {
    last_percent_ = -1;
    out_ << compat::format("Transferring {} ({})\n", filename, HumanBytes(total_bytes));
    OnProgress(0, total_bytes);
}

void ConsoleProgress::OnProgress(const uint64_t transferred_bytes, const uint64_t total_bytes) {
    const int percent = total_bytes == 0
        ? 100
        : static_cast<int>(transferred_bytes * 100 / total_bytes);
    if (percent == last_percent_) {
        return;
    }
    last_percent_ = percent;

    const int filled = percent * kBarWidth / 100;
    out_ << compat::format("\r[{}{}] {:3}% {}/{}",
                           std::string(static_cast<size_t>(filled), '#'),
                           std::string(static_cast<size_t>(kBarWidth - filled), ' '),
                           percent,
                           HumanBytes(transferred_bytes),
                           HumanBytes(total_bytes));
    out_.flush();
}

void ConsoleProgress::OnTransferFinished(const uint64_t transferred_bytes) {
    out_ << compat::format("\nDone: {} transferred\n", HumanBytes(transferred_bytes));
    out_.flush();
}

} // namespace peerdrop::app
