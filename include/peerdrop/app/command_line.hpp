#pragma once

#include "peerdrop/core/failures.hpp"
#include "peerdrop/core/result.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace peerdrop::app {

struct SendCommand {
    std::filesystem::path file;
    std::optional<std::string> peer_id;
};

struct ReceiveCommand {
    std::string peer_id;
    /// Read from standard input when absent.
    std::optional<std::string> key;
    std::filesystem::path output_dir{"."};
};

struct CommandLine {
    std::optional<std::string> server;
    bool verbose = false;
    bool help = false;
    std::variant<std::monostate, SendCommand, ReceiveCommand> command;
};

/**
 * @brief Parse the arguments that follow the program name
 *
 * Global options (--server, --verbose, --help) may appear anywhere.
 * Fails with InvalidInput on any usage error.
 */
[[nodiscard]] Result<CommandLine, PeerDropFailure> ParseCommandLine(std::span<const std::string_view> args);

[[nodiscard]] std::string Usage();

} // namespace peerdrop::app
