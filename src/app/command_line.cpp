#include "peerdrop/app/command_line.hpp"
#include "peerdrop/core/format.hpp"

#include <vector>

namespace peerdrop::app {

namespace {

using ParseResult = Result<CommandLine, PeerDropFailure>;

PeerDropFailure UsageError(std::string message) {
    return PeerDropFailure::InvalidInput(std::move(message));
}

bool IsOption(const std::string_view arg) {
    return arg.size() > 1 && arg.front() == '-';
}

} // namespace

std::string Usage() {
    return "usage: peerdrop [--server HOST] [--verbose] send <file> [--peer-id ID]\n"
           "       peerdrop [--server HOST] [--verbose] receive <peer-id> [--key KEY] [--output DIR]\n"
           "\n"
           "  -s, --server HOST   rendezvous server host (default 0.peerjs.com)\n"
           "  -v, --verbose       debug logging\n"
           "  -p, --peer-id ID    register under ID instead of a generated one\n"
           "  -k, --key KEY       base64 transfer key (read from stdin when omitted)\n"
           "  -o, --output DIR    directory for the received file (default .)\n";
}

ParseResult ParseCommandLine(const std::span<const std::string_view> args) {
    CommandLine line;
    std::vector<std::string_view> positionals;
    std::optional<std::string> peer_id_option;
    std::optional<std::string> key_option;
    std::optional<std::string> output_option;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                return std::nullopt;
            }
            return std::string(args[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            line.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            line.verbose = true;
        } else if (arg == "--server" || arg == "-s") {
            line.server = value();
            if (!line.server.has_value() || line.server->empty()) {
                return ParseResult::Err(UsageError("--server requires a host"));
            }
        } else if (arg == "--peer-id" || arg == "-p") {
            peer_id_option = value();
            if (!peer_id_option.has_value()) {
                return ParseResult::Err(UsageError("--peer-id requires a value"));
            }
        } else if (arg == "--key" || arg == "-k") {
            key_option = value();
            if (!key_option.has_value()) {
                return ParseResult::Err(UsageError("--key requires a value"));
            }
        } else if (arg == "--output" || arg == "-o") {
            output_option = value();
            if (!output_option.has_value() || output_option->empty()) {
                return ParseResult::Err(UsageError("--output requires a directory"));
            }
        } else if (IsOption(arg)) {
            return ParseResult::Err(UsageError(compat::format("unknown option '{}'", arg)));
        } else {
            positionals.push_back(arg);
        }
    }

    if (line.help) {
        return ParseResult::Ok(std::move(line));
    }
    if (positionals.empty()) {
        return ParseResult::Err(UsageError("missing command"));
    }

    const std::string_view command = positionals.front();
    if (command == "send") {
        if (positionals.size() != 2) {
            return ParseResult::Err(UsageError("send takes exactly one <file>"));
        }
        if (key_option.has_value() || output_option.has_value()) {
            return ParseResult::Err(UsageError("--key and --output only apply to receive"));
        }
        line.command = SendCommand{std::filesystem::path(std::string(positionals[1])), peer_id_option};
    } else if (command == "receive") {
        if (positionals.size() != 2) {
            return ParseResult::Err(UsageError("receive takes exactly one <peer-id>"));
        }
        if (peer_id_option.has_value()) {
            return ParseResult::Err(UsageError("--peer-id only applies to send"));
        }
        ReceiveCommand receive;
        receive.peer_id = std::string(positionals[1]);
        receive.key = key_option;
        if (output_option.has_value()) {
            receive.output_dir = *output_option;
        }
        line.command = std::move(receive);
    } else {
        return ParseResult::Err(UsageError(compat::format("unknown command '{}'", command)));
    }

    return ParseResult::Ok(std::move(line));
}

} // namespace peerdrop::app
