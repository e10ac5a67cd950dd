#include "peerdrop/app/command_line.hpp"
#include "peerdrop/app/runners.hpp"
#include "peerdrop/configuration/session_config.hpp"
#include "peerdrop/core/logging.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/rtc/datachannel_peer_transport.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

int Fail(const peerdrop::PeerDropFailure& failure) {
    spdlog::debug("Exiting after {}", failure.TypeName());
    std::cerr << "error: " << failure.Describe() << '\n';
    return kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace peerdrop;

    std::vector<std::string_view> args(argv + 1, argv + argc);
    auto parsed = app::ParseCommandLine(args);
    if (parsed.IsErr()) {
        std::cerr << "error: " << parsed.UnwrapErr().message << "\n\n" << app::Usage();
        return kExitUsage;
    }
    const auto line = std::move(parsed).Unwrap();
    if (line.help) {
        std::cout << app::Usage();
        return 0;
    }

    logging::Configure(line.verbose);
    rtc::InitEngineLogging();

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Fail(PeerDropFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    auto config = configuration::ApplicationConfig::Default();
    config.verbose = line.verbose;
    if (line.server.has_value()) {
        config.signaling.host = *line.server;
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Fail(valid.UnwrapErr());
    }

    const auto result = std::visit([&](const auto& command) -> Result<Unit, PeerDropFailure> {
        using Command = std::decay_t<decltype(command)>;
        if constexpr (std::is_same_v<Command, app::SendCommand>) {
            return app::RunSender(command, config, std::cout);
        } else if constexpr (std::is_same_v<Command, app::ReceiveCommand>) {
            return app::RunReceiver(command, config, std::cin, std::cout);
        } else {
            return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::InvalidInput("missing command"));
        }
    }, line.command);

    if (result.IsErr()) {
        return Fail(result.UnwrapErr());
    }
    return 0;
}
