#include "peerdrop/app/runners.hpp"
#include "peerdrop/app/console_progress.hpp"
#include "peerdrop/core/format.hpp"
#include "peerdrop/crypto/transfer_key.hpp"
#include "peerdrop/identity/peer_id.hpp"
#include "peerdrop/rtc/datachannel_peer_transport.hpp"
#include "peerdrop/session/negotiator.hpp"
#include "peerdrop/signaling/rendezvous_client.hpp"
#include "peerdrop/transfer/file_receiver.hpp"
#include "peerdrop/transfer/file_sender.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace peerdrop::app {

namespace {

using ClientResult = Result<std::unique_ptr<signaling::RendezvousClient>, PeerDropFailure>;

ClientResult Register(const identity::PeerId& id, const configuration::SignalingConfig& config) {
    auto connected = signaling::RendezvousClient::Connect(id, config);
    if (connected.IsErr()) {
        return connected;
    }
    auto client = std::move(connected).Unwrap();
    if (auto opened = client->WaitForOpen(); opened.IsErr()) {
        client->Close();
        return ClientResult::Err(std::move(opened).UnwrapErr());
    }
    return ClientResult::Ok(std::move(client));
}

Result<std::string, PeerDropFailure> ReadKeyLine(std::istream& in, std::ostream& out) {
    out << "Encryption key: ";
    out.flush();
    std::string line;
    if (!std::getline(in, line) || line.empty()) {
        return Result<std::string, PeerDropFailure>::Err(
            PeerDropFailure::InvalidInput("No encryption key given"));
    }
    return Result<std::string, PeerDropFailure>::Ok(std::move(line));
}

} // namespace

Result<Unit, PeerDropFailure> RunSender(const SendCommand& command,
                                        const configuration::ApplicationConfig& config,
                                        std::ostream& out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(command.file, ec)) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Io(
            compat::format("File not found: {}", command.file.string())));
    }

    auto parsed_id = command.peer_id.has_value()
        ? identity::PeerId::Parse(*command.peer_id)
        : Result<identity::PeerId, PeerDropFailure>::Ok(identity::PeerId::Generate());
    if (parsed_id.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(parsed_id).UnwrapErr());
    }
    const auto local_id = std::move(parsed_id).Unwrap();

    auto generated = crypto::TransferKey::Generate();
    if (generated.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(generated).UnwrapErr());
    }
    const auto key = std::move(generated).Unwrap();
    auto encoded = key.ToBase64();
    if (encoded.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(encoded).UnwrapErr());
    }

    spdlog::info("Starting sender...");
    auto registered = Register(local_id, config.signaling);
    if (registered.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(registered).UnwrapErr());
    }
    auto client = std::move(registered).Unwrap();

    out << compat::format("\nYour peer ID: {}\n", local_id.Value());
    out << compat::format("Encryption key: {}\n", encoded.Unwrap());
    out << "\nShare BOTH with the receiver. Waiting for connection...\n\n";
    out.flush();

    auto created = rtc::DataChannelPeerTransport::Create(config.transport);
    if (created.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(created).UnwrapErr());
    }
    session::Negotiator negotiator(*client, std::move(created).Unwrap(), config.negotiation);

    auto established = negotiator.RunAnswerer();
    if (established.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(established).UnwrapErr());
    }
    auto channel = std::move(established).Unwrap();
    out << "Receiver connected!\n";
    client->Close();

    ConsoleProgress progress(out);
    transfer::FileSender sender(command.file, channel.link, key, &progress);
    auto sent = sender.Send();
    channel.link.Close();
    negotiator.Close();
    return sent;
}

Result<Unit, PeerDropFailure> RunReceiver(const ReceiveCommand& command,
                                          const configuration::ApplicationConfig& config,
                                          std::istream& in,
                                          std::ostream& out) {
    auto parsed_remote = identity::PeerId::Parse(command.peer_id);
    if (parsed_remote.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(parsed_remote).UnwrapErr());
    }
    const auto remote = std::move(parsed_remote).Unwrap();

    auto key_text = command.key.has_value()
        ? Result<std::string, PeerDropFailure>::Ok(*command.key)
        : ReadKeyLine(in, out);
    if (key_text.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(key_text).UnwrapErr());
    }
    auto decoded = crypto::TransferKey::FromBase64(key_text.Unwrap());
    if (decoded.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(decoded).UnwrapErr());
    }
    const auto key = std::move(decoded).Unwrap();

    std::error_code ec;
    if (!std::filesystem::is_directory(command.output_dir, ec)) {
        return Result<Unit, PeerDropFailure>::Err(PeerDropFailure::Io(
            compat::format("Output directory does not exist: {}", command.output_dir.string())));
    }

    spdlog::info("Starting receiver...");
    out << compat::format("Connecting to peer {}...\n", remote.Value());
    out.flush();

    auto registered = Register(identity::PeerId::Generate(), config.signaling);
    if (registered.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(registered).UnwrapErr());
    }
    auto client = std::move(registered).Unwrap();

    auto created = rtc::DataChannelPeerTransport::Create(config.transport);
    if (created.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(created).UnwrapErr());
    }
    session::Negotiator negotiator(*client, std::move(created).Unwrap(), config.negotiation);

    auto established = negotiator.RunOfferer(remote);
    if (established.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(established).UnwrapErr());
    }
    auto channel = std::move(established).Unwrap();
    out << "Connected!\n";
    client->Close();

    ConsoleProgress progress(out);
    transfer::FileReceiver receiver(command.output_dir, channel.link, key, &progress);
    auto received = receiver.Receive();
    channel.link.Close();
    negotiator.Close();
    if (received.IsErr()) {
        return Result<Unit, PeerDropFailure>::Err(std::move(received).UnwrapErr());
    }
    out << compat::format("\nFile saved to: {}\n", received.Unwrap().string());
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

} // namespace peerdrop::app
