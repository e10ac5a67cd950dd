#pragma once
#include <string>
#include <string_view>
namespace peerdrop {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    AllocationFailed,
    WriteOperationFailed,
    DecodeFailed,
    InvalidOperation
};
enum class PeerDropFailureType {
    Signaling,
    PeerIdTaken,
    InvalidApiKey,
    InvalidPeerId,
    Connection,
    Timeout,
    Transfer,
    Encryption,
    Io,
    ChannelClosed,
    Decode,
    InvalidInput
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure DecodeFailed(std::string msg) {
        return {SodiumFailureType::DecodeFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class PeerDropFailure {
public:
    PeerDropFailureType type;
    std::string message;
    PeerDropFailure(const PeerDropFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static PeerDropFailure Signaling(std::string msg) {
        return {PeerDropFailureType::Signaling, std::move(msg)};
    }
    static PeerDropFailure PeerIdTaken(std::string msg) {
        return {PeerDropFailureType::PeerIdTaken, std::move(msg)};
    }
    static PeerDropFailure InvalidApiKey(std::string msg) {
        return {PeerDropFailureType::InvalidApiKey, std::move(msg)};
    }
    static PeerDropFailure InvalidPeerId(std::string msg) {
        return {PeerDropFailureType::InvalidPeerId, std::move(msg)};
    }
    static PeerDropFailure Connection(std::string msg) {
        return {PeerDropFailureType::Connection, std::move(msg)};
    }
    static PeerDropFailure Timeout(std::string msg) {
        return {PeerDropFailureType::Timeout, std::move(msg)};
    }
    static PeerDropFailure Transfer(std::string msg) {
        return {PeerDropFailureType::Transfer, std::move(msg)};
    }
    static PeerDropFailure Encryption(std::string msg) {
        return {PeerDropFailureType::Encryption, std::move(msg)};
    }
    static PeerDropFailure Io(std::string msg) {
        return {PeerDropFailureType::Io, std::move(msg)};
    }
    static PeerDropFailure ChannelClosed(std::string msg) {
        return {PeerDropFailureType::ChannelClosed, std::move(msg)};
    }
    static PeerDropFailure Decode(std::string msg) {
        return {PeerDropFailureType::Decode, std::move(msg)};
    }
    static PeerDropFailure InvalidInput(std::string msg) {
        return {PeerDropFailureType::InvalidInput, std::move(msg)};
    }
    static PeerDropFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Encryption(sf.message);
    }
    [[nodiscard]] std::string_view TypeName() const noexcept {
        switch (type) {
            case PeerDropFailureType::Signaling: return "signaling error";
            case PeerDropFailureType::PeerIdTaken: return "peer id already taken";
            case PeerDropFailureType::InvalidApiKey: return "invalid rendezvous api key";
            case PeerDropFailureType::InvalidPeerId: return "invalid peer id";
            case PeerDropFailureType::Connection: return "connection error";
            case PeerDropFailureType::Timeout: return "connection timeout";
            case PeerDropFailureType::Transfer: return "transfer error";
            case PeerDropFailureType::Encryption: return "encryption error";
            case PeerDropFailureType::Io: return "io error";
            case PeerDropFailureType::ChannelClosed: return "channel closed";
            case PeerDropFailureType::Decode: return "decode error";
            case PeerDropFailureType::InvalidInput: return "invalid input";
        }
        return "error";
    }
    [[nodiscard]] std::string Describe() const {
        if (message.empty()) {
            return std::string(TypeName());
        }
        return std::string(TypeName()) + ": " + message;
    }
};
}
