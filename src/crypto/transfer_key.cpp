#include "peerdrop/crypto/transfer_key.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"
#include "peerdrop/core/format.hpp"

#include <array>

namespace peerdrop::crypto {

Result<TransferKey, PeerDropFailure> TransferKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kTransferKeyBytes) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::Encryption(
                compat::format("Transfer key must be {} bytes, got {}",
                    kTransferKeyBytes, bytes.size())));
    }

    auto handle_result = SecureMemoryHandle::Allocate(kTransferKeyBytes);
    if (handle_result.IsErr()) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();

    if (auto write = handle.Write(bytes); write.IsErr()) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::FromSodiumFailure(write.UnwrapErr()));
    }
    return Result<TransferKey, PeerDropFailure>::Ok(TransferKey(std::move(handle)));
}

Result<TransferKey, PeerDropFailure> TransferKey::Generate() {
    std::array<uint8_t, kTransferKeyBytes> bytes{};
    SodiumInterop::FillRandom(bytes);
    auto key = FromBytes(bytes);
    if (auto wipe = SodiumInterop::SecureWipe(bytes); wipe.IsErr()) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::FromSodiumFailure(wipe.UnwrapErr()));
    }
    return key;
}

Result<TransferKey, PeerDropFailure> TransferKey::FromBase64(std::string_view encoded) {
    auto decoded = SodiumInterop::FromBase64(encoded);
    if (decoded.IsErr()) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::Encryption("Invalid key: " + decoded.UnwrapErr().message));
    }
    auto bytes = std::move(decoded).Unwrap();
    auto key = FromBytes(bytes);
    if (auto wipe = SodiumInterop::SecureWipe(bytes); wipe.IsErr()) {
        return Result<TransferKey, PeerDropFailure>::Err(
            PeerDropFailure::FromSodiumFailure(wipe.UnwrapErr()));
    }
    return key;
}

Result<std::string, PeerDropFailure> TransferKey::ToBase64() const {
    return WithKeyBytes([](std::span<const uint8_t> key) {
        return SodiumInterop::ToBase64(key);
    });
}

} // namespace peerdrop::crypto
