#pragma once

#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include "peerdrop/crypto/secure_memory_handle.hpp"

#include <span>
#include <string>
#include <string_view>

namespace peerdrop::crypto {

/**
 * @brief 256-bit AES key shared out-of-band between sender and receiver
 *
 * The key bytes live in libsodium secure memory for the lifetime of the
 * object. The textual form is standard base64 (44 characters).
 */
class TransferKey {
public:
    /**
     * @brief Fresh key from the libsodium CSPRNG
     */
    static Result<TransferKey, PeerDropFailure> Generate();

    /**
     * @brief Decode a base64 key; anything other than 32 bytes is rejected
     */
    static Result<TransferKey, PeerDropFailure> FromBase64(std::string_view encoded);

    static Result<TransferKey, PeerDropFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] Result<std::string, PeerDropFailure> ToBase64() const;

    template<typename F>
    auto WithKeyBytes(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, PeerDropFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = handle_.WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return Result<T, PeerDropFailure>::Err(
                PeerDropFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return Result<T, PeerDropFailure>::Ok(std::move(access).Unwrap());
    }

    TransferKey(TransferKey&&) noexcept = default;
    TransferKey& operator=(TransferKey&&) noexcept = default;
    TransferKey(const TransferKey&) = delete;
    TransferKey& operator=(const TransferKey&) = delete;

private:
    explicit TransferKey(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}

    SecureMemoryHandle handle_;
};

} // namespace peerdrop::crypto
