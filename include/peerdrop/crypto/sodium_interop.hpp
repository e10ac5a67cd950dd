#pragma once

#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peerdrop::crypto {

/**
 * @brief Interop layer for the libsodium primitives peerdrop relies on
 *
 * Covers library start-up, the CSPRNG, base64 encoding of key material,
 * secure memory allocation and wiping.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other sodium operation.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer with sodium_memzero
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer);

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Standard (padded) base64 encoding
     */
    static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64, ignoring surrounding whitespace
     *
     * @return Decoded bytes, or DecodeFailed when the input is not base64
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace peerdrop::crypto
