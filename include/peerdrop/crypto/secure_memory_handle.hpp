#pragma once

#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace peerdrop::crypto {

/**
 * @brief RAII owner of a sodium_malloc allocation
 *
 * The region sits between guard pages, is locked in RAM and is zeroed
 * when freed. Move-only.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the region, zero-filling the remainder
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Run func over the secure bytes without copying them out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return ptr_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace peerdrop::crypto
