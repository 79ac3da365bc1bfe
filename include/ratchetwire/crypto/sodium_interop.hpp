#pragma once

#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <mutex>
#include <span>
#include <cstddef>
#include <cstdint>

namespace ratchetwire::protocol::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Every codec and key operation runs on top of libsodium, so callers must
 * invoke Initialize() once before constructing keys or messages.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /// sodium_memzero with an initialization and size check.
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different sizes compare unequal without touching contents.
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /// sodium_malloc, or nullptr before Initialize().
    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace ratchetwire::protocol::crypto
