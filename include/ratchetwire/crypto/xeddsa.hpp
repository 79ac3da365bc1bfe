#pragma once

#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ratchetwire::protocol::crypto {

/**
 * @brief XEdDSA signatures over Curve25519 keys
 *
 * Signs with an X25519 private scalar and verifies against a Montgomery u
 * coordinate, so one key pair serves both agreement and signing. The sign
 * bit of the signer's Edwards public key travels in the top bit of the last
 * signature byte; the remaining 64 bytes are an ordinary Ed25519 signature
 * and are checked with crypto_sign_verify_detached.
 */
class XEdDsa {
public:
    /**
     * @param private_key Clamped X25519 scalar (32 bytes)
     * @param message Bytes to sign
     * @param random 64 bytes of fresh randomness
     * @return 64-byte signature
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> random);

    /**
     * @param public_key Montgomery u coordinate (32 bytes)
     * @return true only if the signature is valid for `message`
     */
    [[nodiscard]] static bool Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    /**
     * @brief Birational map u -> y = (u - 1) / (u + 1) mod 2^255 - 19
     *
     * @return Compressed Edwards point with `sign_bit` in bit 255, or
     *         nullopt when u + 1 is zero
     */
    [[nodiscard]] static std::optional<std::array<uint8_t, 32>> MontgomeryToEdwards(
        std::span<const uint8_t> public_key,
        uint8_t sign_bit);

private:
    XEdDsa() = delete;
};

}
