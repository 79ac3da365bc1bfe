#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/identity/identity_key.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol {
using identity::IdentityKey;
using keys::PrivateKey;
using keys::PublicKey;
using interfaces::IRandomSource;

/**
 * @brief Authentication tags bound to ciphertext messages
 *
 * Pairwise messages carry a truncated HMAC-SHA256 over both identities and
 * the framed bytes; group messages carry an XEdDSA signature.
 */
class MessageAuthentication {
public:
    /**
     * @brief HMAC-SHA256(mac_key, sender || receiver || message)[0..8]
     *
     * @param mac_key Must be 32 bytes, otherwise InvalidMacKeyLength
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> ComputeMac(
        const IdentityKey& sender_identity,
        const IdentityKey& receiver_identity,
        std::span<const uint8_t> mac_key,
        std::span<const uint8_t> message);

    /**
     * @brief Recompute the MAC and compare in constant time
     *
     * @return Ok(false) on mismatch, which is also logged
     */
    [[nodiscard]] static Result<bool, ProtocolFailure> VerifyMac(
        const IdentityKey& sender_identity,
        const IdentityKey& receiver_identity,
        std::span<const uint8_t> mac_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> their_mac);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> ComputeSignature(
        const PrivateKey& private_key,
        std::span<const uint8_t> message,
        IRandomSource& random_source);

    /// Err(SignatureValidationFailed) unless the signature checks out.
    [[nodiscard]] static Result<Unit, ProtocolFailure> VerifySignature(
        const PublicKey& public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

private:
    MessageAuthentication() = delete;
};

}
