#include "ratchetwire/protocol/message_authentication.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/crypto/sodium_interop.hpp"
#include "ratchetwire/debug/wire_logger.hpp"

#include <sodium.h>
#include <array>

namespace ratchetwire::protocol {

Result<std::vector<uint8_t>, ProtocolFailure> MessageAuthentication::ComputeMac(
    const IdentityKey& sender_identity,
    const IdentityKey& receiver_identity,
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> message) {

    if (mac_key.size() != Constants::MAC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidMacKeyLength(mac_key.size()));
    }

    const auto sender_bytes = sender_identity.Serialize();
    const auto receiver_bytes = receiver_identity.Serialize();

    crypto_auth_hmacsha256_state state;
    std::array<uint8_t, crypto_auth_hmacsha256_BYTES> full_mac{};
    if (crypto_auth_hmacsha256_init(&state, mac_key.data(), mac_key.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_update(&state, sender_bytes.data(), sender_bytes.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_update(&state, receiver_bytes.data(), receiver_bytes.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_update(&state, message.data(), message.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_final(&state, full_mac.data()) != SodiumConstants::SUCCESS) {
        sodium_memzero(&state, sizeof(state));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("HMAC-SHA256 computation failed"));
    }
    sodium_memzero(&state, sizeof(state));

    std::vector<uint8_t> mac(full_mac.begin(), full_mac.begin() + Constants::MAC_SIZE);
    sodium_memzero(full_mac.data(), full_mac.size());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
}

Result<bool, ProtocolFailure> MessageAuthentication::VerifyMac(
    const IdentityKey& sender_identity,
    const IdentityKey& receiver_identity,
    std::span<const uint8_t> mac_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> their_mac) {

    auto our_mac_result = ComputeMac(sender_identity, receiver_identity, mac_key, message);
    if (our_mac_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(our_mac_result.UnwrapErr());
    }
    const auto& our_mac = our_mac_result.Unwrap();

    auto compare_result = crypto::SodiumInterop::ConstantTimeEquals(our_mac, their_mac);
    if (compare_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(compare_result.UnwrapErr()));
    }
    const bool matches = compare_result.Unwrap();
    if (!matches) {
        RW_LOG_ERROR("MessageAuthentication", compat::format(
            "Bad Mac! Their Mac: {} Our Mac: {}",
            debug::ToHex(their_mac),
            debug::ToHex(our_mac)));
    }
    return Result<bool, ProtocolFailure>::Ok(matches);
}

Result<std::vector<uint8_t>, ProtocolFailure> MessageAuthentication::ComputeSignature(
    const PrivateKey& private_key,
    std::span<const uint8_t> message,
    IRandomSource& random_source) {
    return private_key.CalculateSignature(message, random_source);
}

Result<Unit, ProtocolFailure> MessageAuthentication::VerifySignature(
    const PublicKey& public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (!public_key.VerifySignature(message, signature)) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::SignatureValidationFailed());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
