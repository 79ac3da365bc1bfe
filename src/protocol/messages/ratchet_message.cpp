#include "ratchetwire/protocol/messages/ratchet_message.hpp"
#include "ratchetwire/protocol/message_authentication.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/debug/wire_logger.hpp"
#include "wire/wire_messages.pb.h"
#include "wire_framing.hpp"

namespace ratchetwire::protocol::messages {

namespace {
    constexpr std::string_view kMessageName = "RatchetMessage";
}

RatchetMessage::RatchetMessage(
    const MessageVersion message_version,
    PublicKey sender_ratchet_key,
    const uint32_t counter,
    const uint32_t previous_counter,
    std::vector<uint8_t> ciphertext,
    std::vector<uint8_t> serialized)
    : message_version_(message_version)
    , sender_ratchet_key_(std::move(sender_ratchet_key))
    , counter_(counter)
    , previous_counter_(previous_counter)
    , ciphertext_(std::move(ciphertext))
    , serialized_(std::move(serialized))
{
}

Result<RatchetMessage, ProtocolFailure> RatchetMessage::Create(
    const MessageVersion message_version,
    std::span<const uint8_t> mac_key,
    PublicKey sender_ratchet_key,
    const uint32_t counter,
    const uint32_t previous_counter,
    std::span<const uint8_t> ciphertext,
    const IdentityKey& sender_identity_key,
    const IdentityKey& receiver_identity_key) {

    if (auto version_check = RequireCurrentVersion(message_version); version_check.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(version_check.UnwrapErr());
    }
    if (mac_key.size() != Constants::MAC_KEY_SIZE) {
        return Result<RatchetMessage, ProtocolFailure>::Err(
            ProtocolFailure::InvalidMacKeyLength(mac_key.size()));
    }

    proto::wire::RatchetMessage body;
    const auto ratchet_key_bytes = sender_ratchet_key.Serialize();
    body.set_ratchet_key(detail::ToField(ratchet_key_bytes));
    body.set_counter(counter);
    body.set_previous_counter(previous_counter);
    body.set_ciphertext(detail::ToField(ciphertext));

    auto framed_result = detail::EncodeFramed(
        PackVersionByte(message_version), body, Constants::MAC_SIZE, kMessageName);
    if (framed_result.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(framed_result.UnwrapErr());
    }
    auto serialized = std::move(framed_result).Unwrap();

    auto mac_result = MessageAuthentication::ComputeMac(
        sender_identity_key, receiver_identity_key, mac_key, serialized);
    if (mac_result.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(mac_result.UnwrapErr());
    }
    const auto& mac = mac_result.Unwrap();
    serialized.insert(serialized.end(), mac.begin(), mac.end());

    RW_LOG_BYTES("Encode", "RatchetMessage", std::span<const uint8_t>(serialized));

    return Result<RatchetMessage, ProtocolFailure>::Ok(RatchetMessage(
        message_version,
        std::move(sender_ratchet_key),
        counter,
        previous_counter,
        std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()),
        std::move(serialized)));
}

Result<RatchetMessage, ProtocolFailure> RatchetMessage::Deserialize(std::span<const uint8_t> bytes) {
    if (auto length_check = detail::RequireMinimumLength(bytes, WireConstants::RATCHET_MESSAGE_MIN_SIZE);
        length_check.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(length_check.UnwrapErr());
    }

    auto version_result = UnpackVersionByte(bytes[0], WireMessageKind::Ratchet);
    if (version_result.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(version_result.UnwrapErr());
    }
    auto message_version = MessageVersionFromU32(version_result.Unwrap(), WireMessageKind::Ratchet);
    if (message_version.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(message_version.UnwrapErr());
    }

    proto::wire::RatchetMessage body;
    const auto body_bytes = bytes.subspan(
        Constants::VERSION_BYTE_SIZE,
        bytes.size() - Constants::VERSION_BYTE_SIZE - Constants::MAC_SIZE);
    if (auto decode = detail::DecodeBody(body_bytes, body, kMessageName); decode.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(decode.UnwrapErr());
    }

    if (!body.has_ratchet_key() || !body.has_counter() || !body.has_ciphertext()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(ProtocolFailure::InvalidProtobufEncoding());
    }

    auto ratchet_key = PublicKey::Deserialize(detail::AsBytes(body.ratchet_key()));
    if (ratchet_key.IsErr()) {
        return Result<RatchetMessage, ProtocolFailure>::Err(ratchet_key.UnwrapErr());
    }

    RW_LOG_BYTES("Decode", "RatchetMessage", bytes);
    RW_LOG_VALUE("Decode", "counter", body.counter());

    const auto ciphertext = detail::AsBytes(body.ciphertext());
    return Result<RatchetMessage, ProtocolFailure>::Ok(RatchetMessage(
        message_version.Unwrap(),
        std::move(ratchet_key).Unwrap(),
        body.counter(),
        body.previous_counter(),
        std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()),
        std::vector<uint8_t>(bytes.begin(), bytes.end())));
}

Result<bool, ProtocolFailure> RatchetMessage::VerifyMac(
    const IdentityKey& sender_identity_key,
    const IdentityKey& receiver_identity_key,
    std::span<const uint8_t> mac_key) const {
    const std::span<const uint8_t> stored(serialized_);
    const auto split = stored.size() - Constants::MAC_SIZE;
    return MessageAuthentication::VerifyMac(
        sender_identity_key,
        receiver_identity_key,
        mac_key,
        stored.first(split),
        stored.subspan(split));
}

}
