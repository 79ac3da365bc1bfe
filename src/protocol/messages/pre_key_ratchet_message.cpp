#include "ratchetwire/protocol/messages/pre_key_ratchet_message.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/debug/wire_logger.hpp"
#include "wire/wire_messages.pb.h"
#include "wire_framing.hpp"

namespace ratchetwire::protocol::messages {

namespace {
    constexpr std::string_view kMessageName = "PreKeyRatchetMessage";
}

PreKeyRatchetMessage::PreKeyRatchetMessage(
    const MessageVersion message_version,
    const uint32_t registration_id,
    Option<uint32_t> pre_key_id,
    const uint32_t signed_pre_key_id,
    PublicKey base_key,
    IdentityKey identity_key,
    RatchetMessage message,
    std::vector<uint8_t> serialized)
    : message_version_(message_version)
    , registration_id_(registration_id)
    , pre_key_id_(pre_key_id)
    , signed_pre_key_id_(signed_pre_key_id)
    , base_key_(std::move(base_key))
    , identity_key_(std::move(identity_key))
    , message_(std::move(message))
    , serialized_(std::move(serialized))
{
}

Result<PreKeyRatchetMessage, ProtocolFailure> PreKeyRatchetMessage::Create(
    const MessageVersion message_version,
    const uint32_t registration_id,
    Option<uint32_t> pre_key_id,
    const uint32_t signed_pre_key_id,
    PublicKey base_key,
    IdentityKey identity_key,
    RatchetMessage message) {

    if (auto version_check = RequireCurrentVersion(message_version); version_check.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(version_check.UnwrapErr());
    }

    proto::wire::PreKeyRatchetMessage body;
    body.set_registration_id(registration_id);
    if (pre_key_id.has_value()) {
        body.set_pre_key_id(*pre_key_id);
    }
    body.set_signed_pre_key_id(signed_pre_key_id);
    body.set_base_key(detail::ToField(base_key.Serialize()));
    body.set_identity_key(detail::ToField(identity_key.Serialize()));
    body.set_message(detail::ToField(message.GetSerialized()));

    auto framed_result = detail::EncodeFramed(PackVersionByte(message_version), body, 0, kMessageName);
    if (framed_result.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(framed_result.UnwrapErr());
    }
    auto serialized = std::move(framed_result).Unwrap();

    RW_LOG_BYTES("Encode", "PreKeyRatchetMessage", std::span<const uint8_t>(serialized));

    return Result<PreKeyRatchetMessage, ProtocolFailure>::Ok(PreKeyRatchetMessage(
        message_version,
        registration_id,
        pre_key_id,
        signed_pre_key_id,
        std::move(base_key),
        std::move(identity_key),
        std::move(message),
        std::move(serialized)));
}

Result<PreKeyRatchetMessage, ProtocolFailure> PreKeyRatchetMessage::Deserialize(std::span<const uint8_t> bytes) {
    if (auto length_check = detail::RequireMinimumLength(bytes, WireConstants::PRE_KEY_MESSAGE_MIN_SIZE);
        length_check.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(length_check.UnwrapErr());
    }

    auto version_result = UnpackVersionByte(bytes[0], WireMessageKind::PreKey);
    if (version_result.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(version_result.UnwrapErr());
    }
    auto message_version = MessageVersionFromU32(version_result.Unwrap(), WireMessageKind::PreKey);
    if (message_version.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(message_version.UnwrapErr());
    }

    proto::wire::PreKeyRatchetMessage body;
    if (auto decode = detail::DecodeBody(bytes.subspan(Constants::VERSION_BYTE_SIZE), body, kMessageName);
        decode.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(decode.UnwrapErr());
    }

    if (!body.has_signed_pre_key_id() || !body.has_base_key() ||
        !body.has_identity_key() || !body.has_message()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(ProtocolFailure::InvalidProtobufEncoding());
    }

    auto base_key = PublicKey::Deserialize(detail::AsBytes(body.base_key()));
    if (base_key.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(base_key.UnwrapErr());
    }
    auto identity_key = IdentityKey::Decode(detail::AsBytes(body.identity_key()));
    if (identity_key.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(identity_key.UnwrapErr());
    }
    auto message = RatchetMessage::Deserialize(detail::AsBytes(body.message()));
    if (message.IsErr()) {
        return Result<PreKeyRatchetMessage, ProtocolFailure>::Err(message.UnwrapErr());
    }

    RW_LOG_BYTES("Decode", "PreKeyRatchetMessage", bytes);

    Option<uint32_t> pre_key_id;
    if (body.has_pre_key_id()) {
        pre_key_id = body.pre_key_id();
    }

    return Result<PreKeyRatchetMessage, ProtocolFailure>::Ok(PreKeyRatchetMessage(
        message_version.Unwrap(),
        body.registration_id(),
        pre_key_id,
        body.signed_pre_key_id(),
        std::move(base_key).Unwrap(),
        std::move(identity_key).Unwrap(),
        std::move(message).Unwrap(),
        std::vector<uint8_t>(bytes.begin(), bytes.end())));
}

}
