#include "ratchetwire/protocol/messages/sender_key_message.hpp"
#include "ratchetwire/protocol/message_authentication.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/debug/wire_logger.hpp"
#include "wire/wire_messages.pb.h"
#include "wire_framing.hpp"

namespace ratchetwire::protocol::messages {

namespace {
    constexpr std::string_view kMessageName = "SenderKeyMessage";
}

SenderKeyMessage::SenderKeyMessage(
    const MessageVersion message_version,
    DistributionId distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::vector<uint8_t> ciphertext,
    std::vector<uint8_t> serialized)
    : message_version_(message_version)
    , distribution_id_(distribution_id)
    , chain_id_(chain_id)
    , iteration_(iteration)
    , ciphertext_(std::move(ciphertext))
    , serialized_(std::move(serialized))
{
}

Result<SenderKeyMessage, ProtocolFailure> SenderKeyMessage::Create(
    const MessageVersion message_version,
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> ciphertext,
    IRandomSource& random_source,
    const PrivateKey& signature_key) {

    if (auto version_check = RequireCurrentVersion(message_version); version_check.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(version_check.UnwrapErr());
    }

    proto::wire::SenderKeyMessage body;
    body.set_distribution_uuid(detail::ToField(distribution_id.AsBytes()));
    body.set_chain_id(chain_id);
    body.set_iteration(iteration);
    body.set_ciphertext(detail::ToField(ciphertext));

    auto framed_result = detail::EncodeFramed(
        PackVersionByte(message_version), body, Constants::XEDDSA_SIGNATURE_SIZE, kMessageName);
    if (framed_result.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(framed_result.UnwrapErr());
    }
    auto serialized = std::move(framed_result).Unwrap();

    auto signature_result = MessageAuthentication::ComputeSignature(signature_key, serialized, random_source);
    if (signature_result.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(signature_result.UnwrapErr());
    }
    const auto& signature = signature_result.Unwrap();
    serialized.insert(serialized.end(), signature.begin(), signature.end());

    RW_LOG_BYTES("Encode", "SenderKeyMessage", std::span<const uint8_t>(serialized));

    return Result<SenderKeyMessage, ProtocolFailure>::Ok(SenderKeyMessage(
        message_version,
        distribution_id,
        chain_id,
        iteration,
        std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()),
        std::move(serialized)));
}

Result<SenderKeyMessage, ProtocolFailure> SenderKeyMessage::Deserialize(std::span<const uint8_t> bytes) {
    if (auto length_check = detail::RequireMinimumLength(bytes, WireConstants::SENDER_KEY_MESSAGE_MIN_SIZE);
        length_check.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(length_check.UnwrapErr());
    }

    auto version_result = UnpackVersionByte(bytes[0], WireMessageKind::SenderKey);
    if (version_result.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(version_result.UnwrapErr());
    }
    auto message_version = MessageVersionFromU32(version_result.Unwrap(), WireMessageKind::SenderKey);
    if (message_version.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(message_version.UnwrapErr());
    }

    proto::wire::SenderKeyMessage body;
    const auto body_bytes = bytes.subspan(
        Constants::VERSION_BYTE_SIZE,
        bytes.size() - Constants::VERSION_BYTE_SIZE - Constants::XEDDSA_SIGNATURE_SIZE);
    if (auto decode = detail::DecodeBody(body_bytes, body, kMessageName); decode.IsErr()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(decode.UnwrapErr());
    }

    if (!body.has_distribution_uuid() || !body.has_chain_id() ||
        !body.has_iteration() || !body.has_ciphertext()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(ProtocolFailure::InvalidProtobufEncoding());
    }

    const auto distribution_id = DistributionId::FromBytes(detail::AsBytes(body.distribution_uuid()));
    if (!distribution_id.has_value()) {
        return Result<SenderKeyMessage, ProtocolFailure>::Err(ProtocolFailure::InvalidProtobufEncoding());
    }

    RW_LOG_BYTES("Decode", "SenderKeyMessage", bytes);
    RW_LOG_VALUE("Decode", "iteration", body.iteration());

    const auto ciphertext = detail::AsBytes(body.ciphertext());
    return Result<SenderKeyMessage, ProtocolFailure>::Ok(SenderKeyMessage(
        message_version.Unwrap(),
        *distribution_id,
        body.chain_id(),
        body.iteration(),
        std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()),
        std::vector<uint8_t>(bytes.begin(), bytes.end())));
}

Result<Unit, ProtocolFailure> SenderKeyMessage::VerifySignature(const PublicKey& signature_key) const {
    const std::span<const uint8_t> stored(serialized_);
    const auto split = stored.size() - Constants::XEDDSA_SIGNATURE_SIZE;
    return MessageAuthentication::VerifySignature(
        signature_key,
        stored.first(split),
        stored.subspan(split));
}

}
