#include "ratchetwire/protocol/messages/sender_key_distribution_message.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/debug/wire_logger.hpp"
#include "wire/wire_messages.pb.h"
#include "wire_framing.hpp"

namespace ratchetwire::protocol::messages {

namespace {
    constexpr std::string_view kMessageName = "SenderKeyDistributionMessage";
}

SenderKeyDistributionMessage::SenderKeyDistributionMessage(
    const MessageVersion message_version,
    DistributionId distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::vector<uint8_t> chain_key,
    PublicKey signing_key,
    std::vector<uint8_t> serialized)
    : message_version_(message_version)
    , distribution_id_(distribution_id)
    , chain_id_(chain_id)
    , iteration_(iteration)
    , chain_key_(std::move(chain_key))
    , signing_key_(std::move(signing_key))
    , serialized_(std::move(serialized))
{
}

Result<SenderKeyDistributionMessage, ProtocolFailure> SenderKeyDistributionMessage::Create(
    const MessageVersion message_version,
    const DistributionId& distribution_id,
    const uint32_t chain_id,
    const uint32_t iteration,
    std::span<const uint8_t> chain_key,
    PublicKey signing_key) {

    if (auto version_check = RequireCurrentVersion(message_version); version_check.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(version_check.UnwrapErr());
    }
    if (chain_key.size() != Constants::CHAIN_KEY_SIZE) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument(compat::format(
                "chain key must be {} bytes, got {}", Constants::CHAIN_KEY_SIZE, chain_key.size())));
    }

    proto::wire::SenderKeyDistributionMessage body;
    body.set_distribution_uuid(detail::ToField(distribution_id.AsBytes()));
    body.set_chain_id(chain_id);
    body.set_iteration(iteration);
    body.set_chain_key(detail::ToField(chain_key));
    body.set_signing_key(detail::ToField(signing_key.Serialize()));

    auto framed_result = detail::EncodeFramed(PackVersionByte(message_version), body, 0, kMessageName);
    if (framed_result.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(framed_result.UnwrapErr());
    }

    RW_LOG_VALUE("Encode", "SenderKeyDistributionMessage chain_id", chain_id);

    return Result<SenderKeyDistributionMessage, ProtocolFailure>::Ok(SenderKeyDistributionMessage(
        message_version,
        distribution_id,
        chain_id,
        iteration,
        std::vector<uint8_t>(chain_key.begin(), chain_key.end()),
        std::move(signing_key),
        std::move(framed_result).Unwrap()));
}

Result<SenderKeyDistributionMessage, ProtocolFailure> SenderKeyDistributionMessage::Deserialize(
    std::span<const uint8_t> bytes) {
    if (auto length_check = detail::RequireMinimumLength(bytes, WireConstants::DISTRIBUTION_MESSAGE_MIN_SIZE);
        length_check.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(length_check.UnwrapErr());
    }

    auto version_result = UnpackVersionByte(bytes[0], WireMessageKind::SenderKeyDistribution);
    if (version_result.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(version_result.UnwrapErr());
    }
    auto message_version = MessageVersionFromU32(
        version_result.Unwrap(), WireMessageKind::SenderKeyDistribution);
    if (message_version.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(message_version.UnwrapErr());
    }

    proto::wire::SenderKeyDistributionMessage body;
    if (auto decode = detail::DecodeBody(bytes.subspan(Constants::VERSION_BYTE_SIZE), body, kMessageName);
        decode.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(decode.UnwrapErr());
    }

    if (!body.has_distribution_uuid() || !body.has_chain_id() || !body.has_iteration() ||
        !body.has_chain_key() || !body.has_signing_key()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(
            ProtocolFailure::InvalidProtobufEncoding());
    }

    const auto distribution_id = DistributionId::FromBytes(detail::AsBytes(body.distribution_uuid()));
    if (!distribution_id.has_value() ||
        body.chain_key().size() != Constants::CHAIN_KEY_SIZE ||
        body.signing_key().size() != Constants::SERIALIZED_PUBLIC_KEY_SIZE) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(
            ProtocolFailure::InvalidProtobufEncoding());
    }

    auto signing_key = PublicKey::Deserialize(detail::AsBytes(body.signing_key()));
    if (signing_key.IsErr()) {
        return Result<SenderKeyDistributionMessage, ProtocolFailure>::Err(signing_key.UnwrapErr());
    }

    RW_LOG_VALUE("Decode", "SenderKeyDistributionMessage chain_id", body.chain_id());

    const auto chain_key = detail::AsBytes(body.chain_key());
    return Result<SenderKeyDistributionMessage, ProtocolFailure>::Ok(SenderKeyDistributionMessage(
        message_version.Unwrap(),
        *distribution_id,
        body.chain_id(),
        body.iteration(),
        std::vector<uint8_t>(chain_key.begin(), chain_key.end()),
        std::move(signing_key).Unwrap(),
        std::vector<uint8_t>(bytes.begin(), bytes.end())));
}

}
