#include "wire_framing.hpp"

#include <limits>

namespace ratchetwire::protocol::messages::detail {

Result<std::vector<uint8_t>, ProtocolFailure> EncodeFramed(
    const uint8_t version_byte,
    const google::protobuf::MessageLite& body,
    const size_t trailer_size,
    std::string_view message_name) {

    const size_t body_size = body.ByteSizeLong();
    if (body_size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ProtobufEncodingError(
                compat::format("{} body of {} bytes exceeds protobuf limits", message_name, body_size)));
    }

    std::vector<uint8_t> framed;
    framed.reserve(1 + body_size + trailer_size);
    framed.push_back(version_byte);
    framed.resize(1 + body_size);
    if (!body.SerializeToArray(framed.data() + 1, static_cast<int>(body_size))) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ProtobufEncodingError(
                compat::format("failed to serialize {}", message_name)));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(framed));
}

Result<Unit, ProtocolFailure> DecodeBody(
    std::span<const uint8_t> body_bytes,
    google::protobuf::MessageLite& body,
    std::string_view message_name) {
    if (body_bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        !body.ParseFromArray(body_bytes.data(), static_cast<int>(body_bytes.size()))) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::ProtobufDecodingError(
                compat::format("failed to parse {}", message_name)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> RequireMinimumLength(
    std::span<const uint8_t> bytes,
    const size_t minimum) {
    if (bytes.size() < minimum) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::CiphertextMessageTooShort(bytes.size()));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
