#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include <google/protobuf/message_lite.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace ratchetwire::protocol::messages::detail {

/// version_byte || body, with room reserved for a trailing tag.
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncodeFramed(
    uint8_t version_byte,
    const google::protobuf::MessageLite& body,
    size_t trailer_size,
    std::string_view message_name);

[[nodiscard]] Result<Unit, ProtocolFailure> DecodeBody(
    std::span<const uint8_t> body_bytes,
    google::protobuf::MessageLite& body,
    std::string_view message_name);

[[nodiscard]] Result<Unit, ProtocolFailure> RequireMinimumLength(
    std::span<const uint8_t> bytes,
    size_t minimum);

[[nodiscard]] inline std::span<const uint8_t> AsBytes(const std::string& field) noexcept {
    return {reinterpret_cast<const uint8_t*>(field.data()), field.size()};
}

[[nodiscard]] inline std::string ToField(std::span<const uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}
