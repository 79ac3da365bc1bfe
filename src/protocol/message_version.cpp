#include "ratchetwire/protocol/message_version.hpp"

namespace ratchetwire::protocol {

Result<uint8_t, ProtocolFailure> UnpackVersionByte(const uint8_t version_byte, const WireMessageKind kind) {
    const auto version = static_cast<uint8_t>(version_byte >> Constants::VERSION_NIBBLE_SHIFT);
    if (version < kCiphertextMessageCurrentVersion) {
        return Result<uint8_t, ProtocolFailure>::Err(
            ProtocolFailure::LegacyCiphertextVersion(version, kind));
    }
    if (version > kCiphertextMessageCurrentVersion) {
        return Result<uint8_t, ProtocolFailure>::Err(
            ProtocolFailure::UnrecognizedCiphertextVersion(version, kind));
    }
    return Result<uint8_t, ProtocolFailure>::Ok(version);
}

Result<MessageVersion, ProtocolFailure> MessageVersionFromU32(const uint32_t value, const WireMessageKind kind) {
    switch (value) {
        case ToU32(MessageVersion::Version2):
            return Result<MessageVersion, ProtocolFailure>::Ok(MessageVersion::Version2);
        case ToU32(MessageVersion::Version3):
            return Result<MessageVersion, ProtocolFailure>::Ok(MessageVersion::Version3);
        default:
            return Result<MessageVersion, ProtocolFailure>::Err(
                ProtocolFailure::UnrecognizedMessageVersion(value, kind));
    }
}

Result<Unit, ProtocolFailure> RequireCurrentVersion(const MessageVersion version) {
    if (version != kDefaultMessageVersion) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidArgument(
            compat::format("message version {} is not produced by this library", ToU32(version))));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
