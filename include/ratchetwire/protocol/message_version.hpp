#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/core/constants.hpp"
#include <cstdint>
namespace ratchetwire::protocol {

/// Wire protocol revisions. Only Version3 is produced or accepted; Version2
/// exists so legacy traffic can be named in diagnostics.
enum class MessageVersion : uint8_t {
    Version2 = kCiphertextMessageLegacyVersion,
    Version3 = kCiphertextMessageCurrentVersion
};

inline constexpr MessageVersion kDefaultMessageVersion = MessageVersion::Version3;

[[nodiscard]] constexpr uint32_t ToU32(const MessageVersion version) noexcept {
    return static_cast<uint32_t>(version);
}

/**
 * @brief Leading byte of every wire message
 *
 * High nibble is the message version, low nibble the library's current
 * version.
 */
[[nodiscard]] constexpr uint8_t PackVersionByte(const uint8_t version) noexcept {
    return static_cast<uint8_t>(
        ((version & Constants::VERSION_NIBBLE_MASK) << Constants::VERSION_NIBBLE_SHIFT) |
        kCiphertextMessageCurrentVersion);
}

[[nodiscard]] constexpr uint8_t PackVersionByte(const MessageVersion version) noexcept {
    return PackVersionByte(static_cast<uint8_t>(version));
}

/**
 * @brief Classify the version byte of a message of the given kind
 *
 * @return The high nibble when it equals the current version,
 *         LegacyCiphertextVersion below it, UnrecognizedCiphertextVersion
 *         above it
 */
[[nodiscard]] Result<uint8_t, ProtocolFailure> UnpackVersionByte(uint8_t version_byte, WireMessageKind kind);

/// Maps a 32-bit version field to a known revision.
[[nodiscard]] Result<MessageVersion, ProtocolFailure> MessageVersionFromU32(uint32_t value, WireMessageKind kind);

/// Rejects revisions this library does not produce.
[[nodiscard]] Result<Unit, ProtocolFailure> RequireCurrentVersion(MessageVersion version);

}
