#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/core/option.hpp"
#include "ratchetwire/identity/identity_key.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/protocol/message_version.hpp"
#include "ratchetwire/protocol/messages/ratchet_message.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::messages {
using protocol::Option;

/**
 * @brief First message of a session, carrying the pre-keys it was built on
 *
 * Wire form: version_byte || PreKeyRatchetMessage protobuf. There is no tag
 * of its own; the embedded RatchetMessage's MAC authenticates it.
 */
class PreKeyRatchetMessage {
public:
    [[nodiscard]] static Result<PreKeyRatchetMessage, ProtocolFailure> Create(
        MessageVersion message_version,
        uint32_t registration_id,
        Option<uint32_t> pre_key_id,
        uint32_t signed_pre_key_id,
        PublicKey base_key,
        IdentityKey identity_key,
        RatchetMessage message);

    [[nodiscard]] static Result<PreKeyRatchetMessage, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);

    [[nodiscard]] MessageVersion GetMessageVersion() const noexcept { return message_version_; }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }
    /// Empty when no one-time pre-key was used.
    [[nodiscard]] Option<uint32_t> GetPreKeyId() const noexcept { return pre_key_id_; }
    [[nodiscard]] uint32_t GetSignedPreKeyId() const noexcept { return signed_pre_key_id_; }
    [[nodiscard]] const PublicKey& GetBaseKey() const noexcept { return base_key_; }
    [[nodiscard]] const IdentityKey& GetIdentityKey() const noexcept { return identity_key_; }
    [[nodiscard]] const RatchetMessage& GetMessage() const noexcept { return message_; }
    [[nodiscard]] std::span<const uint8_t> GetSerialized() const noexcept { return serialized_; }

    bool operator==(const PreKeyRatchetMessage& other) const noexcept { return serialized_ == other.serialized_; }
    bool operator!=(const PreKeyRatchetMessage& other) const noexcept { return !(*this == other); }

private:
    PreKeyRatchetMessage(
        MessageVersion message_version,
        uint32_t registration_id,
        Option<uint32_t> pre_key_id,
        uint32_t signed_pre_key_id,
        PublicKey base_key,
        IdentityKey identity_key,
        RatchetMessage message,
        std::vector<uint8_t> serialized);

    MessageVersion message_version_;
    uint32_t registration_id_;
    Option<uint32_t> pre_key_id_;
    uint32_t signed_pre_key_id_;
    PublicKey base_key_;
    IdentityKey identity_key_;
    RatchetMessage message_;
    std::vector<uint8_t> serialized_;
};

}
