#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/identity/identity_key.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/protocol/message_version.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::messages {
using protocol::Result;
using protocol::ProtocolFailure;
using identity::IdentityKey;
using keys::PublicKey;

/**
 * @brief Pairwise ratchet message
 *
 * Wire form: version_byte || RatchetMessage protobuf || mac[8]. The MAC is
 * keyed by the message key of the ratchet step and covers both identities
 * and every preceding byte.
 */
class RatchetMessage {
public:
    [[nodiscard]] static Result<RatchetMessage, ProtocolFailure> Create(
        MessageVersion message_version,
        std::span<const uint8_t> mac_key,
        PublicKey sender_ratchet_key,
        uint32_t counter,
        uint32_t previous_counter,
        std::span<const uint8_t> ciphertext,
        const IdentityKey& sender_identity_key,
        const IdentityKey& receiver_identity_key);

    /// Structural decode only; call VerifyMac before trusting the contents.
    [[nodiscard]] static Result<RatchetMessage, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);

    [[nodiscard]] Result<bool, ProtocolFailure> VerifyMac(
        const IdentityKey& sender_identity_key,
        const IdentityKey& receiver_identity_key,
        std::span<const uint8_t> mac_key) const;

    [[nodiscard]] MessageVersion GetMessageVersion() const noexcept { return message_version_; }
    [[nodiscard]] const PublicKey& GetSenderRatchetKey() const noexcept { return sender_ratchet_key_; }
    [[nodiscard]] uint32_t GetCounter() const noexcept { return counter_; }
    [[nodiscard]] uint32_t GetPreviousCounter() const noexcept { return previous_counter_; }
    [[nodiscard]] std::span<const uint8_t> GetBody() const noexcept { return ciphertext_; }
    [[nodiscard]] std::span<const uint8_t> GetSerialized() const noexcept { return serialized_; }

    bool operator==(const RatchetMessage& other) const noexcept { return serialized_ == other.serialized_; }
    bool operator!=(const RatchetMessage& other) const noexcept { return !(*this == other); }

private:
    RatchetMessage(
        MessageVersion message_version,
        PublicKey sender_ratchet_key,
        uint32_t counter,
        uint32_t previous_counter,
        std::vector<uint8_t> ciphertext,
        std::vector<uint8_t> serialized);

    MessageVersion message_version_;
    PublicKey sender_ratchet_key_;
    uint32_t counter_;
    uint32_t previous_counter_;
    std::vector<uint8_t> ciphertext_;
    std::vector<uint8_t> serialized_;
};

}
