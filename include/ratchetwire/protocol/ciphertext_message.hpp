#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/protocol/messages/ratchet_message.hpp"
#include "ratchetwire/protocol/messages/pre_key_ratchet_message.hpp"
#include "ratchetwire/protocol/messages/sender_key_message.hpp"
#include <cstdint>
#include <span>
#include <variant>
namespace ratchetwire::protocol {

/// Wire type codes shared with the outer envelope. Never renumber.
enum class CiphertextMessageType : uint8_t {
    Ratchet = 2,
    PreKey = 3,
    SenderKey = 7
};

[[nodiscard]] Result<CiphertextMessageType, ProtocolFailure> CiphertextMessageTypeFromByte(uint8_t value);

/**
 * @brief Any message that travels as opaque ciphertext
 *
 * Transport code reads the type and bytes without knowing the concrete
 * kind. Sender-key distribution messages are control traffic and are not
 * part of this set.
 */
class CiphertextMessage {
public:
    using Variant = std::variant<
        messages::RatchetMessage,
        messages::PreKeyRatchetMessage,
        messages::SenderKeyMessage>;

    explicit CiphertextMessage(messages::RatchetMessage message) : message_(std::move(message)) {}
    explicit CiphertextMessage(messages::PreKeyRatchetMessage message) : message_(std::move(message)) {}
    explicit CiphertextMessage(messages::SenderKeyMessage message) : message_(std::move(message)) {}

    /// Routes `bytes` to the codec for `type`.
    [[nodiscard]] static Result<CiphertextMessage, ProtocolFailure> Deserialize(
        CiphertextMessageType type,
        std::span<const uint8_t> bytes);

    [[nodiscard]] CiphertextMessageType GetMessageType() const noexcept;
    [[nodiscard]] std::span<const uint8_t> Serialize() const noexcept;
    [[nodiscard]] const Variant& AsVariant() const noexcept { return message_; }

private:
    Variant message_;
};

}
