#include "ratchetwire/protocol/ciphertext_message.hpp"

#include <type_traits>

namespace ratchetwire::protocol {

static_assert(std::variant_size_v<CiphertextMessage::Variant> == 3,
              "update GetMessageType and Deserialize when adding a ciphertext kind");

Result<CiphertextMessageType, ProtocolFailure> CiphertextMessageTypeFromByte(const uint8_t value) {
    switch (value) {
        case static_cast<uint8_t>(CiphertextMessageType::Ratchet):
            return Result<CiphertextMessageType, ProtocolFailure>::Ok(CiphertextMessageType::Ratchet);
        case static_cast<uint8_t>(CiphertextMessageType::PreKey):
            return Result<CiphertextMessageType, ProtocolFailure>::Ok(CiphertextMessageType::PreKey);
        case static_cast<uint8_t>(CiphertextMessageType::SenderKey):
            return Result<CiphertextMessageType, ProtocolFailure>::Ok(CiphertextMessageType::SenderKey);
        default:
            return Result<CiphertextMessageType, ProtocolFailure>::Err(
                ProtocolFailure::InvalidArgument(
                    compat::format("unknown ciphertext message type {}", static_cast<unsigned>(value))));
    }
}

Result<CiphertextMessage, ProtocolFailure> CiphertextMessage::Deserialize(
    const CiphertextMessageType type,
    std::span<const uint8_t> bytes) {
    switch (type) {
        case CiphertextMessageType::Ratchet:
            return messages::RatchetMessage::Deserialize(bytes).Map(
                [](messages::RatchetMessage message) { return CiphertextMessage(std::move(message)); });
        case CiphertextMessageType::PreKey:
            return messages::PreKeyRatchetMessage::Deserialize(bytes).Map(
                [](messages::PreKeyRatchetMessage message) { return CiphertextMessage(std::move(message)); });
        case CiphertextMessageType::SenderKey:
            return messages::SenderKeyMessage::Deserialize(bytes).Map(
                [](messages::SenderKeyMessage message) { return CiphertextMessage(std::move(message)); });
    }
    return Result<CiphertextMessage, ProtocolFailure>::Err(
        ProtocolFailure::InvalidArgument("unknown ciphertext message type"));
}

CiphertextMessageType CiphertextMessage::GetMessageType() const noexcept {
    return std::visit([](const auto& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, messages::RatchetMessage>) {
            return CiphertextMessageType::Ratchet;
        } else if constexpr (std::is_same_v<T, messages::PreKeyRatchetMessage>) {
            return CiphertextMessageType::PreKey;
        } else {
            static_assert(std::is_same_v<T, messages::SenderKeyMessage>);
            return CiphertextMessageType::SenderKey;
        }
    }, message_);
}

std::span<const uint8_t> CiphertextMessage::Serialize() const noexcept {
    return std::visit([](const auto& message) { return message.GetSerialized(); }, message_);
}

}
