#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/models/distribution_id.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include "ratchetwire/protocol/message_version.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::messages {
using keys::PrivateKey;
using keys::PublicKey;
using models::DistributionId;
using interfaces::IRandomSource;

/**
 * @brief Group message encrypted under a sender-key chain
 *
 * Wire form: version_byte || SenderKeyMessage protobuf || signature[64],
 * signed with the distribution's private signing key.
 */
class SenderKeyMessage {
public:
    /// Fails with ApplicationCallbackError if `random_source` throws.
    [[nodiscard]] static Result<SenderKeyMessage, ProtocolFailure> Create(
        MessageVersion message_version,
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> ciphertext,
        IRandomSource& random_source,
        const PrivateKey& signature_key);

    [[nodiscard]] static Result<SenderKeyMessage, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);

    /// Err(SignatureValidationFailed) unless signed by `signature_key`.
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifySignature(const PublicKey& signature_key) const;

    [[nodiscard]] MessageVersion GetMessageVersion() const noexcept { return message_version_; }
    [[nodiscard]] const DistributionId& GetDistributionId() const noexcept { return distribution_id_; }
    [[nodiscard]] uint32_t GetChainId() const noexcept { return chain_id_; }
    [[nodiscard]] uint32_t GetIteration() const noexcept { return iteration_; }
    [[nodiscard]] std::span<const uint8_t> GetCiphertext() const noexcept { return ciphertext_; }
    [[nodiscard]] std::span<const uint8_t> GetSerialized() const noexcept { return serialized_; }

    bool operator==(const SenderKeyMessage& other) const noexcept { return serialized_ == other.serialized_; }
    bool operator!=(const SenderKeyMessage& other) const noexcept { return !(*this == other); }

private:
    SenderKeyMessage(
        MessageVersion message_version,
        DistributionId distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::vector<uint8_t> ciphertext,
        std::vector<uint8_t> serialized);

    MessageVersion message_version_;
    DistributionId distribution_id_;
    uint32_t chain_id_;
    uint32_t iteration_;
    std::vector<uint8_t> ciphertext_;
    std::vector<uint8_t> serialized_;
};

}
