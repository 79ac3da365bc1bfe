#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/models/distribution_id.hpp"
#include "ratchetwire/protocol/message_version.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::messages {
using keys::PublicKey;
using models::DistributionId;

/**
 * @brief Hands a group sending chain to the other members
 *
 * Wire form: version_byte || SenderKeyDistributionMessage protobuf. Carries
 * no tag; it is trusted because it arrives over an authenticated pairwise
 * session.
 */
class SenderKeyDistributionMessage {
public:
    [[nodiscard]] static Result<SenderKeyDistributionMessage, ProtocolFailure> Create(
        MessageVersion message_version,
        const DistributionId& distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::span<const uint8_t> chain_key,
        PublicKey signing_key);

    [[nodiscard]] static Result<SenderKeyDistributionMessage, ProtocolFailure> Deserialize(
        std::span<const uint8_t> bytes);

    [[nodiscard]] MessageVersion GetMessageVersion() const noexcept { return message_version_; }
    [[nodiscard]] const DistributionId& GetDistributionId() const noexcept { return distribution_id_; }
    [[nodiscard]] uint32_t GetChainId() const noexcept { return chain_id_; }
    [[nodiscard]] uint32_t GetIteration() const noexcept { return iteration_; }
    [[nodiscard]] std::span<const uint8_t> GetChainKey() const noexcept { return chain_key_; }
    [[nodiscard]] const PublicKey& GetSigningKey() const noexcept { return signing_key_; }
    [[nodiscard]] std::span<const uint8_t> GetSerialized() const noexcept { return serialized_; }

    bool operator==(const SenderKeyDistributionMessage& other) const noexcept {
        return serialized_ == other.serialized_;
    }
    bool operator!=(const SenderKeyDistributionMessage& other) const noexcept { return !(*this == other); }

private:
    SenderKeyDistributionMessage(
        MessageVersion message_version,
        DistributionId distribution_id,
        uint32_t chain_id,
        uint32_t iteration,
        std::vector<uint8_t> chain_key,
        PublicKey signing_key,
        std::vector<uint8_t> serialized);

    MessageVersion message_version_;
    DistributionId distribution_id_;
    uint32_t chain_id_;
    uint32_t iteration_;
    std::vector<uint8_t> chain_key_;
    PublicKey signing_key_;
    std::vector<uint8_t> serialized_;
};

}
