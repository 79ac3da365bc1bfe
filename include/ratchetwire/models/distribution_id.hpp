#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/core/option.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace ratchetwire::protocol::models {
using protocol::Result;
using protocol::ProtocolFailure;
using protocol::Option;
using interfaces::IRandomSource;

/**
 * @brief 128-bit identifier of a sender-key distribution
 *
 * Carried on the wire as its 16 raw bytes, printed in the canonical
 * 8-4-4-4-12 hex form.
 */
class DistributionId {
public:
    using Bytes = std::array<uint8_t, Constants::DISTRIBUTION_ID_SIZE>;
    explicit DistributionId(const Bytes& bytes) noexcept : bytes_(bytes) {}
    [[nodiscard]] static Option<DistributionId> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<DistributionId, ProtocolFailure> Parse(std::string_view text);
    /// Random version 4 identifier.
    [[nodiscard]] static Result<DistributionId, ProtocolFailure> Random(IRandomSource& random_source);
    [[nodiscard]] const Bytes& AsBytes() const noexcept { return bytes_; }
    [[nodiscard]] std::string ToString() const;
    bool operator==(const DistributionId& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const DistributionId& other) const noexcept { return !(*this == other); }
private:
    Bytes bytes_;
};
}
