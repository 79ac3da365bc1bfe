#include "ratchetwire/models/distribution_id.hpp"
#include "ratchetwire/crypto/random_bytes.hpp"

#include <uuid/uuid.h>
#include <algorithm>
#include <iterator>

namespace ratchetwire::protocol::models {

namespace {
    constexpr size_t kTextLength = 36;
    constexpr uint8_t kVersionByteIndex = 6;
    constexpr uint8_t kVariantByteIndex = 8;
}

Option<DistributionId> DistributionId::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::DISTRIBUTION_ID_SIZE) {
        return std::nullopt;
    }
    Bytes id{};
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return DistributionId(id);
}

Result<DistributionId, ProtocolFailure> DistributionId::Parse(std::string_view text) {
    if (text.size() != kTextLength) {
        return Result<DistributionId, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument("distribution id must be 36 characters"));
    }

    const std::string terminated(text);
    uuid_t parsed;
    if (uuid_parse(terminated.c_str(), parsed) != 0) {
        return Result<DistributionId, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument("distribution id is not a canonical UUID"));
    }
    Bytes id{};
    std::copy(std::begin(parsed), std::end(parsed), id.begin());
    return Result<DistributionId, ProtocolFailure>::Ok(DistributionId(id));
}

Result<DistributionId, ProtocolFailure> DistributionId::Random(IRandomSource& random_source) {
    auto random_result = crypto::DrawRandomBytes(random_source, Constants::DISTRIBUTION_ID_SIZE);
    if (random_result.IsErr()) {
        return Result<DistributionId, ProtocolFailure>::Err(random_result.UnwrapErr());
    }
    const auto random = std::move(random_result).Unwrap();
    Bytes id{};
    std::copy(random.begin(), random.end(), id.begin());
    id[kVersionByteIndex] = static_cast<uint8_t>((id[kVersionByteIndex] & 0x0F) | 0x40);
    id[kVariantByteIndex] = static_cast<uint8_t>((id[kVariantByteIndex] & 0x3F) | 0x80);
    return Result<DistributionId, ProtocolFailure>::Ok(DistributionId(id));
}

std::string DistributionId::ToString() const {
    uuid_t raw;
    std::copy(bytes_.begin(), bytes_.end(), std::begin(raw));
    char text[kTextLength + 1];
    uuid_unparse_lower(raw, text);
    return std::string(text, kTextLength);
}

}
