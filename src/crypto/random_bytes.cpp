#include "ratchetwire/crypto/random_bytes.hpp"

#include <exception>

namespace ratchetwire::protocol::crypto {

Result<std::vector<uint8_t>, ProtocolFailure> DrawRandomBytes(
    interfaces::IRandomSource& source,
    const size_t count) {
    std::vector<uint8_t> bytes(count);
    try {
        source.FillBytes(bytes);
    } catch (const std::exception&) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ApplicationCallbackError(
                "IRandomSource::FillBytes", std::current_exception()));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
}

}
