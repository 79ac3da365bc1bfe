#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>
namespace ratchetwire::protocol::crypto {
/// Draws `count` bytes from a caller-supplied source. An exception thrown by
/// the source comes back as ApplicationCallbackError carrying it.
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DrawRandomBytes(
    interfaces::IRandomSource& source,
    size_t count);
}
