#pragma once
#include <cstdint>
#include <span>
namespace ratchetwire::protocol::interfaces {
/// Cryptographically secure randomness supplied by the caller. Implementations
/// may throw; callers inside the library convert that into
/// ApplicationCallbackError.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    virtual void FillBytes(std::span<uint8_t> output) = 0;
};
}
