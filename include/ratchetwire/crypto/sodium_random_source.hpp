#pragma once
#include "ratchetwire/interfaces/i_random_source.hpp"
namespace ratchetwire::protocol::crypto {
class SodiumRandomSource final : public interfaces::IRandomSource {
public:
    void FillBytes(std::span<uint8_t> output) override;
};
}
