#pragma once
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <cstdint>
#include <random>
#include <span>
#include <stdexcept>

namespace ratchetwire::protocol::test_helpers {

using interfaces::IRandomSource;

/// Seeded, reproducible byte stream. Not cryptographically secure.
class DeterministicRandomSource final : public IRandomSource {
public:
    explicit DeterministicRandomSource(const uint32_t seed = 42) : engine_(seed) {}

    void FillBytes(std::span<uint8_t> output) override {
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : output) {
            byte = static_cast<uint8_t>(dist(engine_));
        }
        ++calls_;
    }

    [[nodiscard]] size_t Calls() const noexcept { return calls_; }

private:
    std::mt19937 engine_;
    size_t calls_ = 0;
};

class FailingRandomSource final : public IRandomSource {
public:
    void FillBytes(std::span<uint8_t>) override {
        throw std::runtime_error("entropy pool unavailable");
    }
};

}
