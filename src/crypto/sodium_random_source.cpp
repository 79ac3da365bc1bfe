#include "ratchetwire/crypto/sodium_random_source.hpp"

#include <sodium.h>

namespace ratchetwire::protocol::crypto {

void SodiumRandomSource::FillBytes(std::span<uint8_t> output) {
    if (!output.empty()) {
        randombytes_buf(output.data(), output.size());
    }
}

}
