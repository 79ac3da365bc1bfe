#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace ratchetwire::protocol {

inline constexpr uint8_t kCiphertextMessageCurrentVersion = 3;
inline constexpr uint8_t kCiphertextMessageLegacyVersion = 2;

struct Constants {
    static constexpr size_t VERSION_BYTE_SIZE = 1;
    static constexpr uint8_t VERSION_NIBBLE_MASK = 0x0F;
    static constexpr uint8_t VERSION_NIBBLE_SHIFT = 4;

    static constexpr size_t CURVE_25519_KEY_SIZE = 32;
    static constexpr size_t SERIALIZED_PUBLIC_KEY_SIZE = 33;
    static constexpr size_t XEDDSA_SIGNATURE_SIZE = 64;
    static constexpr size_t XEDDSA_RANDOM_SIZE = 64;

    static constexpr size_t MAC_KEY_SIZE = 32;
    static constexpr size_t MAC_SIZE = 8;
    static constexpr size_t CHAIN_KEY_SIZE = 32;
    static constexpr size_t DISTRIBUTION_ID_SIZE = 16;
};

struct WireConstants {
    static constexpr size_t RATCHET_MESSAGE_MIN_SIZE =
        Constants::VERSION_BYTE_SIZE + Constants::MAC_SIZE;
    static constexpr size_t PRE_KEY_MESSAGE_MIN_SIZE = Constants::VERSION_BYTE_SIZE;
    static constexpr size_t SENDER_KEY_MESSAGE_MIN_SIZE =
        Constants::VERSION_BYTE_SIZE + Constants::XEDDSA_SIGNATURE_SIZE;
    // A distribution message carries at least a curve key and a chain key.
    static constexpr size_t DISTRIBUTION_MESSAGE_MIN_SIZE =
        Constants::VERSION_BYTE_SIZE + Constants::CURVE_25519_KEY_SIZE + Constants::CHAIN_KEY_SIZE;
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
};
}
