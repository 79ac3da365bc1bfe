#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/core/constants.hpp"
#include "ratchetwire/crypto/sodium_secure_memory_handle.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::keys {
using protocol::Result;
using protocol::ProtocolFailure;
using crypto::SecureMemoryHandle;
using interfaces::IRandomSource;

/// Key type byte prefixed to every serialized public key.
enum class KeyType : uint8_t {
    Djb = 0x05
};

/**
 * @brief Curve25519 public key, serialized as 0x05 || u (33 bytes)
 */
class PublicKey {
public:
    /**
     * @brief Decode a type-prefixed public key
     *
     * Empty input is NoKeyTypeIdentifier, an unknown prefix is BadKeyType
     * and anything but 33 bytes is BadKeyLength.
     */
    [[nodiscard]] static Result<PublicKey, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<PublicKey, ProtocolFailure> FromDjbPublicKey(std::span<const uint8_t> u_coordinate);
    [[nodiscard]] KeyType GetKeyType() const noexcept { return KeyType::Djb; }
    [[nodiscard]] std::vector<uint8_t> Serialize() const;
    [[nodiscard]] std::span<const uint8_t> GetPublicKeyBytes() const noexcept { return key_; }
    [[nodiscard]] bool VerifySignature(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const;
    bool operator==(const PublicKey& other) const noexcept { return key_ == other.key_; }
    bool operator!=(const PublicKey& other) const noexcept { return !(*this == other); }
private:
    explicit PublicKey(const std::array<uint8_t, Constants::CURVE_25519_KEY_SIZE>& key) : key_(key) {}
    std::array<uint8_t, Constants::CURVE_25519_KEY_SIZE> key_;
};

/**
 * @brief Clamped X25519 scalar held in secure memory
 */
class PrivateKey {
public:
    /// Clamps the scalar on the way in. Requires SodiumInterop::Initialize().
    [[nodiscard]] static Result<PrivateKey, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] Result<PublicKey, ProtocolFailure> GetPublicKey() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> CalculateSignature(
        std::span<const uint8_t> message,
        IRandomSource& random_source) const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> CalculateAgreement(
        const PublicKey& their_key) const;
    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;
    ~PrivateKey() = default;
private:
    explicit PrivateKey(SecureMemoryHandle handle) : handle_(std::move(handle)) {}
    SecureMemoryHandle handle_;
};

class KeyPair {
public:
    [[nodiscard]] static Result<KeyPair, ProtocolFailure> Generate(IRandomSource& random_source);
    [[nodiscard]] static Result<KeyPair, ProtocolFailure> FromPrivateKey(PrivateKey private_key);
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const PrivateKey& GetPrivateKey() const noexcept { return private_key_; }
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> CalculateSignature(
        std::span<const uint8_t> message,
        IRandomSource& random_source) const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> CalculateAgreement(
        const PublicKey& their_key) const;
private:
    KeyPair(PublicKey public_key, PrivateKey private_key)
        : public_key_(std::move(public_key)), private_key_(std::move(private_key)) {}
    PublicKey public_key_;
    PrivateKey private_key_;
};
}
