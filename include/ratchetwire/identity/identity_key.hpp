#pragma once
#include "ratchetwire/core/result.hpp"
#include "ratchetwire/core/failures.hpp"
#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/interfaces/i_random_source.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace ratchetwire::protocol::identity {
using protocol::Result;
using protocol::ProtocolFailure;
using keys::PublicKey;
using keys::PrivateKey;
using keys::KeyPair;
using interfaces::IRandomSource;

/**
 * @brief Long-term public identity of a party
 *
 * Serializes exactly like the underlying public key; MAC inputs are built
 * from this form.
 */
class IdentityKey {
public:
    explicit IdentityKey(PublicKey public_key) : public_key_(std::move(public_key)) {}
    [[nodiscard]] static Result<IdentityKey, ProtocolFailure> Decode(std::span<const uint8_t> bytes);
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] std::vector<uint8_t> Serialize() const { return public_key_.Serialize(); }
    [[nodiscard]] bool VerifySignature(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const;
    bool operator==(const IdentityKey& other) const noexcept { return public_key_ == other.public_key_; }
    bool operator!=(const IdentityKey& other) const noexcept { return !(*this == other); }
private:
    PublicKey public_key_;
};

class IdentityKeyPair {
public:
    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> Generate(IRandomSource& random_source);
    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> FromKeyPair(KeyPair key_pair);
    /// Decodes the storage form written by Serialize.
    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> Deserialize(std::span<const uint8_t> bytes);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] const IdentityKey& GetIdentityKey() const noexcept { return identity_key_; }
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept { return identity_key_.GetPublicKey(); }
    [[nodiscard]] const PrivateKey& GetPrivateKey() const noexcept { return private_key_; }
private:
    IdentityKeyPair(IdentityKey identity_key, PrivateKey private_key)
        : identity_key_(std::move(identity_key)), private_key_(std::move(private_key)) {}
    IdentityKey identity_key_;
    PrivateKey private_key_;
};
}
