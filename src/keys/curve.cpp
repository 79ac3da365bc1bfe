#include "ratchetwire/keys/curve.hpp"
#include "ratchetwire/crypto/sodium_interop.hpp"
#include "ratchetwire/crypto/random_bytes.hpp"
#include "ratchetwire/crypto/xeddsa.hpp"

#include <sodium.h>
#include <algorithm>

namespace ratchetwire::protocol::keys {

namespace {
    constexpr std::string_view kDjbKeyTypeName = "Djb";

    void ClampScalar(std::span<uint8_t> scalar) {
        scalar[0] &= 248;
        scalar[31] &= 127;
        scalar[31] |= 64;
    }
}

Result<PublicKey, ProtocolFailure> PublicKey::Deserialize(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return Result<PublicKey, ProtocolFailure>::Err(ProtocolFailure::NoKeyTypeIdentifier());
    }
    if (bytes[0] != static_cast<uint8_t>(KeyType::Djb)) {
        return Result<PublicKey, ProtocolFailure>::Err(ProtocolFailure::BadKeyType(bytes[0]));
    }
    if (bytes.size() != Constants::SERIALIZED_PUBLIC_KEY_SIZE) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::BadKeyLength(kDjbKeyTypeName, bytes.size()));
    }
    return FromDjbPublicKey(bytes.subspan(1));
}

Result<PublicKey, ProtocolFailure> PublicKey::FromDjbPublicKey(std::span<const uint8_t> u_coordinate) {
    if (u_coordinate.size() != Constants::CURVE_25519_KEY_SIZE) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::BadKeyLength(kDjbKeyTypeName, u_coordinate.size()));
    }
    std::array<uint8_t, Constants::CURVE_25519_KEY_SIZE> key{};
    std::copy(u_coordinate.begin(), u_coordinate.end(), key.begin());
    return Result<PublicKey, ProtocolFailure>::Ok(PublicKey(key));
}

std::vector<uint8_t> PublicKey::Serialize() const {
    std::vector<uint8_t> serialized;
    serialized.reserve(Constants::SERIALIZED_PUBLIC_KEY_SIZE);
    serialized.push_back(static_cast<uint8_t>(KeyType::Djb));
    serialized.insert(serialized.end(), key_.begin(), key_.end());
    return serialized;
}

bool PublicKey::VerifySignature(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) const {
    return crypto::XEdDsa::Verify(key_, message, signature);
}

Result<PrivateKey, ProtocolFailure> PrivateKey::Deserialize(std::span<const uint8_t> bytes) {
    if (bytes.size() != Constants::CURVE_25519_KEY_SIZE) {
        return Result<PrivateKey, ProtocolFailure>::Err(
            ProtocolFailure::BadKeyLength(kDjbKeyTypeName, bytes.size()));
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::CURVE_25519_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<PrivateKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();

    std::array<uint8_t, Constants::CURVE_25519_KEY_SIZE> scalar{};
    std::copy(bytes.begin(), bytes.end(), scalar.begin());
    ClampScalar(scalar);
    auto write_result = handle.Write(scalar);
    sodium_memzero(scalar.data(), scalar.size());
    if (write_result.IsErr()) {
        return Result<PrivateKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<PrivateKey, ProtocolFailure>::Ok(PrivateKey(std::move(handle)));
}

Result<std::vector<uint8_t>, ProtocolFailure> PrivateKey::Serialize() const {
    auto read_result = handle_.ReadBytes(Constants::CURVE_25519_KEY_SIZE);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
}

Result<PublicKey, ProtocolFailure> PrivateKey::GetPublicKey() const {
    std::array<uint8_t, Constants::CURVE_25519_KEY_SIZE> public_bytes{};
    auto derive_result = handle_.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return crypto_scalarmult_base(public_bytes.data(), scalar.data());
    });
    if (derive_result.IsErr()) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<PublicKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("Failed to derive X25519 public key"));
    }
    return PublicKey::FromDjbPublicKey(public_bytes);
}

Result<std::vector<uint8_t>, ProtocolFailure> PrivateKey::CalculateSignature(
    std::span<const uint8_t> message,
    IRandomSource& random_source) const {
    auto random_result = crypto::DrawRandomBytes(random_source, Constants::XEDDSA_RANDOM_SIZE);
    if (random_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(random_result.UnwrapErr());
    }
    auto random = std::move(random_result).Unwrap();

    auto sign_result = handle_.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return crypto::XEdDsa::Sign(scalar, message, random);
    });
    sodium_memzero(random.data(), random.size());
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    return std::move(sign_result).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> PrivateKey::CalculateAgreement(
    const PublicKey& their_key) const {
    std::vector<uint8_t> shared_secret(crypto_scalarmult_BYTES);
    const auto their_bytes = their_key.GetPublicKeyBytes();
    auto agreement_result = handle_.WithReadAccess([&](std::span<const uint8_t> scalar) {
        return crypto_scalarmult(shared_secret.data(), scalar.data(), their_bytes.data());
    });
    if (agreement_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(agreement_result.UnwrapErr()));
    }
    if (agreement_result.Unwrap() != SodiumConstants::SUCCESS) {
        sodium_memzero(shared_secret.data(), shared_secret.size());
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument("X25519 agreement produced a low-order shared secret"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared_secret));
}

Result<KeyPair, ProtocolFailure> KeyPair::Generate(IRandomSource& random_source) {
    auto seed_result = crypto::DrawRandomBytes(random_source, Constants::CURVE_25519_KEY_SIZE);
    if (seed_result.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(seed_result.UnwrapErr());
    }
    auto seed = std::move(seed_result).Unwrap();
    auto private_result = PrivateKey::Deserialize(seed);
    sodium_memzero(seed.data(), seed.size());
    if (private_result.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(private_result.UnwrapErr());
    }
    return FromPrivateKey(std::move(private_result).Unwrap());
}

Result<KeyPair, ProtocolFailure> KeyPair::FromPrivateKey(PrivateKey private_key) {
    auto public_result = private_key.GetPublicKey();
    if (public_result.IsErr()) {
        return Result<KeyPair, ProtocolFailure>::Err(public_result.UnwrapErr());
    }
    return Result<KeyPair, ProtocolFailure>::Ok(
        KeyPair(std::move(public_result).Unwrap(), std::move(private_key)));
}

Result<std::vector<uint8_t>, ProtocolFailure> KeyPair::CalculateSignature(
    std::span<const uint8_t> message,
    IRandomSource& random_source) const {
    return private_key_.CalculateSignature(message, random_source);
}

Result<std::vector<uint8_t>, ProtocolFailure> KeyPair::CalculateAgreement(
    const PublicKey& their_key) const {
    return private_key_.CalculateAgreement(their_key);
}

}
