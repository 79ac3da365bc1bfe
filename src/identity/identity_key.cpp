#include "ratchetwire/identity/identity_key.hpp"
#include "ratchetwire/crypto/sodium_interop.hpp"
#include "storage/identity_storage.pb.h"

#include <exception>
#include <string>

namespace ratchetwire::protocol::identity {

Result<IdentityKey, ProtocolFailure> IdentityKey::Decode(std::span<const uint8_t> bytes) {
    auto key_result = PublicKey::Deserialize(bytes);
    if (key_result.IsErr()) {
        return Result<IdentityKey, ProtocolFailure>::Err(key_result.UnwrapErr());
    }
    return Result<IdentityKey, ProtocolFailure>::Ok(IdentityKey(std::move(key_result).Unwrap()));
}

bool IdentityKey::VerifySignature(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) const {
    return public_key_.VerifySignature(message, signature);
}

Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::Generate(IRandomSource& random_source) {
    auto key_pair_result = KeyPair::Generate(random_source);
    if (key_pair_result.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(key_pair_result.UnwrapErr());
    }
    return FromKeyPair(std::move(key_pair_result).Unwrap());
}

Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::FromKeyPair(KeyPair key_pair) {
    auto private_bytes = key_pair.GetPrivateKey().Serialize();
    if (private_bytes.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(private_bytes.UnwrapErr());
    }
    auto scalar = std::move(private_bytes).Unwrap();
    auto private_result = PrivateKey::Deserialize(scalar);
    auto wipe_result = crypto::SodiumInterop::SecureWipe(scalar);
    (void) wipe_result;
    if (private_result.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(private_result.UnwrapErr());
    }
    return Result<IdentityKeyPair, ProtocolFailure>::Ok(IdentityKeyPair(
        IdentityKey(key_pair.GetPublicKey()),
        std::move(private_result).Unwrap()));
}

Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::Deserialize(std::span<const uint8_t> bytes) {
    proto::storage::IdentityKeyPairStructure structure;
    if (!structure.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::ProtobufDecodingError("IdentityKeyPairStructure"));
    }
    if (!structure.has_public_key() || !structure.has_private_key()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(ProtocolFailure::InvalidProtobufEncoding());
    }

    const auto& public_bytes = structure.public_key();
    auto identity_result = IdentityKey::Decode(std::span(
        reinterpret_cast<const uint8_t*>(public_bytes.data()), public_bytes.size()));
    if (identity_result.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(identity_result.UnwrapErr());
    }

    auto* private_bytes = structure.mutable_private_key();
    auto private_result = PrivateKey::Deserialize(std::span(
        reinterpret_cast<const uint8_t*>(private_bytes->data()), private_bytes->size()));
    auto wipe_result = crypto::SodiumInterop::SecureWipe(std::span(
        reinterpret_cast<uint8_t*>(private_bytes->data()), private_bytes->size()));
    (void) wipe_result;
    if (private_result.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(private_result.UnwrapErr());
    }

    return Result<IdentityKeyPair, ProtocolFailure>::Ok(IdentityKeyPair(
        std::move(identity_result).Unwrap(),
        std::move(private_result).Unwrap()));
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::Serialize() const {
    auto private_result = private_key_.Serialize();
    if (private_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(private_result.UnwrapErr());
    }
    auto private_bytes = std::move(private_result).Unwrap();
    const auto public_bytes = identity_key_.Serialize();

    proto::storage::IdentityKeyPairStructure structure;
    structure.set_public_key(public_bytes.data(), public_bytes.size());
    structure.set_private_key(private_bytes.data(), private_bytes.size());
    auto wipe_result = crypto::SodiumInterop::SecureWipe(private_bytes);
    (void) wipe_result;

    std::vector<uint8_t> serialized(structure.ByteSizeLong());
    const bool encoded = structure.SerializeToArray(serialized.data(), static_cast<int>(serialized.size()));
    auto* stored_private = structure.mutable_private_key();
    auto clear_result = crypto::SodiumInterop::SecureWipe(std::span(
        reinterpret_cast<uint8_t*>(stored_private->data()), stored_private->size()));
    (void) clear_result;
    if (!encoded) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::ProtobufEncodingError("IdentityKeyPairStructure"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(serialized));
}

}
