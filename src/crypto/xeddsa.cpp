#include "ratchetwire/crypto/xeddsa.hpp"
#include "ratchetwire/core/constants.hpp"

#include <openssl/bn.h>
#include <sodium.h>
#include <algorithm>
#include <cstring>
#include <memory>

namespace ratchetwire::protocol::crypto {

namespace {
    constexpr size_t kScalarBytes = crypto_core_ed25519_SCALARBYTES;
    constexpr size_t kWideScalarBytes = crypto_core_ed25519_NONREDUCEDSCALARBYTES;
    constexpr size_t kPointBytes = crypto_core_ed25519_BYTES;
    constexpr uint8_t kSignBitMask = 0x80;
    constexpr int kFieldPrimeBit = 255;
    constexpr BN_ULONG kFieldPrimeOffset = 19;

    struct BnCtxDeleter {
        void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
    };
    struct BnDeleter {
        void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
    };
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

    void HashToScalar(
        crypto_hash_sha512_state& state,
        std::array<uint8_t, kScalarBytes>& scalar) {
        std::array<uint8_t, kWideScalarBytes> digest{};
        crypto_hash_sha512_final(&state, digest.data());
        crypto_core_ed25519_scalar_reduce(scalar.data(), digest.data());
        sodium_memzero(digest.data(), digest.size());
    }
}

Result<std::vector<uint8_t>, ProtocolFailure> XEdDsa::Sign(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> random) {

    if (private_key.size() != Constants::CURVE_25519_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument(
                "XEdDSA private key must be " +
                std::to_string(Constants::CURVE_25519_KEY_SIZE) + " bytes"));
    }
    if (random.size() != Constants::XEDDSA_RANDOM_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument(
                "XEdDSA nonce randomness must be " +
                std::to_string(Constants::XEDDSA_RANDOM_SIZE) + " bytes"));
    }

    std::array<uint8_t, kPointBytes> edwards_public{};
    if (crypto_scalarmult_ed25519_base_noclamp(edwards_public.data(), private_key.data()) !=
        SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidArgument("XEdDSA private key is not a usable scalar"));
    }
    const uint8_t sign_bit = edwards_public[kPointBytes - 1] & kSignBitMask;

    // r = hash1(a || M || Z), hash1 prefixed with 2^256 - 2 in little-endian.
    std::array<uint8_t, kScalarBytes> hash_prefix{};
    hash_prefix.fill(0xFF);
    hash_prefix[0] = 0xFE;

    std::array<uint8_t, kScalarBytes> nonce{};
    crypto_hash_sha512_state state;
    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, hash_prefix.data(), hash_prefix.size());
    crypto_hash_sha512_update(&state, private_key.data(), private_key.size());
    crypto_hash_sha512_update(&state, message.data(), message.size());
    crypto_hash_sha512_update(&state, random.data(), random.size());
    HashToScalar(state, nonce);

    std::vector<uint8_t> signature(Constants::XEDDSA_SIGNATURE_SIZE);
    if (crypto_scalarmult_ed25519_base_noclamp(signature.data(), nonce.data()) !=
        SodiumConstants::SUCCESS) {
        sodium_memzero(nonce.data(), nonce.size());
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidState("XEdDSA nonce reduced to zero"));
    }

    std::array<uint8_t, kScalarBytes> challenge{};
    crypto_hash_sha512_init(&state);
    crypto_hash_sha512_update(&state, signature.data(), kPointBytes);
    crypto_hash_sha512_update(&state, edwards_public.data(), edwards_public.size());
    crypto_hash_sha512_update(&state, message.data(), message.size());
    HashToScalar(state, challenge);

    std::array<uint8_t, kWideScalarBytes> wide_key{};
    std::copy(private_key.begin(), private_key.end(), wide_key.begin());
    std::array<uint8_t, kScalarBytes> key_scalar{};
    crypto_core_ed25519_scalar_reduce(key_scalar.data(), wide_key.data());

    std::array<uint8_t, kScalarBytes> product{};
    crypto_core_ed25519_scalar_mul(product.data(), challenge.data(), key_scalar.data());
    crypto_core_ed25519_scalar_add(signature.data() + kPointBytes, nonce.data(), product.data());

    signature[Constants::XEDDSA_SIGNATURE_SIZE - 1] &= static_cast<uint8_t>(~kSignBitMask);
    signature[Constants::XEDDSA_SIGNATURE_SIZE - 1] |= sign_bit;

    sodium_memzero(nonce.data(), nonce.size());
    sodium_memzero(wide_key.data(), wide_key.size());
    sodium_memzero(key_scalar.data(), key_scalar.size());
    sodium_memzero(product.data(), product.size());

    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool XEdDsa::Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {

    if (public_key.size() != Constants::CURVE_25519_KEY_SIZE ||
        signature.size() != Constants::XEDDSA_SIGNATURE_SIZE) {
        return false;
    }

    std::array<uint8_t, Constants::XEDDSA_SIGNATURE_SIZE> ed_signature{};
    std::copy(signature.begin(), signature.end(), ed_signature.begin());
    const uint8_t sign_bit = ed_signature.back() & kSignBitMask;
    ed_signature.back() &= static_cast<uint8_t>(~kSignBitMask);

    const auto edwards_public = MontgomeryToEdwards(public_key, sign_bit);
    if (!edwards_public.has_value()) {
        return false;
    }

    return crypto_sign_verify_detached(
        ed_signature.data(),
        message.data(),
        message.size(),
        edwards_public->data()) == SodiumConstants::SUCCESS;
}

std::optional<std::array<uint8_t, 32>> XEdDsa::MontgomeryToEdwards(
    std::span<const uint8_t> public_key,
    const uint8_t sign_bit) {

    if (public_key.size() != Constants::CURVE_25519_KEY_SIZE) {
        return std::nullopt;
    }

    std::array<uint8_t, 32> u_bytes{};
    std::copy(public_key.begin(), public_key.end(), u_bytes.begin());
    u_bytes.back() &= static_cast<uint8_t>(~kSignBitMask);

    BnCtxPtr ctx(BN_CTX_new());
    BnPtr prime(BN_new());
    BnPtr u(BN_new());
    BnPtr numerator(BN_new());
    BnPtr denominator(BN_new());
    BnPtr y(BN_new());
    if (!ctx || !prime || !u || !numerator || !denominator || !y) {
        return std::nullopt;
    }

    if (BN_set_bit(prime.get(), kFieldPrimeBit) != 1 ||
        BN_sub_word(prime.get(), kFieldPrimeOffset) != 1) {
        return std::nullopt;
    }
    if (BN_lebin2bn(u_bytes.data(), static_cast<int>(u_bytes.size()), u.get()) == nullptr) {
        return std::nullopt;
    }
    if (BN_mod_sub(numerator.get(), u.get(), BN_value_one(), prime.get(), ctx.get()) != 1 ||
        BN_mod_add(denominator.get(), u.get(), BN_value_one(), prime.get(), ctx.get()) != 1) {
        return std::nullopt;
    }
    if (BN_is_zero(denominator.get())) {
        return std::nullopt;
    }

    BnPtr inverse(BN_mod_inverse(nullptr, denominator.get(), prime.get(), ctx.get()));
    if (!inverse) {
        return std::nullopt;
    }
    if (BN_mod_mul(y.get(), numerator.get(), inverse.get(), prime.get(), ctx.get()) != 1) {
        return std::nullopt;
    }

    std::array<uint8_t, 32> edwards{};
    if (BN_bn2lebinpad(y.get(), edwards.data(), static_cast<int>(edwards.size())) !=
        static_cast<int>(edwards.size())) {
        return std::nullopt;
    }
    edwards.back() |= static_cast<uint8_t>(sign_bit & kSignBitMask);
    return edwards;
}

}
