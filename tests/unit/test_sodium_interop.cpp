#include <catch2/catch_test_macros.hpp>
#include "ratchetwire/crypto/sodium_interop.hpp"
#include "ratchetwire/crypto/sodium_secure_memory_handle.hpp"
#include "ratchetwire/crypto/sodium_random_source.hpp"
#include "ratchetwire/crypto/random_bytes.hpp"
#include "ratchetwire/core/constants.hpp"
#include "helpers/deterministic_random_source.hpp"
#include <algorithm>
#include <vector>
using namespace ratchetwire::protocol;
using namespace ratchetwire::protocol::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize is idempotent") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
}

TEST_CASE("SodiumInterop - Constant time comparison of MAC tags", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> tag = {0x10, 0x20, 0x30, 0x40, 0x50, 0x60, 0x70, 0x80};
    SECTION("Equal tags") {
        auto result = SodiumInterop::ConstantTimeEquals(tag, tag);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap());
    }
    SECTION("Tags differing in the last byte") {
        auto other = tag;
        other.back() ^= 0x01;
        auto result = SodiumInterop::ConstantTimeEquals(tag, other);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }
    SECTION("Truncated tag compares unequal") {
        const std::vector<uint8_t> truncated(tag.begin(), tag.end() - 1);
        auto result = SodiumInterop::ConstantTimeEquals(tag, truncated);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
    }
}

TEST_CASE("SodiumInterop - Secure wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Key-sized buffer is zeroed") {
        std::vector<uint8_t> scalar(Constants::CURVE_25519_KEY_SIZE, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(scalar).IsOk());
        REQUIRE(std::all_of(scalar.begin(), scalar.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Page-sized buffer is zeroed") {
        std::vector<uint8_t> buffer(4096, 0xAA);
        REQUIRE(SodiumInterop::SecureWipe(buffer).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Empty buffer") {
        std::vector<uint8_t> empty;
        REQUIRE(SodiumInterop::SecureWipe(empty).IsOk());
    }
}

TEST_CASE("SecureMemoryHandle - Private scalar storage", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Write then read back") {
        auto handle = SecureMemoryHandle::Allocate(Constants::CURVE_25519_KEY_SIZE).Unwrap();
        const std::vector<uint8_t> scalar(Constants::CURVE_25519_KEY_SIZE, 0x42);
        REQUIRE(handle.Write(scalar).IsOk());
        auto read = handle.ReadBytes(Constants::CURVE_25519_KEY_SIZE);
        REQUIRE(read.IsOk());
        REQUIRE(read.Unwrap() == scalar);
    }
    SECTION("Short write zero-fills the tail") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        const std::vector<uint8_t> data = {1, 2, 3};
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == std::vector<uint8_t>{1, 2, 3, 0, 0, 0, 0, 0});
    }
    SECTION("Oversized write and read are rejected") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        const std::vector<uint8_t> data(32, 0x01);
        REQUIRE(handle.Write(data).IsErr());
        REQUIRE(handle.ReadBytes(17).IsErr());
    }
    SECTION("Zero-sized allocation fails") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("Moved-from handle is invalid") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle moved(std::move(handle));
        REQUIRE(handle.IsInvalid());
        REQUIRE_FALSE(moved.IsInvalid());
        REQUIRE(handle.ReadBytes(1).IsErr());
    }
    SECTION("WithReadAccess exposes the bytes in place") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        const std::vector<uint8_t> data = {9, 8, 7, 6};
        REQUIRE(handle.Write(data).IsOk());
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (const auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 30);
    }
}

TEST_CASE("Random sources", "[crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Sodium source produces distinct draws") {
        SodiumRandomSource source;
        auto first = DrawRandomBytes(source, 32);
        auto second = DrawRandomBytes(source, 32);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap().size() == 32);
        REQUIRE(first.Unwrap() != second.Unwrap());
    }
    SECTION("Deterministic source is reproducible") {
        test_helpers::DeterministicRandomSource a(5);
        test_helpers::DeterministicRandomSource b(5);
        REQUIRE(DrawRandomBytes(a, 16).Unwrap() == DrawRandomBytes(b, 16).Unwrap());
    }
    SECTION("Throwing source becomes ApplicationCallbackError") {
        test_helpers::FailingRandomSource source;
        auto result = DrawRandomBytes(source, 16);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::ApplicationCallbackError);
        REQUIRE(result.UnwrapErr().cause);
    }
}
