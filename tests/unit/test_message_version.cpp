#include <catch2/catch_test_macros.hpp>
#include "ratchetwire/protocol/message_version.hpp"
using namespace ratchetwire::protocol;

TEST_CASE("MessageVersion - Version byte packing", "[version][protocol]") {
    SECTION("Current version packs to 0x33") {
        STATIC_REQUIRE(PackVersionByte(MessageVersion::Version3) == 0x33);
    }
    SECTION("Low nibble is always the current version") {
        STATIC_REQUIRE(PackVersionByte(MessageVersion::Version2) == 0x23);
        STATIC_REQUIRE(PackVersionByte(uint8_t{4}) == 0x43);
        STATIC_REQUIRE(PackVersionByte(uint8_t{0x1F}) == 0xF3);
    }
    SECTION("ToU32") {
        STATIC_REQUIRE(ToU32(MessageVersion::Version2) == 2);
        STATIC_REQUIRE(ToU32(MessageVersion::Version3) == 3);
        STATIC_REQUIRE(kDefaultMessageVersion == MessageVersion::Version3);
    }
}

TEST_CASE("MessageVersion - Version byte classification", "[version][protocol]") {
    SECTION("Current version is accepted whatever the low nibble") {
        for (uint8_t low = 0; low < 16; ++low) {
            auto result = UnpackVersionByte(static_cast<uint8_t>(0x30 | low), WireMessageKind::Ratchet);
            REQUIRE(result.IsOk());
            REQUIRE(result.Unwrap() == 3);
        }
    }
    SECTION("Older nibbles are legacy") {
        for (uint8_t high = 0; high < 3; ++high) {
            auto result = UnpackVersionByte(PackVersionByte(high), WireMessageKind::PreKey);
            REQUIRE(result.IsErr());
            const auto& failure = result.UnwrapErr();
            REQUIRE(failure.type == ProtocolFailureType::LegacyCiphertextVersion);
            REQUIRE(failure.value == high);
            REQUIRE(failure.message_kind == WireMessageKind::PreKey);
        }
    }
    SECTION("Newer nibbles are unrecognized") {
        for (uint8_t high = 4; high < 16; ++high) {
            auto result = UnpackVersionByte(PackVersionByte(high), WireMessageKind::SenderKey);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnrecognizedCiphertextVersion);
            REQUIRE(result.UnwrapErr().value == high);
        }
    }
}

TEST_CASE("MessageVersion - 32-bit version field", "[version][protocol]") {
    SECTION("Known enumerators map back") {
        REQUIRE(MessageVersionFromU32(3, WireMessageKind::Ratchet).Unwrap() == MessageVersion::Version3);
        REQUIRE(MessageVersionFromU32(2, WireMessageKind::Ratchet).Unwrap() == MessageVersion::Version2);
    }
    SECTION("Unknown values are rejected with the value and kind") {
        for (const uint32_t value : {0u, 1u, 4u, 0x33u, 0xFFFFFFFFu}) {
            auto result = MessageVersionFromU32(value, WireMessageKind::SenderKeyDistribution);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnrecognizedMessageVersion);
            REQUIRE(result.UnwrapErr().value == value);
            REQUIRE(result.UnwrapErr().message_kind == WireMessageKind::SenderKeyDistribution);
        }
    }
    SECTION("Only the current version may be produced") {
        REQUIRE(RequireCurrentVersion(MessageVersion::Version3).IsOk());
        auto legacy = RequireCurrentVersion(MessageVersion::Version2);
        REQUIRE(legacy.IsErr());
        REQUIRE(legacy.UnwrapErr().type == ProtocolFailureType::InvalidArgument);
    }
}
