#include <catch2/catch_test_macros.hpp>
#include "ratchetwire/protocol/messages/pre_key_ratchet_message.hpp"
#include "helpers/message_fixtures.hpp"
#include "wire/wire_messages.pb.h"
#include <string>
using namespace ratchetwire::protocol;
using namespace ratchetwire::protocol::messages;
using namespace ratchetwire::protocol::test_helpers;

namespace {
std::string AsField(std::span<const uint8_t> bytes) {
    return {bytes.begin(), bytes.end()};
}

std::vector<uint8_t> Frame(const ratchetwire::proto::wire::PreKeyRatchetMessage& body) {
    std::vector<uint8_t> framed = {PackVersionByte(MessageVersion::Version3)};
    const auto encoded = body.SerializeAsString();
    framed.insert(framed.end(), encoded.begin(), encoded.end());
    return framed;
}

ratchetwire::proto::wire::PreKeyRatchetMessage CompleteBody(const PairwiseFixture& fixture) {
    ratchetwire::proto::wire::PreKeyRatchetMessage body;
    body.set_registration_id(77);
    body.set_signed_pre_key_id(3);
    body.set_base_key(AsField(fixture.ratchet_key.GetPublicKey().Serialize()));
    body.set_identity_key(AsField(fixture.sender.GetIdentityKey().Serialize()));
    body.set_message(AsField(fixture.MakeMessage().GetSerialized()));
    return body;
}
}

TEST_CASE("PreKeyRatchetMessage - Round trip", "[messages][prekey]") {
    auto fixture = PairwiseFixture::Create();

    SECTION("All fields survive") {
        const auto message = fixture.MakePreKeyMessage(Some(uint32_t{17}));
        REQUIRE(message.GetSerialized()[0] == 0x33);

        auto parsed = PreKeyRatchetMessage::Deserialize(message.GetSerialized());
        REQUIRE(parsed.IsOk());
        const auto& decoded = parsed.Unwrap();
        REQUIRE(decoded.GetMessageVersion() == MessageVersion::Version3);
        REQUIRE(decoded.GetRegistrationId() == 1234);
        REQUIRE(decoded.GetPreKeyId() == Some(uint32_t{17}));
        REQUIRE(decoded.GetSignedPreKeyId() == 99);
        REQUIRE(decoded.GetBaseKey() == fixture.ratchet_key.GetPublicKey());
        REQUIRE(decoded.GetIdentityKey() == fixture.sender.GetIdentityKey());
        REQUIRE(decoded.GetMessage() == message.GetMessage());
        REQUIRE(ToVector(decoded.GetSerialized()) == ToVector(message.GetSerialized()));
    }
    SECTION("No one-time pre-key") {
        const auto message = fixture.MakePreKeyMessage(None<uint32_t>());
        auto parsed = PreKeyRatchetMessage::Deserialize(message.GetSerialized());
        REQUIRE(parsed.IsOk());
        REQUIRE_FALSE(parsed.Unwrap().GetPreKeyId().has_value());
    }
    SECTION("Inner message MAC still verifies after parsing") {
        const auto message = fixture.MakePreKeyMessage();
        auto parsed = PreKeyRatchetMessage::Deserialize(message.GetSerialized()).Unwrap();
        auto verified = parsed.GetMessage().VerifyMac(
            fixture.sender.GetIdentityKey(), fixture.receiver.GetIdentityKey(), fixture.mac_key);
        REQUIRE(verified.IsOk());
        REQUIRE(verified.Unwrap());
    }
    SECTION("Legacy version is never produced") {
        auto result = PreKeyRatchetMessage::Create(
            MessageVersion::Version2, 1, None<uint32_t>(), 2,
            fixture.ratchet_key.GetPublicKey(), fixture.sender.GetIdentityKey(), fixture.MakeMessage());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidArgument);
    }
}

TEST_CASE("PreKeyRatchetMessage - Deserialize rejections", "[messages][prekey]") {
    auto fixture = PairwiseFixture::Create();
    const auto valid = ToVector(fixture.MakePreKeyMessage().GetSerialized());

    SECTION("Empty input is too short") {
        auto result = PreKeyRatchetMessage::Deserialize({});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
        REQUIRE(result.UnwrapErr().value == 0u);
    }
    SECTION("Version nibbles") {
        auto legacy = valid;
        legacy[0] = 0x23;
        auto result = PreKeyRatchetMessage::Deserialize(legacy);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::LegacyCiphertextVersion);
        REQUIRE(result.UnwrapErr().message_kind == WireMessageKind::PreKey);

        auto future = valid;
        future[0] = 0x43;
        result = PreKeyRatchetMessage::Deserialize(future);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnrecognizedCiphertextVersion);
    }
    SECTION("Absent registration id decodes as zero") {
        auto body = CompleteBody(fixture);
        body.clear_registration_id();
        auto result = PreKeyRatchetMessage::Deserialize(Frame(body));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().GetRegistrationId() == 0);
        REQUIRE_FALSE(result.Unwrap().GetPreKeyId().has_value());
    }
    SECTION("Each mandatory field") {
        using Body = ratchetwire::proto::wire::PreKeyRatchetMessage;
        const std::vector<void (*)(Body&)> removals = {
            [](Body& b) { b.clear_signed_pre_key_id(); },
            [](Body& b) { b.clear_base_key(); },
            [](Body& b) { b.clear_identity_key(); },
            [](Body& b) { b.clear_message(); },
        };
        for (const auto remove : removals) {
            auto body = CompleteBody(fixture);
            remove(body);
            auto result = PreKeyRatchetMessage::Deserialize(Frame(body));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidProtobufEncoding);
        }
    }
    SECTION("Inner message errors propagate") {
        auto body = CompleteBody(fixture);
        body.set_message(std::string(4, '\x33'));
        auto result = PreKeyRatchetMessage::Deserialize(Frame(body));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
    }
    SECTION("Bad identity key propagates") {
        auto body = CompleteBody(fixture);
        body.set_identity_key(std::string());
        auto result = PreKeyRatchetMessage::Deserialize(Frame(body));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::NoKeyTypeIdentifier);
    }
}
