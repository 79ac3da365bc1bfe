#include <catch2/catch_test_macros.hpp>
#include "ratchetwire/protocol/messages/sender_key_message.hpp"
#include "helpers/message_fixtures.hpp"
#include "wire/wire_messages.pb.h"
#include <string>
using namespace ratchetwire::protocol;
using namespace ratchetwire::protocol::messages;
using namespace ratchetwire::protocol::test_helpers;

namespace {
std::vector<uint8_t> Frame(const ratchetwire::proto::wire::SenderKeyMessage& body) {
    std::vector<uint8_t> framed = {PackVersionByte(MessageVersion::Version3)};
    const auto encoded = body.SerializeAsString();
    framed.insert(framed.end(), encoded.begin(), encoded.end());
    framed.insert(framed.end(), Constants::XEDDSA_SIGNATURE_SIZE, 0x00);
    return framed;
}

ratchetwire::proto::wire::SenderKeyMessage CompleteBody(const GroupFixture& fixture) {
    ratchetwire::proto::wire::SenderKeyMessage body;
    const auto& id = fixture.distribution_id.AsBytes();
    body.set_distribution_uuid(std::string(id.begin(), id.end()));
    body.set_chain_id(1);
    body.set_iteration(2);
    body.set_ciphertext("group ciphertext");
    return body;
}
}

TEST_CASE("SenderKeyMessage - Round trip", "[messages][senderkey]") {
    auto fixture = GroupFixture::Create();

    SECTION("Fields and bytes survive") {
        const auto ciphertext = Sequence(48);
        const auto message = fixture.MakeMessage(42, 7, ciphertext);
        REQUIRE(message.GetSerialized()[0] == 0x33);

        auto parsed = SenderKeyMessage::Deserialize(message.GetSerialized());
        REQUIRE(parsed.IsOk());
        const auto& decoded = parsed.Unwrap();
        REQUIRE(decoded.GetMessageVersion() == MessageVersion::Version3);
        REQUIRE(decoded.GetDistributionId() == fixture.distribution_id);
        REQUIRE(decoded.GetChainId() == 42);
        REQUIRE(decoded.GetIteration() == 7);
        REQUIRE(ToVector(decoded.GetCiphertext()) == ciphertext);
        REQUIRE(decoded == message);
    }
    SECTION("Signature verifies before and after parsing") {
        const auto message = fixture.MakeMessage();
        REQUIRE(message.VerifySignature(fixture.signing_key.GetPublicKey()).IsOk());
        auto parsed = SenderKeyMessage::Deserialize(message.GetSerialized()).Unwrap();
        REQUIRE(parsed.VerifySignature(fixture.signing_key.GetPublicKey()).IsOk());
    }
    SECTION("Other signing key fails") {
        const auto message = fixture.MakeMessage();
        auto other = KeyPair::Generate(fixture.rng).Unwrap();
        auto verified = message.VerifySignature(other.GetPublicKey());
        REQUIRE(verified.IsErr());
        REQUIRE(verified.UnwrapErr().type == ProtocolFailureType::SignatureValidationFailed);
    }
    SECTION("Each message draws fresh signing randomness") {
        const auto calls_before = fixture.rng.Calls();
        const auto first = fixture.MakeMessage();
        const auto second = fixture.MakeMessage();
        REQUIRE(fixture.rng.Calls() == calls_before + 2);
        REQUIRE(first != second);
    }
    SECTION("Throwing random source") {
        FailingRandomSource failing;
        auto result = SenderKeyMessage::Create(
            MessageVersion::Version3, fixture.distribution_id, 1, 1, Sequence(4),
            failing, fixture.signing_key.GetPrivateKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::ApplicationCallbackError);
        REQUIRE(result.UnwrapErr().cause);
    }
    SECTION("Legacy version is never produced") {
        auto result = SenderKeyMessage::Create(
            MessageVersion::Version2, fixture.distribution_id, 1, 1, Sequence(4),
            fixture.rng, fixture.signing_key.GetPrivateKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidArgument);
    }
}

TEST_CASE("SenderKeyMessage - Deserialize rejections", "[messages][senderkey]") {
    auto fixture = GroupFixture::Create();
    const auto valid = ToVector(fixture.MakeMessage().GetSerialized());

    SECTION("64 bytes is too short") {
        const std::vector<uint8_t> bytes(64, 0x33);
        auto result = SenderKeyMessage::Deserialize(bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
        REQUIRE(result.UnwrapErr().value == 64u);
    }
    SECTION("Version nibbles") {
        auto legacy = valid;
        legacy[0] = 0x23;
        auto result = SenderKeyMessage::Deserialize(legacy);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::LegacyCiphertextVersion);
        REQUIRE(result.UnwrapErr().message_kind == WireMessageKind::SenderKey);

        auto future = valid;
        future[0] = 0x43;
        result = SenderKeyMessage::Deserialize(future);
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnrecognizedCiphertextVersion);
    }
    SECTION("Each mandatory field") {
        using Body = ratchetwire::proto::wire::SenderKeyMessage;
        const std::vector<void (*)(Body&)> removals = {
            [](Body& b) { b.clear_distribution_uuid(); },
            [](Body& b) { b.clear_chain_id(); },
            [](Body& b) { b.clear_iteration(); },
            [](Body& b) { b.clear_ciphertext(); },
        };
        for (const auto remove : removals) {
            auto body = CompleteBody(fixture);
            remove(body);
            auto result = SenderKeyMessage::Deserialize(Frame(body));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidProtobufEncoding);
        }
    }
    SECTION("Distribution id of the wrong length") {
        auto body = CompleteBody(fixture);
        body.set_distribution_uuid(std::string(15, 'x'));
        auto result = SenderKeyMessage::Deserialize(Frame(body));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidProtobufEncoding);
    }
    SECTION("Complete body with a zero signature parses but does not verify") {
        auto result = SenderKeyMessage::Deserialize(Frame(CompleteBody(fixture)));
        REQUIRE(result.IsOk());
        auto verified = result.Unwrap().VerifySignature(fixture.signing_key.GetPublicKey());
        REQUIRE(verified.IsErr());
        REQUIRE(verified.UnwrapErr().type == ProtocolFailureType::SignatureValidationFailed);
    }
}
