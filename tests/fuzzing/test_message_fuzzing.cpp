#include <catch2/catch_test_macros.hpp>
#include "ratchetwire/protocol/ciphertext_message.hpp"
#include "ratchetwire/identity/identity_key.hpp"
#include "ratchetwire/core/constants.hpp"
#include "helpers/message_fixtures.hpp"
#include <algorithm>
#include <initializer_list>
#include <random>
#include <vector>

using namespace ratchetwire::protocol;
using namespace ratchetwire::protocol::messages;
using namespace ratchetwire::protocol::test_helpers;

namespace {

bool IsDecodeFailure(const ProtocolFailureType type) {
    constexpr std::initializer_list<ProtocolFailureType> kDecodeFailures = {
        ProtocolFailureType::CiphertextMessageTooShort,
        ProtocolFailureType::LegacyCiphertextVersion,
        ProtocolFailureType::UnrecognizedCiphertextVersion,
        ProtocolFailureType::ProtobufDecodingError,
        ProtocolFailureType::InvalidProtobufEncoding,
        ProtocolFailureType::NoKeyTypeIdentifier,
        ProtocolFailureType::BadKeyType,
        ProtocolFailureType::BadKeyLength,
    };
    return std::find(kDecodeFailures.begin(), kDecodeFailures.end(), type) != kDecodeFailures.end();
}

template<typename T>
void RequireCleanOutcome(const Result<T, ProtocolFailure>& result) {
    if (result.IsErr()) {
        REQUIRE(IsDecodeFailure(result.UnwrapErr().type));
    }
}

std::vector<uint8_t> RandomBytes(std::mt19937& gen, const size_t size) {
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::vector<uint8_t> bytes(size);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(byte_dist(gen));
    }
    return bytes;
}

void FeedEveryDecoder(const std::vector<uint8_t>& input) {
    REQUIRE_NOTHROW(RequireCleanOutcome(RatchetMessage::Deserialize(input)));
    REQUIRE_NOTHROW(RequireCleanOutcome(PreKeyRatchetMessage::Deserialize(input)));
    REQUIRE_NOTHROW(RequireCleanOutcome(SenderKeyMessage::Deserialize(input)));
    REQUIRE_NOTHROW(RequireCleanOutcome(SenderKeyDistributionMessage::Deserialize(input)));
    for (const auto type : {CiphertextMessageType::Ratchet,
                            CiphertextMessageType::PreKey,
                            CiphertextMessageType::SenderKey}) {
        REQUIRE_NOTHROW(RequireCleanOutcome(CiphertextMessage::Deserialize(type, input)));
    }
}

}

TEST_CASE("Fuzzing - Random input to every decoder", "[fuzzing][decode][random]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    std::mt19937 gen(42);
    std::uniform_int_distribution<size_t> size_dist(0, 256);

    SECTION("2,000 random buffers") {
        for (int i = 0; i < 2'000; ++i) {
            FeedEveryDecoder(RandomBytes(gen, size_dist(gen)));
        }
    }
    SECTION("Random bodies behind a valid version byte") {
        for (int i = 0; i < 2'000; ++i) {
            auto input = RandomBytes(gen, size_dist(gen) + 1);
            input[0] = PackVersionByte(MessageVersion::Version3);
            FeedEveryDecoder(input);
        }
    }
    SECTION("Random identity key pair records") {
        for (int i = 0; i < 2'000; ++i) {
            auto input = RandomBytes(gen, size_dist(gen));
            REQUIRE_NOTHROW(RequireCleanOutcome(identity::IdentityKeyPair::Deserialize(input)));
        }
    }
}

TEST_CASE("Fuzzing - Truncated messages", "[fuzzing][decode][truncation]") {
    auto pairwise = PairwiseFixture::Create();
    auto group = GroupFixture::Create();

    const auto ratchet = ToVector(pairwise.MakeMessage().GetSerialized());
    const auto pre_key = ToVector(pairwise.MakePreKeyMessage().GetSerialized());
    const auto sender_key = ToVector(group.MakeMessage().GetSerialized());
    const auto distribution = ToVector(group.MakeDistribution().GetSerialized());

    SECTION("Prefixes below the minimum length are too short") {
        for (size_t len = 0; len < WireConstants::RATCHET_MESSAGE_MIN_SIZE; ++len) {
            auto result = RatchetMessage::Deserialize(std::span(ratchet).first(len));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
            REQUIRE(result.UnwrapErr().value == len);
        }
        auto empty_pre_key = PreKeyRatchetMessage::Deserialize(std::span(pre_key).first(0));
        REQUIRE(empty_pre_key.IsErr());
        REQUIRE(empty_pre_key.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
        for (size_t len = 0; len < WireConstants::SENDER_KEY_MESSAGE_MIN_SIZE; ++len) {
            auto result = SenderKeyMessage::Deserialize(std::span(sender_key).first(len));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
        }
        for (size_t len = 0; len < WireConstants::DISTRIBUTION_MESSAGE_MIN_SIZE; ++len) {
            auto result = SenderKeyDistributionMessage::Deserialize(std::span(distribution).first(len));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::CiphertextMessageTooShort);
        }
    }
    SECTION("Every strict prefix decodes cleanly or fails cleanly") {
        for (const auto* message : {&ratchet, &pre_key, &sender_key, &distribution}) {
            for (size_t len = 0; len < message->size(); ++len) {
                FeedEveryDecoder(std::vector<uint8_t>(message->begin(), message->begin() + len));
            }
        }
    }
}

TEST_CASE("Fuzzing - Random corruption of valid messages", "[fuzzing][decode][corruption]") {
    auto pairwise = PairwiseFixture::Create();
    auto group = GroupFixture::Create();
    std::mt19937 gen(42);

    const std::vector<std::vector<uint8_t>> originals = {
        ToVector(pairwise.MakeMessage().GetSerialized()),
        ToVector(pairwise.MakePreKeyMessage().GetSerialized()),
        ToVector(group.MakeMessage().GetSerialized()),
        ToVector(group.MakeDistribution().GetSerialized()),
    };

    constexpr uint32_t CORRUPTION_ATTEMPTS = 1'000;
    for (const auto& original : originals) {
        std::uniform_int_distribution<size_t> pos_dist(0, original.size() - 1);
        std::uniform_int_distribution<int> value_dist(1, 255);
        std::uniform_int_distribution<int> count_dist(1, 8);
        for (uint32_t i = 0; i < CORRUPTION_ATTEMPTS; ++i) {
            auto corrupted = original;
            const int corruptions = count_dist(gen);
            for (int c = 0; c < corruptions; ++c) {
                corrupted[pos_dist(gen)] ^= static_cast<uint8_t>(value_dist(gen));
            }
            FeedEveryDecoder(corrupted);
        }
    }
}
