#pragma once
#include "ratchetwire/core/format.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <exception>
#include <optional>
namespace ratchetwire::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};

/// Closed set of protocol failure kinds.
enum class ProtocolFailureType {
    InvalidArgument,
    InvalidState,
    ProtobufDecodingError,
    ProtobufEncodingError,
    InvalidProtobufEncoding,
    CiphertextMessageTooShort,
    LegacyCiphertextVersion,
    UnrecognizedCiphertextVersion,
    UnrecognizedMessageVersion,
    NoKeyTypeIdentifier,
    BadKeyType,
    BadKeyLength,
    InvalidMacKeyLength,
    SignatureValidationFailed,
    ApplicationCallbackError
};

/// Wire message kind a version byte or version field belonged to.
enum class WireMessageKind : uint8_t {
    Ratchet,
    PreKey,
    SenderKey,
    SenderKeyDistribution
};

[[nodiscard]] constexpr std::string_view ToString(const WireMessageKind kind) noexcept {
    switch (kind) {
        case WireMessageKind::Ratchet: return "RatchetMessage";
        case WireMessageKind::PreKey: return "PreKeyRatchetMessage";
        case WireMessageKind::SenderKey: return "SenderKeyMessage";
        case WireMessageKind::SenderKeyDistribution: return "SenderKeyDistributionMessage";
    }
    return "UnknownMessage";
}

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    /// Numeric payload of the failure: buffer or key length, version nibble,
    /// version field or key type byte, depending on `type`.
    std::optional<uint64_t> value;
    std::optional<WireMessageKind> message_kind;
    /// Opaque underlying error of an ApplicationCallbackError.
    std::exception_ptr cause;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static ProtocolFailure InvalidArgument(std::string msg) {
        return {ProtocolFailureType::InvalidArgument,
                compat::format("invalid argument: {}", msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState,
                compat::format("invalid state: {}", msg)};
    }
    static ProtocolFailure ProtobufDecodingError(std::string msg) {
        return {ProtocolFailureType::ProtobufDecodingError,
                compat::format("failed to decode protobuf: {}", msg)};
    }
    static ProtocolFailure ProtobufEncodingError(std::string msg) {
        return {ProtocolFailureType::ProtobufEncodingError,
                compat::format("failed to encode protobuf: {}", msg)};
    }
    static ProtocolFailure InvalidProtobufEncoding() {
        return {ProtocolFailureType::InvalidProtobufEncoding,
                "protobuf encoding was invalid"};
    }
    static ProtocolFailure CiphertextMessageTooShort(const size_t length) {
        ProtocolFailure failure(ProtocolFailureType::CiphertextMessageTooShort,
            compat::format("ciphertext serialized bytes were too short <{}>", length));
        failure.value = length;
        return failure;
    }
    static ProtocolFailure LegacyCiphertextVersion(const uint8_t version, const WireMessageKind kind) {
        ProtocolFailure failure(ProtocolFailureType::LegacyCiphertextVersion,
            compat::format("{} ciphertext version was too old <{}>", ToString(kind), static_cast<unsigned>(version)));
        failure.value = version;
        failure.message_kind = kind;
        return failure;
    }
    static ProtocolFailure UnrecognizedCiphertextVersion(const uint8_t version, const WireMessageKind kind) {
        ProtocolFailure failure(ProtocolFailureType::UnrecognizedCiphertextVersion,
            compat::format("{} ciphertext version was unrecognized <{}>", ToString(kind), static_cast<unsigned>(version)));
        failure.value = version;
        failure.message_kind = kind;
        return failure;
    }
    static ProtocolFailure UnrecognizedMessageVersion(const uint32_t version, const WireMessageKind kind) {
        ProtocolFailure failure(ProtocolFailureType::UnrecognizedMessageVersion,
            compat::format("unrecognized {} message version <{}>", ToString(kind), version));
        failure.value = version;
        failure.message_kind = kind;
        return failure;
    }
    static ProtocolFailure NoKeyTypeIdentifier() {
        return {ProtocolFailureType::NoKeyTypeIdentifier, "no key type identifier"};
    }
    static ProtocolFailure BadKeyType(const uint8_t key_type) {
        ProtocolFailure failure(ProtocolFailureType::BadKeyType,
            compat::format("bad key type <{:#04x}>", static_cast<unsigned>(key_type)));
        failure.value = key_type;
        return failure;
    }
    static ProtocolFailure BadKeyLength(std::string_view key_type, const size_t length) {
        ProtocolFailure failure(ProtocolFailureType::BadKeyLength,
            compat::format("bad key length <{}> for key with type <{}>", length, key_type));
        failure.value = length;
        return failure;
    }
    static ProtocolFailure InvalidMacKeyLength(const size_t length) {
        ProtocolFailure failure(ProtocolFailureType::InvalidMacKeyLength,
            compat::format("invalid MAC key length <{}>", length));
        failure.value = length;
        return failure;
    }
    static ProtocolFailure SignatureValidationFailed() {
        return {ProtocolFailureType::SignatureValidationFailed, "invalid signature detected"};
    }
    static ProtocolFailure ApplicationCallbackError(std::string_view method, std::exception_ptr cause) {
        ProtocolFailure failure(ProtocolFailureType::ApplicationCallbackError,
            compat::format("error in method call '{}': {}", method, DescribeCause(cause)));
        failure.cause = std::move(cause);
        return failure;
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return InvalidState(sf.message);
    }

private:
    static std::string DescribeCause(const std::exception_ptr& cause) {
        if (!cause) {
            return "no cause recorded";
        }
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (...) {
            return "non-standard exception";
        }
    }
};
}
