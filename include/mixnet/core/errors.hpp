#pragma once

#include <cstddef>
#include <cstdint>

namespace mixnet::core {

// Error taxonomy shared by the packet path, circuits and links.
// Per-packet errors are drop reasons; circuit and link errors are returned
// to callers.
enum class MixnetError : uint8_t {
    MalformedPacket,
    DecryptionError,
    ReplayDetected,
    AdmissionDenied,
    QueueOverflow,
    NoRouteFound,
    CircuitOpenTimeout,
    LinkDown,
    HandshakeFailed,

    // Failures outside the packet taxonomy
    InvalidArgument,
    CircuitClosed,
    RetransmitExhausted,
    CryptoFailure,
};

inline constexpr size_t MIXNET_ERROR_COUNT =
    static_cast<size_t>(MixnetError::CryptoFailure) + 1;

[[nodiscard]] constexpr const char* mixnet_error_name(MixnetError err) {
    switch (err) {
        case MixnetError::MalformedPacket: return "MalformedPacket";
        case MixnetError::DecryptionError: return "DecryptionError";
        case MixnetError::ReplayDetected: return "ReplayDetected";
        case MixnetError::AdmissionDenied: return "AdmissionDenied";
        case MixnetError::QueueOverflow: return "QueueOverflow";
        case MixnetError::NoRouteFound: return "NoRouteFound";
        case MixnetError::CircuitOpenTimeout: return "CircuitOpenTimeout";
        case MixnetError::LinkDown: return "LinkDown";
        case MixnetError::HandshakeFailed: return "HandshakeFailed";
        case MixnetError::InvalidArgument: return "InvalidArgument";
        case MixnetError::CircuitClosed: return "CircuitClosed";
        case MixnetError::RetransmitExhausted: return "RetransmitExhausted";
        case MixnetError::CryptoFailure: return "CryptoFailure";
        default: return "Unknown";
    }
}

}  // namespace mixnet::core
