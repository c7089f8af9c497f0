#pragma once

#include "mixnet/core/errors.hpp"
#include "mixnet/core/identity.hpp"
#include "mixnet/crypto/aead.hpp"
#include "mixnet/crypto/keys.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace mixnet::core {

using CircuitId = uint64_t;

// End-to-end circuit messages, carried as onion payloads.
//
//   type(1) | circuit_id(8) | [Open: initiator(20) | ephemeral(32)] | counter(8) | AEAD(body)
//
// The AEAD nonce is the per-direction prefix and counter; the associated
// data is everything before the ciphertext. The OPEN body carries the
// initiator's identity signature over open_signed_bytes(), so only the
// destination learns and can check who opened the circuit.
enum class CircuitMessageType : uint8_t {
    Open = 1,
    OpenAck = 2,
    Data = 3,
    Ack = 4,
    Fin = 5,
    FinAck = 6,
};

constexpr size_t MAX_SACK_BLOCKS = 32;
constexpr size_t MAX_SEGMENT_LEN = 1024;

[[nodiscard]] const char* circuit_message_type_name(CircuitMessageType type);

// Directional keys of one circuit
struct CircuitKeys {
    crypto::AeadKey send_key{};
    crypto::AeadKey recv_key{};
    std::array<uint8_t, 4> send_prefix{};
    std::array<uint8_t, 4> recv_prefix{};

    [[nodiscard]] static std::expected<CircuitKeys, MixnetError>
    derive(const crypto::SharedSecret& shared, CircuitId id, bool initiator);
};

// Cleartext part visible before decryption
struct CircuitHeader {
    CircuitMessageType type{CircuitMessageType::Data};
    CircuitId circuit_id{0};
    NodeId initiator;                  // Open only
    crypto::OnionPublicKey ephemeral;  // Open only
};

struct CircuitMessage {
    CircuitMessageType type{CircuitMessageType::Data};
    CircuitId circuit_id{0};
    uint64_t counter{0};

    // Open
    NodeId initiator;
    crypto::OnionPublicKey ephemeral;
    uint8_t priority{0};
    crypto::Signature open_signature{};

    // Data: segment sequence. Ack: next expected sequence. Fin: sequence
    // after the last data segment.
    uint32_t seq{0};
    std::vector<uint32_t> sacks;   // Ack: received segments above seq
    std::vector<uint8_t> data;     // Data
};

// What an initiator signs to open circuit id towards responder
[[nodiscard]] std::vector<uint8_t>
open_signed_bytes(CircuitId id, const NodeId& initiator,
                  const crypto::OnionPublicKey& ephemeral, const NodeId& responder);

[[nodiscard]] std::expected<CircuitHeader, MixnetError>
peek_circuit_header(std::span<const uint8_t> wire);

// Encrypts with keys.send_*; msg.counter must already be assigned
[[nodiscard]] std::expected<std::vector<uint8_t>, MixnetError>
seal_circuit_message(const CircuitMessage& msg, const CircuitKeys& keys);

// Decrypts with keys.recv_*. DecryptionError on tag mismatch.
[[nodiscard]] std::expected<CircuitMessage, MixnetError>
open_circuit_message(std::span<const uint8_t> wire, const CircuitKeys& keys);

}  // namespace mixnet::core
