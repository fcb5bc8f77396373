//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Encode/decode JSON-RPC envelopes and batches to/from frame payloads (no I/O)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {

//==========================================================================================================
// Envelope
// Purpose: One logical protocol message. An ErrorResponse is a JSONRPCResponse whose error is set.
//==========================================================================================================
using Envelope = std::variant<JSONRPCRequest, JSONRPCResponse, JSONRPCNotification>;

enum class EnvelopeKind {
    Request,
    Response,
    ErrorResponse,
    Notification
};

// Classifies an envelope into the four wire kinds.
EnvelopeKind KindOf(const Envelope& envelope);

//==========================================================================================================
// DecodeStatus / DecodeError
// Purpose: Outcome classification of a decode attempt.
// Fields:
//   status: ParseError (bytes were not JSON) or InvalidEnvelope (JSON, but not a valid envelope).
//   id: Identifier recovered from the payload; null when none could be recovered.
//   detail: Human-readable reason.
//==========================================================================================================
enum class DecodeStatus {
    Ok,
    ParseError,
    InvalidEnvelope
};

struct DecodeError {
    DecodeStatus status{DecodeStatus::InvalidEnvelope};
    JSONRPCId id{nullptr};
    std::string detail;

    // Wire code used when answering this error (-32700 or -32600).
    int Code() const;
};

//==========================================================================================================
// Batch
// Purpose: Ordered sequence of envelopes carried by one transport write.
// Fields:
//   members: Valid envelopes in input order.
//   invalid: Members that failed structural validation; each deserves its own ErrorResponse.
//==========================================================================================================
struct Batch {
    std::vector<Envelope> members;
    std::vector<DecodeError> invalid;
};

bool operator==(const Batch& lhs, const Batch& rhs);

using Message = std::variant<Envelope, Batch>;

//==========================================================================================================
// DecodeResult
// Purpose: Result of MessageCodec::Decode.
// Fields:
//   status: Ok when message is set; otherwise the error classification.
//   message: Decoded single envelope or batch (present when status==Ok).
//   error: Populated when status!=Ok.
//==========================================================================================================
struct DecodeResult {
    DecodeStatus status{DecodeStatus::Ok};
    std::optional<Message> message;
    DecodeError error;

    bool Ok() const { return status == DecodeStatus::Ok; }
};

//==========================================================================================================
// MessageCodec
// Purpose: Stateless conversions between envelopes and frame payloads.
//==========================================================================================================
class MessageCodec {
public:
    //==========================================================================================================
    // Encodes an envelope, batch, or message into a compact JSON payload.
    //==========================================================================================================
    static std::string Encode(const Envelope& envelope);
    static std::string Encode(const Batch& batch);
    static std::string Encode(const Message& message);

    //==========================================================================================================
    // Decodes one frame payload.
    // Args:
    //   payload: Frame contents as produced by a transport.
    // Returns:
    //   DecodeResult distinguishing ParseError, InvalidEnvelope (with recovered id), single envelope, and batch.
    //==========================================================================================================
    static DecodeResult Decode(const std::string& payload);

    //==========================================================================================================
    // Classifies an already-parsed JSON value as an envelope.
    // Returns:
    //   The envelope, or a DecodeError with status InvalidEnvelope.
    //==========================================================================================================
    static std::variant<Envelope, DecodeError> DecodeEnvelope(const JSONValue& value);

    //==========================================================================================================
    // Builds the ErrorResponse a receiver sends back for a decode failure.
    //==========================================================================================================
    static JSONRPCResponse MakeErrorReply(const DecodeError& error);
};

} // namespace mcplink
