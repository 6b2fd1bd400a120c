//----------------------------------------------------------------------------------------------------------------------
// File: Envelope.hpp
// Description: The outer JSON documents carried by each frame. Inbound frames are either the clear text handshake or 
// a sealed request, both keyed by the peer's application identifier.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SealedEnvelope.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

struct HandshakeRequest;
struct SealedRequest;

using Inbound = std::variant<HandshakeRequest, SealedRequest>;

constexpr std::string_view HandshakeCommand = "setupEncryption";
constexpr std::string_view ConnectedCommand = "connected";

// Throws ProtocolError if the frame is not JSON, does not carry an appId, or carries neither a handshake nor a 
// well formed sealed envelope. 
[[nodiscard]] Inbound ParseInbound(std::string_view json);

[[nodiscard]] std::string CreateConnectedNotice(std::string_view appId);
[[nodiscard]] std::string CreateHandshakeReply(std::string_view appId, std::string_view sharedSecret);
[[nodiscard]] std::string CreateSealedReply(
    std::string_view appId, std::int64_t messageId, Security::SealedEnvelope const& envelope);

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

struct Message::HandshakeRequest
{
    std::string appId;
    std::string publicKey; // base64 DER SubjectPublicKeyInfo
};

//----------------------------------------------------------------------------------------------------------------------

struct Message::SealedRequest
{
    std::string appId;
    Security::SealedEnvelope envelope;
};

//----------------------------------------------------------------------------------------------------------------------
