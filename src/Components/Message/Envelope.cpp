//----------------------------------------------------------------------------------------------------------------------
// File: Envelope.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Envelope.hpp"
#include "Components/Core/Exception.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view AppId = "appId";
constexpr std::string_view ConnectedAppId = "app_id";
constexpr std::string_view Command = "command";
constexpr std::string_view Message = "message";
constexpr std::string_view MessageId = "messageId";
constexpr std::string_view PublicKey = "publicKey";
constexpr std::string_view SharedSecret = "sharedSecret";
constexpr std::string_view EncryptedString = "encryptedString";
constexpr std::string_view EncryptionType = "encryptionType";
constexpr std::string_view InitializationVector = "iv";
constexpr std::string_view Data = "data";
constexpr std::string_view Signature = "mac";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[noreturn]] void ThrowMalformed(std::string_view reason);
[[nodiscard]] std::optional<std::string_view> GetString(boost::json::object const& object, std::string_view key);
[[nodiscard]] Security::SealedEnvelope ParseEnvelope(boost::json::object const& message);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Message::Inbound Message::ParseInbound(std::string_view json)
{
    boost::json::error_code error;
    auto const value = boost::json::parse(json, error);
    if (error) { local::ThrowMalformed("the frame is not valid JSON"); }

    auto const* const pObject = value.if_object();
    if (!pObject) { local::ThrowMalformed("the frame is not an object"); }

    auto const optAppId = local::GetString(*pObject, symbols::AppId);
    if (!optAppId) { local::ThrowMalformed("the appId field is missing"); }

    auto const* const pMessage = pObject->if_contains(symbols::Message);
    if (!pMessage || !pMessage->is_object()) { local::ThrowMalformed("the message field is missing"); }
    auto const& message = pMessage->get_object();

    // The handshake is only recognized when both the command and the public key are present. Anything else is 
    // expected to be a sealed envelope. 
    auto const optCommand = local::GetString(message, symbols::Command);
    auto const optPublicKey = local::GetString(message, symbols::PublicKey);
    if (optCommand && *optCommand == HandshakeCommand && optPublicKey) {
        return HandshakeRequest{ .appId = std::string{ *optAppId }, .publicKey = std::string{ *optPublicKey } };
    }

    return SealedRequest{ .appId = std::string{ *optAppId }, .envelope = local::ParseEnvelope(message) };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::CreateConnectedNotice(std::string_view appId)
{
    boost::json::object json;
    json[symbols::Command] = ConnectedCommand;
    json[symbols::ConnectedAppId] = appId;
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::CreateHandshakeReply(std::string_view appId, std::string_view sharedSecret)
{
    boost::json::object json;
    json[symbols::Command] = HandshakeCommand;
    json[symbols::AppId] = appId;
    json[symbols::SharedSecret] = sharedSecret;
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::CreateSealedReply(
    std::string_view appId, std::int64_t messageId, Security::SealedEnvelope const& envelope)
{
    // JSON Schema:
    // "appId": String,
    // "messageId": Integer,
    // "message": {
    //     "encryptedString": String,
    //     "encryptionType": Integer,
    //     "iv": String,
    //     "data": String,
    //     "mac": String
    // }
    boost::json::object message;
    message[symbols::EncryptedString] = envelope.ToString();
    message[symbols::EncryptionType] = envelope.type;
    message[symbols::InitializationVector] = envelope.GetEncodedInitializationVector();
    message[symbols::Data] = envelope.GetEncodedData();
    message[symbols::Signature] = envelope.GetEncodedSignature();

    boost::json::object json;
    json[symbols::AppId] = appId;
    json[symbols::MessageId] = messageId;
    json[symbols::Message] = std::move(message);
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowMalformed(std::string_view reason)
{
    throw Biokey::Exception(
        Biokey::ErrorCode::ProtocolError, "Received a malformed frame: " + std::string{ reason } + "!");
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string_view> local::GetString(boost::json::object const& object, std::string_view key)
{
    auto const* const pValue = object.if_contains(key);
    if (!pValue || !pValue->is_string()) { return {}; }
    auto const& string = pValue->get_string();
    return std::string_view{ string.data(), string.size() };
}

//----------------------------------------------------------------------------------------------------------------------

Security::SealedEnvelope local::ParseEnvelope(boost::json::object const& message)
{
    std::optional<Security::SealedEnvelope> optEnvelope;
    if (auto const* const pType = message.if_contains(symbols::EncryptionType); pType) {
        // The structured form takes precedence over the textual form when both are present.
        auto const* const pTypeValue = pType->if_int64();
        if (!pTypeValue) { ThrowMalformed("the encryptionType field is not an integer"); }
        if (*pTypeValue != Security::AesCbc256HmacSha256) { ThrowMalformed("the encryptionType is not supported"); }

        auto const optIv = GetString(message, symbols::InitializationVector);
        auto const optData = GetString(message, symbols::Data);
        auto const optSignature = GetString(message, symbols::Signature);
        if (!optIv || !optData || !optSignature) { ThrowMalformed("the envelope fields are missing"); }

        optEnvelope = Security::SealedEnvelope::FromEncodedFields(
            Security::AesCbc256HmacSha256, *optIv, *optData, *optSignature);
    } else if (auto const optText = GetString(message, symbols::EncryptedString); optText) {
        optEnvelope = Security::SealedEnvelope::FromString(*optText);
        if (optEnvelope && optEnvelope->type != Security::AesCbc256HmacSha256) {
            ThrowMalformed("the encryptionType is not supported");
        }
    } else {
        ThrowMalformed("the message is neither a handshake nor a sealed envelope");
    }

    if (!optEnvelope) { ThrowMalformed("the envelope fields are not valid base64"); }
    return std::move(*optEnvelope);
}

//----------------------------------------------------------------------------------------------------------------------
