//----------------------------------------------------------------------------------------------------------------------
// File: Command.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Command.hpp"
#include "Components/Core/Exception.hpp"
#include "Utilities/TimeUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <limits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Timestamp = "timestamp";
constexpr std::string_view Command = "command";
constexpr std::string_view MessageId = "messageId";
constexpr std::string_view UserId = "userId";
constexpr std::string_view Response = "response";
constexpr std::string_view UserKey = "userKeyB64";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
//----------------------------------------------------------------------------------------------------------------------
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[noreturn]] void ThrowMalformed(std::string_view reason);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Message::InboundCommand Message::InboundCommand::FromJson(std::string_view json)
{
    boost::json::error_code error;
    auto const value = boost::json::parse(json, error);
    if (error) { local::ThrowMalformed("the payload is not valid JSON"); }

    auto const* const pObject = value.if_object();
    if (!pObject) { local::ThrowMalformed("the payload is not an object"); }

    InboundCommand command;

    auto const* const pCommand = pObject->if_contains(symbols::Command);
    if (!pCommand || !pCommand->is_string()) { local::ThrowMalformed("the command field is missing"); }
    command.command = std::string{ pCommand->get_string() };

    auto const* const pMessageId = pObject->if_contains(symbols::MessageId);
    if (!pMessageId) { local::ThrowMalformed("the messageId field is missing"); }
    if (pMessageId->is_int64()) {
        command.messageId = pMessageId->get_int64();
    } else if (pMessageId->is_uint64()) {
        auto const messageId = pMessageId->get_uint64();
        if (messageId > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            local::ThrowMalformed("the messageId field is out of range");
        }
        command.messageId = static_cast<std::int64_t>(messageId);
    } else {
        local::ThrowMalformed("the messageId field is not an integer");
    }

    // A null user identifier is treated the same as an absent one. 
    if (auto const* const pUserId = pObject->if_contains(symbols::UserId); pUserId && !pUserId->is_null()) {
        if (!pUserId->is_string()) { local::ThrowMalformed("the userId field is not a string"); }
        command.optUserId = std::string{ pUserId->get_string() };
    }

    return command;
}

//----------------------------------------------------------------------------------------------------------------------

Message::OutboundResponse Message::OutboundResponse::Create(
    std::string_view command, std::int64_t messageId, ResponseValue value, std::optional<std::string> optKey)
{
    return OutboundResponse{
        .timestamp = TimeUtils::GetEpochMilliseconds(),
        .command = std::string{ command },
        .messageId = messageId,
        .response = value,
        .optExportedKey = std::move(optKey)
    };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Message::OutboundResponse::ToJson() const
{
    boost::json::object json;
    json[symbols::Timestamp] = timestamp;
    json[symbols::Command] = command;
    json[symbols::MessageId] = messageId;
    std::visit([&json] (auto const& value) { json[symbols::Response] = value; }, response);
    if (optExportedKey) { json[symbols::UserKey] = *optExportedKey; }
    return boost::json::serialize(json);
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowMalformed(std::string_view reason)
{
    throw Biokey::Exception(
        Biokey::ErrorCode::ProtocolError, "Received a malformed command: " + std::string{ reason } + "!");
}

//----------------------------------------------------------------------------------------------------------------------
