//----------------------------------------------------------------------------------------------------------------------
// File: Command.hpp
// Description: The decrypted request and response payloads carried inside sealed envelopes.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Message {
//----------------------------------------------------------------------------------------------------------------------

struct InboundCommand;
struct OutboundResponse;

using ResponseValue = std::variant<std::int32_t, bool>;

//----------------------------------------------------------------------------------------------------------------------
} // Message namespace
//----------------------------------------------------------------------------------------------------------------------

struct Message::InboundCommand
{
    // Throws ProtocolError if the payload is not a JSON object with a string command and an integral messageId.
    [[nodiscard]] static InboundCommand FromJson(std::string_view json);

    std::string command;
    std::int64_t messageId = 0;
    std::optional<std::string> optUserId;
};

//----------------------------------------------------------------------------------------------------------------------

struct Message::OutboundResponse
{
    // Stamps the response with the current wall clock time. 
    [[nodiscard]] static OutboundResponse Create(
        std::string_view command, std::int64_t messageId, ResponseValue value, std::optional<std::string> optKey = {});

    [[nodiscard]] std::string ToJson() const;

    std::uint64_t timestamp = 0;
    std::string command;
    std::int64_t messageId = 0;
    ResponseValue response = false;
    std::optional<std::string> optExportedKey;
};

//----------------------------------------------------------------------------------------------------------------------
