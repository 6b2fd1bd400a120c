//----------------------------------------------------------------------------------------------------------------------
// File: SealedEnvelope.hpp
// Description: The authenticated encryption container exchanged with the browser extension. The textual form is 
// "<type>.<iv>|<data>|<mac>" where each field is standard base64.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityDefinitions.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

struct SealedEnvelope;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

struct Security::SealedEnvelope
{
    static constexpr char TypeSeperator = '.';
    static constexpr char FieldSeperator = '|';

    [[nodiscard]] bool operator==(SealedEnvelope const& other) const = default;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string GetEncodedInitializationVector() const;
    [[nodiscard]] std::string GetEncodedData() const;
    [[nodiscard]] std::string GetEncodedSignature() const;

    // Returns nothing if the text is not of the expected shape or a field is not valid base64. The scheme identifier 
    // is parsed but not validated, callers decide whether an unsupported scheme is an error.
    [[nodiscard]] static std::optional<SealedEnvelope> FromString(std::string_view text);

    // Assembles an envelope from its individually encoded fields.
    [[nodiscard]] static std::optional<SealedEnvelope> FromEncodedFields(
        std::uint32_t type, std::string_view iv, std::string_view data, std::string_view mac);

    std::uint32_t type = AesCbc256HmacSha256;
    Buffer iv;
    Buffer data;
    Buffer mac;
};

//----------------------------------------------------------------------------------------------------------------------
