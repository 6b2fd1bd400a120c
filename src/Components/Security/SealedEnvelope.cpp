//----------------------------------------------------------------------------------------------------------------------
// File: SealedEnvelope.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SealedEnvelope.hpp"
#include "Utilities/Base64.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <charconv>
//----------------------------------------------------------------------------------------------------------------------

std::string Security::SealedEnvelope::ToString() const
{
    std::string text = std::to_string(type);
    text.push_back(TypeSeperator);
    text.append(GetEncodedInitializationVector());
    text.push_back(FieldSeperator);
    text.append(GetEncodedData());
    text.push_back(FieldSeperator);
    text.append(GetEncodedSignature());
    return text;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::SealedEnvelope::GetEncodedInitializationVector() const
{
    return Base64::Encode(iv);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::SealedEnvelope::GetEncodedData() const
{
    return Base64::Encode(data);
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::SealedEnvelope::GetEncodedSignature() const
{
    return Base64::Encode(mac);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::SealedEnvelope> Security::SealedEnvelope::FromString(std::string_view text)
{
    auto const typeEnd = text.find(TypeSeperator);
    if (typeEnd == std::string_view::npos || typeEnd == 0) { return {}; }

    std::uint32_t type = 0;
    {
        auto const [pEnd, error] = std::from_chars(text.data(), text.data() + typeEnd, type);
        if (error != std::errc{} || pEnd != text.data() + typeEnd) { return {}; }
    }

    auto fields = text.substr(typeEnd + 1);
    auto const first = fields.find(FieldSeperator);
    if (first == std::string_view::npos) { return {}; }
    auto const second = fields.find(FieldSeperator, first + 1);
    if (second == std::string_view::npos) { return {}; }
    if (fields.find(FieldSeperator, second + 1) != std::string_view::npos) { return {}; }

    return FromEncodedFields(
        type, fields.substr(0, first), fields.substr(first + 1, second - first - 1), fields.substr(second + 1));
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Security::SealedEnvelope> Security::SealedEnvelope::FromEncodedFields(
    std::uint32_t type, std::string_view iv, std::string_view data, std::string_view mac)
{
    auto optIv = Base64::Decode(iv);
    auto optData = Base64::Decode(data);
    auto optMac = Base64::Decode(mac);
    if (!optIv || !optData || !optMac) { return {}; }

    return SealedEnvelope{ 
        .type = type, .iv = std::move(*optIv), .data = std::move(*optData), .mac = std::move(*optMac) };
}

//----------------------------------------------------------------------------------------------------------------------
