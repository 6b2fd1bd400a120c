//----------------------------------------------------------------------------------------------------------------------
// File: Base64.hpp
// Description: Standard alphabet base64 (RFC 4648, padded) backed by OpenSSL's block encoder. Decoding is strict: the
// input must be padded to a multiple of four and contain only alphabet characters.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Base64 {
//----------------------------------------------------------------------------------------------------------------------

using ReadableView = std::span<std::uint8_t const, std::dynamic_extent>;

constexpr std::uint32_t EncodedBlockSize = 4;
constexpr std::uint32_t DecodedBlockSize = 3;
constexpr char PaddingCharacter = '=';

[[nodiscard]] constexpr std::size_t EncodedSize(std::size_t size);
[[nodiscard]] constexpr bool IsAlphabetCharacter(char c);

[[nodiscard]] std::string Encode(ReadableView buffer);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> Decode(std::string_view encoded);

//----------------------------------------------------------------------------------------------------------------------
} // Base64 namespace
//----------------------------------------------------------------------------------------------------------------------

constexpr std::size_t Base64::EncodedSize(std::size_t size)
{
    return ((size + DecodedBlockSize - 1) / DecodedBlockSize) * EncodedBlockSize;
}

//----------------------------------------------------------------------------------------------------------------------

constexpr bool Base64::IsAlphabetCharacter(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Base64::Encode(ReadableView buffer)
{
    if (buffer.empty()) { return {}; }

    // EVP_EncodeBlock writes a trailing null terminator after the encoded characters.
    std::string encoded(EncodedSize(buffer.size()) + 1, '\0');
    auto const written = EVP_EncodeBlock(
        reinterpret_cast<std::uint8_t*>(encoded.data()), buffer.data(), static_cast<int>(buffer.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> Base64::Decode(std::string_view encoded)
{
    if (encoded.empty()) { return std::vector<std::uint8_t>{}; }
    if (encoded.size() % EncodedBlockSize != 0) { return {}; }

    std::size_t padding = 0;
    if (encoded.back() == PaddingCharacter) { ++padding; }
    if (encoded[encoded.size() - 2] == PaddingCharacter) { ++padding; }
    if (padding == 1 && encoded[encoded.size() - 2] == PaddingCharacter) { return {}; }

    for (std::size_t index = 0; index < encoded.size() - padding; ++index) {
        if (!IsAlphabetCharacter(encoded[index])) { return {}; }
    }

    // EVP_DecodeBlock does not account for padding in its result, the padded bytes are removed afterwards. 
    std::vector<std::uint8_t> decoded((encoded.size() / EncodedBlockSize) * DecodedBlockSize, 0x00);
    auto const written = EVP_DecodeBlock(
        decoded.data(), reinterpret_cast<std::uint8_t const*>(encoded.data()), static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<std::size_t>(written) != decoded.size()) { return {}; }

    decoded.resize(decoded.size() - padding);
    return decoded;
}

//----------------------------------------------------------------------------------------------------------------------
