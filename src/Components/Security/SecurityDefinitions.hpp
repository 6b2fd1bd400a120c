//----------------------------------------------------------------------------------------------------------------------
// File: SecurityDefinitions.hpp
// Description: Sizes and identifiers fixed by the browser extension's wire format.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

enum class VerificationStatus : std::uint32_t { Failed, Success };

// The only envelope type understood by the extension: AES-256-CBC with HMAC-SHA256 over iv || ciphertext.
constexpr std::uint32_t AesCbc256HmacSha256 = 2;

constexpr std::size_t EncryptionKeySize = 32;
constexpr std::size_t SignatureKeySize = 32;
constexpr std::size_t SessionSecretSize = EncryptionKeySize + SignatureKeySize;
constexpr std::size_t InitializationVectorSize = 16;
constexpr std::size_t CipherBlockSize = 16;
constexpr std::size_t SignatureSize = 32;

constexpr std::string_view CipherName = "AES-256-CBC";
constexpr std::string_view DigestName = "SHA256";

constexpr std::size_t MaximumExpectedPublicKeySize = 512'000;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
