//----------------------------------------------------------------------------------------------------------------------
// File: CipherPackage.hpp
// Description: Seals and opens envelopes under a session secret. Opening always verifies the signature over the 
// initialization vector and ciphertext before the ciphertext is handed to the cipher.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLHandles.hpp"
#include "SealedEnvelope.hpp"
#include "SecurityDefinitions.hpp"
#include "SecurityTypes.hpp"
#include "SessionSecret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class CipherPackage;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::CipherPackage
{
public:
    explicit CipherPackage(SessionSecret const& secret);

    CipherPackage(CipherPackage const&) = delete;
    CipherPackage& operator=(CipherPackage const&) = delete;

    // Encrypts the plaintext under a fresh random initialization vector. Throws CryptoError on a primitive failure.
    [[nodiscard]] SealedEnvelope Seal(ReadableView plaintext) const;

    // Throws IntegrityError when the signature does not match, PaddingError when the recovered padding is malformed,
    // and ProtocolError when the envelope uses an unsupported scheme.
    [[nodiscard]] Buffer Open(SealedEnvelope const& envelope) const;

    [[nodiscard]] VerificationStatus Verify(SealedEnvelope const& envelope) const;
    [[nodiscard]] OptionalBuffer GenerateSignature(ReadableView iv, ReadableView ciphertext) const;

private:
    [[nodiscard]] bool Encrypt(ReadableView plaintext, ReadableView iv, Buffer& destination) const;
    [[nodiscard]] bool Decrypt(ReadableView ciphertext, ReadableView iv, Buffer& destination) const;

    SessionSecret const& m_secret;
    OpenSSL::CipherAlgorithm m_upCipher;
    OpenSSL::MacAlgorithm m_upMacGenerator;
};

//----------------------------------------------------------------------------------------------------------------------
