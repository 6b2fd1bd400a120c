//----------------------------------------------------------------------------------------------------------------------
// File: KeyTransport.hpp
// Description: Wraps the serialized session secret to the peer's RSA public key during the handshake. The padding is
// fixed to RSA-OAEP with SHA-1 for both the label hash and MGF1 because the browser extension only unwraps that form.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "OpenSSLHandles.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class KeyTransport;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::KeyTransport
{
public:
    // Imports a DER encoded SubjectPublicKeyInfo. Throws CryptoError if the key is malformed or is not an RSA key.
    explicit KeyTransport(ReadableView publicKey);

    // Returns the base64 encoded ciphertext. Throws CryptoError on failure. 
    [[nodiscard]] std::string Wrap(ReadableView secret) const;
    [[nodiscard]] Buffer WrapRaw(ReadableView secret) const;

private:
    OpenSSL::KeyPair m_upPublicKey;
};

//----------------------------------------------------------------------------------------------------------------------
