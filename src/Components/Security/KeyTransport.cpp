//----------------------------------------------------------------------------------------------------------------------
// File: KeyTransport.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "KeyTransport.hpp"
#include "SecurityDefinitions.hpp"
#include "Components/Core/Exception.hpp"
#include "Utilities/Base64.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
//----------------------------------------------------------------------------------------------------------------------

Security::KeyTransport::KeyTransport(ReadableView publicKey)
    : m_upPublicKey()
{
    if (publicKey.empty() || publicKey.size() > MaximumExpectedPublicKeySize) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Received a public key of an unexpected size!");
    }

    auto pBegin = publicKey.data();
    m_upPublicKey.reset(d2i_PUBKEY(nullptr, &pBegin, static_cast<long>(publicKey.size())));
    if (!m_upPublicKey) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to import the peer's public key!");
    }

    if (EVP_PKEY_is_a(m_upPublicKey.get(), "RSA") != 1) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "The peer's public key is not an RSA key!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string Security::KeyTransport::Wrap(ReadableView secret) const
{
    return Base64::Encode(WrapRaw(secret));
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Security::KeyTransport::WrapRaw(ReadableView secret) const
{
    auto const upContext = OpenSSL::KeyPairContext{ EVP_PKEY_CTX_new_from_pkey(nullptr, m_upPublicKey.get(), nullptr) };
    if (!upContext) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to create the key transport context!");
    }

    if (EVP_PKEY_encrypt_init(upContext.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(upContext.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_oaep_md(upContext.get(), EVP_sha1()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(upContext.get(), EVP_sha1()) <= 0) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to configure the key transport padding!");
    }

    std::size_t size = 0;
    if (EVP_PKEY_encrypt(upContext.get(), nullptr, &size, secret.data(), secret.size()) <= 0) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to size the wrapped session secret!");
    }

    Buffer wrapped(size, 0x00);
    if (EVP_PKEY_encrypt(upContext.get(), wrapped.data(), &size, secret.data(), secret.size()) <= 0) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to wrap the session secret!");
    }
    wrapped.resize(size);

    return wrapped;
}

//----------------------------------------------------------------------------------------------------------------------
