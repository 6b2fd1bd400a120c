//----------------------------------------------------------------------------------------------------------------------
// File: OpenSSLHandles.hpp
// Description: Owning handles for the OpenSSL objects used by the security components.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bio.h>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security::OpenSSL {
//----------------------------------------------------------------------------------------------------------------------

struct KeyPairContextDeleter
{
    void operator()(EVP_PKEY_CTX* pContext) const
    {
        EVP_PKEY_CTX_free(pContext);
    }
};

using KeyPairContext = std::unique_ptr<EVP_PKEY_CTX, KeyPairContextDeleter>;

struct KeyPairDeleter
{
    void operator()(EVP_PKEY* pKey) const
    {
        EVP_PKEY_free(pKey);
    }
};

using KeyPair = std::unique_ptr<EVP_PKEY, KeyPairDeleter>;

struct CipherAlgorithmDeleter
{
    void operator()(EVP_CIPHER* pCipher) const
    {
        EVP_CIPHER_free(pCipher);
    }
};

using CipherAlgorithm = std::unique_ptr<EVP_CIPHER, CipherAlgorithmDeleter>;

struct CipherContextDeleter
{
    void operator()(EVP_CIPHER_CTX* pContext) const
    {
        EVP_CIPHER_CTX_free(pContext);
    }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

struct MacAlgorithmDeleter
{
    void operator()(EVP_MAC* pMac) const
    {
        EVP_MAC_free(pMac);
    }
};

using MacAlgorithm = std::unique_ptr<EVP_MAC, MacAlgorithmDeleter>;

struct MacContextDeleter
{
    void operator()(EVP_MAC_CTX* pContext) const
    {
        EVP_MAC_CTX_free(pContext);
    }
};

using MacContext = std::unique_ptr<EVP_MAC_CTX, MacContextDeleter>;

struct BasicInputOutputDeleter
{
    void operator()(BIO* pBio) const
    {
        BIO_free_all(pBio);
    }
};

using BasicInputOutput = std::unique_ptr<BIO, BasicInputOutputDeleter>;

//----------------------------------------------------------------------------------------------------------------------
} // Security::OpenSSL namespace
//----------------------------------------------------------------------------------------------------------------------
