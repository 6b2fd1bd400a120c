//----------------------------------------------------------------------------------------------------------------------
// File: CipherPackage.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "CipherPackage.hpp"
#include "SecurityUtils.hpp"
#include "Components/Core/Exception.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Security::CipherPackage::CipherPackage(SessionSecret const& secret)
    : m_secret(secret)
    , m_upCipher(EVP_CIPHER_fetch(nullptr, CipherName.data(), nullptr))
    , m_upMacGenerator(EVP_MAC_fetch(nullptr, "HMAC", nullptr))
{
    if (!m_upCipher) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to fetch the envelope cipher!");
    }

    if (!m_upMacGenerator) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to fetch the envelope signature generator!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::SealedEnvelope Security::CipherPackage::Seal(ReadableView plaintext) const
{
    SealedEnvelope envelope{ .type = AesCbc256HmacSha256, .iv = Buffer(InitializationVectorSize, 0x00) };
    if (!GenerateRandomData(envelope.iv)) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to generate an initialization vector!");
    }

    if (!Encrypt(plaintext, envelope.iv, envelope.data)) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to encrypt the envelope content!");
    }

    auto optSignature = GenerateSignature(envelope.iv, envelope.data);
    if (!optSignature) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to sign the envelope content!");
    }
    envelope.mac = std::move(*optSignature);

    return envelope;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Security::CipherPackage::Open(SealedEnvelope const& envelope) const
{
    if (envelope.type != AesCbc256HmacSha256) {
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "Received an envelope using an unsupported scheme!");
    }

    // The ciphertext must never reach the cipher before the signature has been verified. 
    if (Verify(envelope) != VerificationStatus::Success) {
        throw Biokey::Exception(Biokey::ErrorCode::IntegrityError, "The envelope signature does not match!");
    }

    Buffer plaintext;
    if (!Decrypt(envelope.data, envelope.iv, plaintext)) {
        throw Biokey::Exception(Biokey::ErrorCode::PaddingError, "The envelope content has malformed padding!");
    }

    return plaintext;
}

//----------------------------------------------------------------------------------------------------------------------

Security::VerificationStatus Security::CipherPackage::Verify(SealedEnvelope const& envelope) const
{
    if (envelope.iv.size() != InitializationVectorSize || envelope.mac.size() != SignatureSize) {
        return VerificationStatus::Failed;
    }

    auto const optGeneratedSignature = GenerateSignature(envelope.iv, envelope.data);
    if (!optGeneratedSignature) { return VerificationStatus::Failed; }

    // If the signatures are not equal the peer did not sign the envelope or it was altered in transmission. 
    return ConstantTimeEquals(*optGeneratedSignature, envelope.mac) ? 
        VerificationStatus::Success : VerificationStatus::Failed;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OptionalBuffer Security::CipherPackage::GenerateSignature(ReadableView iv, ReadableView ciphertext) const
{
    OpenSSL::MacContext upContext{ EVP_MAC_CTX_new(m_upMacGenerator.get()) };
    if (!upContext) { return {}; }

    // Note: The OpenSSL interface only supports taking non-const values, however, they are only read as the 
    // parameters are constructed. 
    std::array<OSSL_PARAM, 2> params = {
        OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, const_cast<char*>(DigestName.data()), 0),
        OSSL_PARAM_construct_end()
    };

    auto const key = m_secret.GetSignatureKey();
    if (EVP_MAC_init(upContext.get(), key.data(), key.size(), params.data()) <= 0) { return {}; }
    if (EVP_MAC_update(upContext.get(), iv.data(), iv.size()) <= 0) { return {}; }
    if (!ciphertext.empty() && EVP_MAC_update(upContext.get(), ciphertext.data(), ciphertext.size()) <= 0) { 
        return {};
    }

    Buffer signature(SignatureSize, 0x00);
    std::size_t generated = 0;
    if (EVP_MAC_final(upContext.get(), signature.data(), &generated, signature.size()) <= 0) { return {}; }
    if (generated != SignatureSize) { return {}; }

    return signature;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::CipherPackage::Encrypt(ReadableView plaintext, ReadableView iv, Buffer& destination) const
{
    if (!std::in_range<std::int32_t>(plaintext.size() + CipherBlockSize)) { return false; }

    OpenSSL::CipherContext upContext{ EVP_CIPHER_CTX_new() };
    if (!upContext) { return false; }

    auto const key = m_secret.GetEncryptionKey();
    if (EVP_EncryptInit_ex2(upContext.get(), m_upCipher.get(), key.data(), iv.data(), nullptr) <= 0) {
        return false;
    }

    // PKCS#7 padding always adds between one and a full block to the plaintext. 
    std::size_t const paddedSize = (plaintext.size() / CipherBlockSize + 1) * CipherBlockSize;
    destination.assign(paddedSize, 0x00);

    std::int32_t encrypted = 0;
    if (!plaintext.empty()) {
        auto const size = static_cast<std::int32_t>(plaintext.size());
        if (EVP_EncryptUpdate(upContext.get(), destination.data(), &encrypted, plaintext.data(), size) <= 0) {
            return false;
        }
    }

    std::int32_t finalized = 0;
    if (EVP_EncryptFinal_ex(upContext.get(), destination.data() + encrypted, &finalized) <= 0) { return false; }

    destination.resize(static_cast<std::size_t>(encrypted + finalized));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::CipherPackage::Decrypt(ReadableView ciphertext, ReadableView iv, Buffer& destination) const
{
    // A padded ciphertext is always a non-zero multiple of the block size. 
    if (ciphertext.empty() || ciphertext.size() % CipherBlockSize != 0) { return false; }
    if (!std::in_range<std::int32_t>(ciphertext.size() + CipherBlockSize)) { return false; }

    OpenSSL::CipherContext upContext{ EVP_CIPHER_CTX_new() };
    if (!upContext) { return false; }

    auto const key = m_secret.GetEncryptionKey();
    if (EVP_DecryptInit_ex2(upContext.get(), m_upCipher.get(), key.data(), iv.data(), nullptr) <= 0) {
        return false;
    }

    destination.assign(ciphertext.size() + CipherBlockSize, 0x00);

    std::int32_t decrypted = 0;
    auto const size = static_cast<std::int32_t>(ciphertext.size());
    if (EVP_DecryptUpdate(upContext.get(), destination.data(), &decrypted, ciphertext.data(), size) <= 0) {
        EraseMemory(destination.data(), destination.size());
        return false;
    }

    // The final block carries the padding, a failure here indicates the padding could not be stripped.
    std::int32_t finalized = 0;
    if (EVP_DecryptFinal_ex(upContext.get(), destination.data() + decrypted, &finalized) <= 0) {
        EraseMemory(destination.data(), destination.size());
        destination.clear();
        return false;
    }

    destination.resize(static_cast<std::size_t>(decrypted + finalized));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------
