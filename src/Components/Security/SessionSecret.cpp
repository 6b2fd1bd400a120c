//----------------------------------------------------------------------------------------------------------------------
// File: SessionSecret.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SessionSecret.hpp"
#include "SecurityUtils.hpp"
#include "Components/Core/Exception.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------

Security::SessionSecret::SessionSecret(SecureBuffer&& encryptionKey, SecureBuffer&& signatureKey)
    : m_encryptionKey(std::move(encryptionKey))
    , m_signatureKey(std::move(signatureKey))
{
    if (m_encryptionKey.GetSize() != EncryptionKeySize || m_signatureKey.GetSize() != SignatureKeySize) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Session keys must each be 32 bytes!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::SessionSecret Security::SessionSecret::Generate()
{
    SecureBuffer encryptionKey(EncryptionKeySize);
    SecureBuffer signatureKey(SignatureKeySize);
    if (!GenerateRandomData(encryptionKey.GetData()) || !GenerateRandomData(signatureKey.GetData())) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, "Failed to generate random session keys!");
    }
    return SessionSecret{ std::move(encryptionKey), std::move(signatureKey) };
}

//----------------------------------------------------------------------------------------------------------------------

Security::SessionSecret Security::SessionSecret::FromBytes(ReadableView bytes)
{
    if (bytes.size() != SessionSecretSize) {
        throw Biokey::Exception(Biokey::ErrorCode::CryptoError, fmt::format(
            "A serialized session secret must be {} bytes, received {}!", SessionSecretSize, bytes.size()));
    }

    return SessionSecret{ 
        SecureBuffer{ bytes.first(EncryptionKeySize) },
        SecureBuffer{ bytes.subspan(EncryptionKeySize, SignatureKeySize) } };
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SessionSecret::GetEncryptionKey() const
{
    return m_encryptionKey.GetData();
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SessionSecret::GetSignatureKey() const
{
    return m_signatureKey.GetData();
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer Security::SessionSecret::Serialize() const
{
    return SecureBuffer{ m_encryptionKey.GetData(), m_signatureKey.GetData() };
}

//----------------------------------------------------------------------------------------------------------------------

Security::SessionSecret const& Security::LazySessionSecret::Get()
{
    std::call_once(m_flag, [this] {
        m_optSecret.emplace(SessionSecret::Generate());
        m_initialized.store(true, std::memory_order_release);
    });
    return *m_optSecret;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::LazySessionSecret::IsInitialized() const
{
    return m_initialized.load(std::memory_order_acquire);
}

//----------------------------------------------------------------------------------------------------------------------
