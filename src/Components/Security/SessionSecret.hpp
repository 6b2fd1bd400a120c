//----------------------------------------------------------------------------------------------------------------------
// File: SessionSecret.hpp
// Description: The pair of symmetric keys shared with the browser extension for the lifetime of the process. The 
// encryption key drives AES-256-CBC and the signature key drives HMAC-SHA256.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityDefinitions.hpp"
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <mutex>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SessionSecret;
class LazySessionSecret;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SessionSecret
{
public:
    SessionSecret(SecureBuffer&& encryptionKey, SecureBuffer&& signatureKey);

    // Throws CryptoError when the random generator can not be seeded. 
    [[nodiscard]] static SessionSecret Generate();

    // Splits the serialized form (encryption key || signature key). Throws CryptoError on a size mismatch. 
    [[nodiscard]] static SessionSecret FromBytes(ReadableView bytes);

    [[nodiscard]] ReadableView GetEncryptionKey() const;
    [[nodiscard]] ReadableView GetSignatureKey() const;
    [[nodiscard]] SecureBuffer Serialize() const;

private:
    SecureBuffer m_encryptionKey;
    SecureBuffer m_signatureKey;
};

//----------------------------------------------------------------------------------------------------------------------

class Security::LazySessionSecret
{
public:
    LazySessionSecret() = default;
    LazySessionSecret(LazySessionSecret const&) = delete;
    LazySessionSecret& operator=(LazySessionSecret const&) = delete;

    // The secret is generated by the first caller. Every later call observes the same instance.
    [[nodiscard]] SessionSecret const& Get();
    [[nodiscard]] bool IsInitialized() const;

private:
    std::once_flag m_flag;
    std::atomic_bool m_initialized = false;
    std::optional<SessionSecret> m_optSecret;
};

//----------------------------------------------------------------------------------------------------------------------
