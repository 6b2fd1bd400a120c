//----------------------------------------------------------------------------------------------------------------------
// File: GatedKeyHandle.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "GatedKeyHandle.hpp"
#include "Components/Core/Exception.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Vault::GatedKeyHandle::GatedKeyHandle(
    std::shared_ptr<IKeyProvider> const& spProvider, std::shared_ptr<IPresenceGate> const& spGate)
    : m_spProvider(spProvider)
    , m_spGate(spGate)
    , m_logger(spdlog::get(Logger::Name::Vault.data()))
{
    if (!m_spProvider || !m_spGate) {
        throw Biokey::Exception(
            Biokey::ErrorCode::ConfigurationError, "A gated key handle requires a key provider and a presence gate!");
    }
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Vault::GatedKeyHandle::GetName() const
{
    return m_spProvider->GetName();
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Vault::GatedKeyHandle::Encrypt(Security::ReadableView plaintext)
{
    return m_spProvider->Encrypt(plaintext);
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Vault::GatedKeyHandle::Decrypt(Security::ReadableView ciphertext)
{
    if (auto const availability = m_spGate->CheckAvailability(); availability == Presence::Availability::Available) {
        if (!m_spGate->VerifyPresence()) {
            m_logger->warn("Presence verification was denied, refusing to unwrap with \"{}\".", GetName());
            throw Biokey::Exception(Biokey::ErrorCode::PresenceDenied, "Presence verification was denied!");
        }
    } else {
        m_logger->warn(
            "The presence gate is {}, unwrapping with \"{}\" without a presence check.",
            Presence::ToString(availability), GetName());
    }

    return m_spProvider->Decrypt(ciphertext);
}

//----------------------------------------------------------------------------------------------------------------------
