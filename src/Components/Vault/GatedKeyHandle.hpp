//----------------------------------------------------------------------------------------------------------------------
// File: GatedKeyHandle.hpp
// Description: Decorates a key provider so every unwrap is preceded by a presence check whenever the presence gate 
// reports that it is available. When the gate is unavailable the unwrap proceeds and any gating is left to the 
// provider itself.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Interfaces/KeyProvider.hpp"
#include "Interfaces/PresenceGate.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Vault {
//----------------------------------------------------------------------------------------------------------------------

class GatedKeyHandle;

//----------------------------------------------------------------------------------------------------------------------
} // Vault namespace
//----------------------------------------------------------------------------------------------------------------------

class Vault::GatedKeyHandle : public IKeyProvider
{
public:
    GatedKeyHandle(std::shared_ptr<IKeyProvider> const& spProvider, std::shared_ptr<IPresenceGate> const& spGate);

    // IKeyProvider {
    [[nodiscard]] std::string_view GetName() const override;
    [[nodiscard]] Security::Buffer Encrypt(Security::ReadableView plaintext) override;

    // Throws PresenceDenied when the gate is available and the user refuses the check.
    [[nodiscard]] Security::Buffer Decrypt(Security::ReadableView ciphertext) override;
    // } IKeyProvider

private:
    std::shared_ptr<IKeyProvider> m_spProvider;
    std::shared_ptr<IPresenceGate> m_spGate;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
