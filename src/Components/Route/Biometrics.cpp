//----------------------------------------------------------------------------------------------------------------------
// File: Biometrics.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Biometrics.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "BiokeyHost/ServiceProvider.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Presence/Availability.hpp"
#include "Components/Vault/KeyVault.hpp"
#include "Interfaces/PresenceGate.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <exception>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

// The user identifier is required by the per-user commands, a request without one ends the session. 
[[nodiscard]] std::string const& GetRequiredUserId(Message::InboundCommand const& command);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

bool Route::Biometrics::UnlockHandler::OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider)
{
    m_wpKeyVault = spServiceProvider->Fetch<Vault::KeyVault>();
    if (m_wpKeyVault.expired()) { return false; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::OutboundResponse> Route::Biometrics::UnlockHandler::OnMessage(
    Message::InboundCommand const& command)
{
    auto const& userId = local::GetRequiredUserId(command);

    // Any failure to release the key is reported to the peer as a refusal rather than an error.
    try {
        auto const spKeyVault = m_wpKeyVault.lock();
        if (!spKeyVault) { throw std::runtime_error("The key vault is no longer available!"); }
        auto key = spKeyVault->Export(userId);
        m_logger->info("Released the key for user \"{}\".", userId);
        return Message::OutboundResponse::Create(Command, command.messageId, true, std::move(key));
    } catch (std::exception const& exception) {
        m_logger->warn("Refusing to release the key for user \"{}\": {}", userId, exception.what());
    }

    return Message::OutboundResponse::Create(Command, command.messageId, false);
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Biometrics::AuthenticateHandler::OnFetchServices(
    std::shared_ptr<Host::ServiceProvider> const& spServiceProvider)
{
    m_wpPresenceGate = spServiceProvider->Fetch<IPresenceGate>();
    if (m_wpPresenceGate.expired()) { return false; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::OutboundResponse> Route::Biometrics::AuthenticateHandler::OnMessage(
    Message::InboundCommand const& command)
{
    bool verified = false;
    try {
        if (auto const spPresenceGate = m_wpPresenceGate.lock(); spPresenceGate) {
            verified = spPresenceGate->VerifyPresence();
        }
    } catch (std::exception const& exception) {
        m_logger->warn("Presence verification failed: {}", exception.what());
    }

    return Message::OutboundResponse::Create(Command, command.messageId, verified);
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Biometrics::StatusHandler::OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider)
{
    m_wpPresenceGate = spServiceProvider->Fetch<IPresenceGate>();
    if (m_wpPresenceGate.expired()) { return false; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::OutboundResponse> Route::Biometrics::StatusHandler::OnMessage(
    Message::InboundCommand const& command)
{
    auto availability = Presence::Availability::Unknown;
    try {
        if (auto const spPresenceGate = m_wpPresenceGate.lock(); spPresenceGate) {
            availability = spPresenceGate->CheckAvailability();
        }
    } catch (std::exception const& exception) {
        m_logger->warn("Failed to query the presence availability: {}", exception.what());
    }

    m_logger->debug("The presence gate is {}.", Presence::ToString(availability));
    return Message::OutboundResponse::Create(Command, command.messageId, Presence::ToStatusCode(availability));
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Biometrics::UserStatusHandler::OnFetchServices(
    std::shared_ptr<Host::ServiceProvider> const& spServiceProvider)
{
    m_wpKeyVault = spServiceProvider->Fetch<Vault::KeyVault>();
    if (m_wpKeyVault.expired()) { return false; }
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::OutboundResponse> Route::Biometrics::UserStatusHandler::OnMessage(
    Message::InboundCommand const& command)
{
    auto const& userId = local::GetRequiredUserId(command);

    auto const spKeyVault = m_wpKeyVault.lock();
    if (!spKeyVault) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "The key vault is no longer available!");
    }

    bool const exists = spKeyVault->Exists(userId);
    auto const status = exists ? Presence::StatusCode::Available : Presence::StatusCode::NotEnabledForUser;
    return Message::OutboundResponse::Create(Command, command.messageId, status);
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& local::GetRequiredUserId(Message::InboundCommand const& command)
{
    if (!command.optUserId) {
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "The command requires a userId field!");
    }
    return *command.optUserId;
}

//----------------------------------------------------------------------------------------------------------------------
