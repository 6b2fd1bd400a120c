//----------------------------------------------------------------------------------------------------------------------
// File: Biometrics.hpp
// Description: Handlers for the biometric unlock commands sent by the browser extension. Each handler applies its own
// failure policy: the unlock, authenticate, and status handlers report failures as a negative result while the user
// status handler propagates them to the session.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IPresenceGate;
namespace Vault { class KeyVault; }

//----------------------------------------------------------------------------------------------------------------------
namespace Route::Biometrics {
//----------------------------------------------------------------------------------------------------------------------

class UnlockHandler;
class AuthenticateHandler;
class StatusHandler;
class UserStatusHandler;

//----------------------------------------------------------------------------------------------------------------------
} // Route::Biometrics namespace
//----------------------------------------------------------------------------------------------------------------------

class Route::Biometrics::UnlockHandler : public Route::IMessageHandler
{
public:
    static constexpr std::string_view Command = "unlockWithBiometricsForUser";

    UnlockHandler() = default;

    // IMessageHandler{
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider) override;
    [[nodiscard]] virtual std::optional<Message::OutboundResponse> OnMessage(
        Message::InboundCommand const& command) override;
    // }IMessageHandler

private:
    std::weak_ptr<Vault::KeyVault> m_wpKeyVault;
};

//----------------------------------------------------------------------------------------------------------------------

class Route::Biometrics::AuthenticateHandler : public Route::IMessageHandler
{
public:
    static constexpr std::string_view Command = "authenticateWithBiometrics";

    AuthenticateHandler() = default;

    // IMessageHandler{
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider) override;
    [[nodiscard]] virtual std::optional<Message::OutboundResponse> OnMessage(
        Message::InboundCommand const& command) override;
    // }IMessageHandler

private:
    std::weak_ptr<IPresenceGate> m_wpPresenceGate;
};

//----------------------------------------------------------------------------------------------------------------------

class Route::Biometrics::StatusHandler : public Route::IMessageHandler
{
public:
    static constexpr std::string_view Command = "getBiometricsStatus";

    StatusHandler() = default;

    // IMessageHandler{
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider) override;
    [[nodiscard]] virtual std::optional<Message::OutboundResponse> OnMessage(
        Message::InboundCommand const& command) override;
    // }IMessageHandler

private:
    std::weak_ptr<IPresenceGate> m_wpPresenceGate;
};

//----------------------------------------------------------------------------------------------------------------------

class Route::Biometrics::UserStatusHandler : public Route::IMessageHandler
{
public:
    static constexpr std::string_view Command = "getBiometricsStatusForUser";

    UserStatusHandler() = default;

    // IMessageHandler{
    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider) override;
    [[nodiscard]] virtual std::optional<Message::OutboundResponse> OnMessage(
        Message::InboundCommand const& command) override;
    // }IMessageHandler

private:
    std::weak_ptr<Vault::KeyVault> m_wpKeyVault;
};

//----------------------------------------------------------------------------------------------------------------------
