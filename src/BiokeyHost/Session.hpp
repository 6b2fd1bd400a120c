//----------------------------------------------------------------------------------------------------------------------
// File: Session.hpp
// Description: The native messaging session with the browser extension. A session announces itself, answers the key 
// exchange handshake in the clear, and opens, routes, and seals every other request until the peer closes the channel.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Channel/FramedChannel.hpp"
#include "Components/Message/Envelope.hpp"
#include "Components/Route/Router.hpp"
#include "Components/Security/CipherPackage.hpp"
#include "Components/Security/SessionSecret.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Host {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;
class Session;

//----------------------------------------------------------------------------------------------------------------------
} // Host namespace
//----------------------------------------------------------------------------------------------------------------------

class Host::Session final
{
public:
    // The session secret is generated here, so handshake and sealed requests may arrive in either order. Throws 
    // ConfigurationError when the provider does not supply the services required by the command handlers.
    Session(
        std::string_view appId,
        std::istream& input,
        std::ostream& output,
        std::shared_ptr<ServiceProvider> const& spServiceProvider);

    Session(Session const&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session const&) = delete;
    Session& operator=(Session&&) = delete;

    // Blocks until the peer closes the channel. Any protocol, integrity, or crypto failure ends the session by 
    // propagating the error to the caller.
    void Run();

    [[nodiscard]] std::size_t GetHandshakeCount() const;
    [[nodiscard]] std::size_t GetDispatchedCount() const;

private:
    void OnHandshake(Message::HandshakeRequest const& request);
    void OnSealedRequest(Message::SealedRequest const& request);

    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_appId;
    Security::LazySessionSecret m_secret;
    std::unique_ptr<Security::CipherPackage> m_upCipherPackage;
    Channel::FramedChannel m_channel;
    Route::Router m_router;

    std::size_t m_handshakes;
    std::size_t m_dispatched;
};

//----------------------------------------------------------------------------------------------------------------------
