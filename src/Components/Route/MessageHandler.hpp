//----------------------------------------------------------------------------------------------------------------------
// File: MessageHandler.hpp
// Description: The interface implemented by every command handler registered with the router.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Message/Command.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }
namespace Host { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Route {
//----------------------------------------------------------------------------------------------------------------------

class IMessageHandler;

//----------------------------------------------------------------------------------------------------------------------
} // Route namespace
//----------------------------------------------------------------------------------------------------------------------

class Route::IMessageHandler
{
public:
    IMessageHandler();
    virtual ~IMessageHandler() = default;

    [[nodiscard]] virtual bool OnFetchServices(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider) = 0;

    // Returns the response to be sealed and sent to the peer, or nothing if the command warrants no response.
    [[nodiscard]] virtual std::optional<Message::OutboundResponse> OnMessage(
        Message::InboundCommand const& command) = 0;

protected:
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
