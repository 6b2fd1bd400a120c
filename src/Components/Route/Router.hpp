//----------------------------------------------------------------------------------------------------------------------
// File: Router.hpp
// Description: Maps the command tag of a decrypted request to the handler responsible for it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
#include "Components/Message/Command.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace Host { class ServiceProvider; }

//----------------------------------------------------------------------------------------------------------------------
namespace Route {
//----------------------------------------------------------------------------------------------------------------------

class Router;

//----------------------------------------------------------------------------------------------------------------------
} // Route namespace
//----------------------------------------------------------------------------------------------------------------------

class Route::Router
{
public:
    Router();

    template<typename HandlerType, typename... Arguments>
	    requires std::derived_from<HandlerType, IMessageHandler>
    [[nodiscard]] bool Register(std::string_view command, Arguments&&... arguments)
    {
        if (command.empty()) { return false; }

        auto upHandler = std::make_unique<HandlerType>(std::forward<Arguments>(arguments)...);
        auto const result = m_handlers.insert_or_assign(std::string{ command }, std::move(upHandler));
        if (!result.second) { m_logger->warn("The command handler for \"{}\" was replaced.", command); }
        return true;
    }

    [[nodiscard]] bool Initialize(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider);

    [[nodiscard]] bool Contains(std::string_view command) const;

    // Unrecognized commands produce no response. Errors raised by a handler are logged and propagated to the caller.
    [[nodiscard]] std::optional<Message::OutboundResponse> Route(Message::InboundCommand const& command) const;

private:
    using Handlers = std::map<std::string, std::unique_ptr<IMessageHandler>, std::less<>>;

    std::shared_ptr<spdlog::logger> m_logger;
    Handlers m_handlers;
};

//----------------------------------------------------------------------------------------------------------------------
