//----------------------------------------------------------------------------------------------------------------------
// File: Router.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "Router.hpp"
#include "BiokeyHost/ServiceProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
//----------------------------------------------------------------------------------------------------------------------

Route::Router::Router()
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_handlers()
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Initialize(std::shared_ptr<Host::ServiceProvider> const& spServiceProvider)
{
    for (auto const& [command, upHandler] : m_handlers) {
        if (!upHandler->OnFetchServices(spServiceProvider)) {
            m_logger->error("The command handler for \"{}\" failed to fetch its services.", command);
            return false;
        }
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Route::Router::Contains(std::string_view command) const
{
    return m_handlers.find(command) != m_handlers.end();
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::OutboundResponse> Route::Router::Route(Message::InboundCommand const& command) const
{
    constexpr std::string_view UnrecognizedCommand = 
        "Ignoring an unrecognized command [\"{}\"] with message id {}.";
    constexpr std::string_view HandlerWarning = 
        "Command [\"{}\"] with message id {} did not produce a response.";
    constexpr std::string_view ExceptionError =
        "Command [\"{}\"] with message id {} encountered an error: \"{}\"";

    auto const itr = m_handlers.find(command.command);
    if (itr == m_handlers.end()) {
        m_logger->warn(UnrecognizedCommand, command.command, command.messageId);
        return {};
    }

    try {
        m_logger->debug("Handling command [\"{}\"] with message id {}.", command.command, command.messageId);
        auto optResponse = itr->second->OnMessage(command);
        if (!optResponse) { m_logger->warn(HandlerWarning, command.command, command.messageId); }
        return optResponse;
    } catch (std::exception const& exception) {
        m_logger->error(ExceptionError, command.command, command.messageId, exception.what());
        throw;
    }
}

//----------------------------------------------------------------------------------------------------------------------
