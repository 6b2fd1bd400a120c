//----------------------------------------------------------------------------------------------------------------------
// File: MessageHandler.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "MessageHandler.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Route::IMessageHandler::IMessageHandler()
    : m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------
