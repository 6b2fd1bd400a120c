//----------------------------------------------------------------------------------------------------------------------
// File: main.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "OperatorCommands.hpp"
#include "ServiceProvider.hpp"
#include "Session.hpp"
#include "StartupOptions.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Presence/CommandGate.hpp"
#include "Components/Vault/GatedKeyHandle.hpp"
#include "Components/Vault/KeyVault.hpp"
#include "Components/Vault/SoftwareKeyProvider.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::int32_t RunHost(
    Configuration::Parser const& parser,
    std::shared_ptr<IPresenceGate> const& spPresenceGate,
    Host::OperatorCommands::VaultFactory const& createKeyVault);

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

std::int32_t main(std::int32_t argc, char** argv)
{
    // A browser that closes the channel mid-write must surface as a write failure rather than terminate the process.
    if (SIG_ERR == std::signal(SIGPIPE, SIG_IGN)) { return 1; }

    Startup::Options options;
    switch (options.Parse(argc, argv)) {
        case Startup::ParseCode::Success: break;
        case Startup::ParseCode::ExitRequested: return 0;
        case Startup::ParseCode::Malformed: return 1;
    }

    // Initialize the logging resources for the application. Every sink writes to stderr.
    Logger::Initialize(options.GetVerbosity(), !options.IsQuiet()); 
    auto const logger = spdlog::get(Logger::Name::Core.data());
    assert(logger);

    // Read the configuration file at the provided location. If the file could not be used, report the reason and exit.
    Configuration::Parser parser(options.GetConfigPath());
    if (auto const [status, reason] = parser.FetchOptions(); status != Configuration::StatusCode::Success) {
        std::cerr << "Failed to load the configuration file at " << parser.GetFilepath() << ": " << reason << std::endl;
        return 1;
    }

    auto const spPresenceGate = std::make_shared<Presence::CommandGate>(Presence::CommandGate::Options{
        .command = parser.GetPresenceCommand(),
        .enabled = parser.IsPresenceEnabled(),
        .timeout = parser.GetPresenceTimeout()
    });

    Host::OperatorCommands::VaultFactory const createKeyVault = [&parser, spPresenceGate] () {
        auto const spProvider = std::make_shared<Vault::SoftwareKeyProvider>(
            parser.GetKeyDirectory(), parser.GetKeyName());
        auto const spKeyHandle = std::make_shared<Vault::GatedKeyHandle>(spProvider, spPresenceGate);
        return std::make_shared<Vault::KeyVault>(parser.GetVaultDirectory(), spKeyHandle);
    };

    if (options.IsHostInvocation()) {
        logger->info("Starting the native messaging host for {}.", options.GetArguments().front());
        return Startup::RunHost(parser, spPresenceGate, createKeyVault);
    }

    Host::OperatorCommands commands(
        { .createKeyVault = createKeyVault, .spPresenceGate = spPresenceGate, .keyDirectory = parser.GetKeyDirectory() },
        std::cout, std::cerr);

    return commands.Execute(options.GetArguments());
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Startup::RunHost(
    Configuration::Parser const& parser,
    std::shared_ptr<IPresenceGate> const& spPresenceGate,
    Host::OperatorCommands::VaultFactory const& createKeyVault)
{
    auto const logger = spdlog::get(Logger::Name::Core.data());

    // Frames are read and written through the standard streams, the C stdio buffers are never used.
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        auto const spServiceProvider = std::make_shared<Host::ServiceProvider>();
        auto const spKeyVault = createKeyVault();
        if (!spServiceProvider->Register(spKeyVault) || !spServiceProvider->Register(spPresenceGate)) {
            logger->critical("Failed to register the host services!");
            return 1;
        }

        Host::Session session(parser.GetApplicationIdentifier(), std::cin, std::cout, spServiceProvider);
        session.Run();
    } catch (Biokey::Exception const& exception) {
        logger->critical(
            "The session was terminated by a {}: {}", Biokey::ToString(exception.GetCode()), exception.what());
        return 1;
    } catch (std::exception const& exception) {
        logger->critical("The session was terminated by an unexpected error: {}", exception.what());
        return 1;
    }

    return 0;
}

//----------------------------------------------------------------------------------------------------------------------
