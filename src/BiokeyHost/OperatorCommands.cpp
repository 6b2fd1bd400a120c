//----------------------------------------------------------------------------------------------------------------------
// File: OperatorCommands.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "OperatorCommands.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Presence/Availability.hpp"
#include "Components/Vault/KeyVault.hpp"
#include "Components/Vault/SoftwareKeyProvider.hpp"
#include "Interfaces/PresenceGate.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <ostream>
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace symbols {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view List = "list";
constexpr std::string_view Import = "import";
constexpr std::string_view Export = "export";
constexpr std::string_view Delete = "delete";
constexpr std::string_view Check = "check";
constexpr std::string_view Status = "status";
constexpr std::string_view Key = "key";
constexpr std::string_view Create = "create";

//----------------------------------------------------------------------------------------------------------------------
} // symbols namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Host::OperatorCommands::OperatorCommands(Dependencies const& dependencies, std::ostream& output, std::ostream& error)
    : m_dependencies(dependencies)
    , m_spKeyVault()
    , m_output(output)
    , m_error(error)
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::Execute(std::vector<std::string> const& arguments)
{
    if (arguments.empty()) { return OnUsageError("No command was provided."); }

    auto const& command = arguments.front();
    auto const HasArguments = [&arguments] (std::size_t expected) { return arguments.size() == expected + 1; };

    try {
        if (command == symbols::List && HasArguments(0)) { return OnList(); }
        if (command == symbols::Import && HasArguments(2)) { return OnImport(arguments[1], arguments[2]); }
        if (command == symbols::Export && HasArguments(1)) { return OnExport(arguments[1]); }
        if (command == symbols::Delete && HasArguments(1)) { return OnDelete(arguments[1]); }
        if (command == symbols::Check && HasArguments(1)) { return OnCheck(arguments[1]); }
        if (command == symbols::Status && HasArguments(0)) { return OnStatus(); }
        if (command == symbols::Key) { return OnKeyCommand(arguments); }
    } catch (Biokey::Exception const& exception) {
        m_error << "Failed to " << command << ": " << exception.what() << std::endl;
        m_logger->debug("The \"{}\" command failed with {}.", command, Biokey::ToString(exception.GetCode()));
        return Failure;
    } catch (std::exception const& exception) {
        m_error << "Failed to " << command << ": " << exception.what() << std::endl;
        return Failure;
    }

    return OnUsageError("Unrecognized command \"" + command + "\" or incorrect number of arguments.");
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnList()
{
    auto const users = GetKeyVault()->List();
    if (users.empty()) {
        m_output << "No keys found." << std::endl;
        return Success;
    }

    for (auto const& user : users) { m_output << "Key: " << user << std::endl; }
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnImport(std::string_view userId, std::string_view key)
{
    GetKeyVault()->Import(userId, key);
    m_output << "Key imported successfully." << std::endl;
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnExport(std::string_view userId)
{
    auto const key = GetKeyVault()->Export(userId);
    m_output << key << std::endl;
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnDelete(std::string_view userId)
{
    GetKeyVault()->Delete(userId);
    m_output << "Key deleted successfully." << std::endl;
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnCheck(std::string_view userId)
{
    if (GetKeyVault()->Exists(userId)) {
        m_output << "Key exists." << std::endl;
    } else {
        m_output << "Key does not exist." << std::endl;
    }
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnStatus()
{
    if (!m_dependencies.spPresenceGate) { throw std::runtime_error("No presence gate is available"); }

    auto const availability = m_dependencies.spPresenceGate->CheckAvailability();
    m_output << "Presence: " << Presence::ToString(availability) 
             << " (status " << Presence::ToStatusCode(availability) << ")" << std::endl;
    return Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnKeyCommand(Arguments const& arguments)
{
    auto const& directory = m_dependencies.keyDirectory;
    if (arguments.size() == 2 && arguments[1] == symbols::List) {
        auto const keys = Vault::SoftwareKeyProvider::ListKeys(directory);
        if (keys.empty()) {
            m_output << "No provider keys found." << std::endl;
            return Success;
        }

        for (auto const& key : keys) { m_output << "Key: " << key << std::endl; }
        return Success;
    }

    if (arguments.size() == 3 && arguments[1] == symbols::Create) {
        Vault::SoftwareKeyProvider::CreateKey(directory, arguments[2]);
        m_output << "Provider key '" << arguments[2] << "' created successfully." << std::endl;
        return Success;
    }

    if (arguments.size() == 3 && arguments[1] == symbols::Delete) {
        if (!Vault::SoftwareKeyProvider::DeleteKey(directory, arguments[2])) {
            m_error << "Provider key '" << arguments[2] << "' does not exist." << std::endl;
            return Failure;
        }
        m_output << "Provider key '" << arguments[2] << "' deleted successfully." << std::endl;
        return Success;
    }

    return OnUsageError("Expected \"key list\", \"key create <name>\", or \"key delete <name>\".");
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Vault::KeyVault> Host::OperatorCommands::GetKeyVault()
{
    if (!m_spKeyVault) {
        if (!m_dependencies.createKeyVault) { throw std::runtime_error("No key vault is available"); }
        m_spKeyVault = m_dependencies.createKeyVault();
        if (!m_spKeyVault) { throw std::runtime_error("The key vault could not be opened"); }
    }
    return m_spKeyVault;
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Host::OperatorCommands::OnUsageError(std::string_view reason)
{
    m_error << reason << " See --help for usage." << std::endl;
    return Failure;
}

//----------------------------------------------------------------------------------------------------------------------
