//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
#include "Components/Vault/SoftwareKeyProvider.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdlib>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::filesystem::path ResolveDirectory(
    std::optional<std::filesystem::path> const& optDirectory,
    std::filesystem::path const& base,
    std::string_view fallback);

[[nodiscard]] Configuration::DeserializationResult ReadDirectory(
    boost::json::object const& json,
    std::string_view section,
    std::optional<std::filesystem::path>& optDirectory);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultBiokeyFolder()
{
    std::string filepath = Defaults::FallbackConfigurationFolder.string(); // Set the filepath root to /etc/ by default

    // Attempt to get the $XDG_CONFIG_HOME environment variable to use as the configuration directory
    // If $XDG_CONFIG_HOME does not exist try to get the user home directory 
    if (auto const pConfigHome = std::getenv("XDG_CONFIG_HOME"); pConfigHome && *pConfigHome != '\0') {
        filepath = pConfigHome;
    } else if (auto const pUserHome = std::getenv("HOME"); pUserHome && *pUserHome != '\0') {
        filepath = std::string{ pUserHome } + "/.config";
    }

    return std::filesystem::path{ filepath } / Defaults::FolderName;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::GetDefaultConfigurationFilepath()
{
    return GetDefaultBiokeyFolder() / Defaults::ConfigurationFilename; // ../config.json
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Application::Application()
    : m_identifier(Defaults::ApplicationIdentifier)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Application::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "application": {
    //     "identifier": Optional String
    // },
    if (auto const itr = json.find(IdentifierSymbol); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", Symbol, IdentifierSymbol) };
        }

        if (!SetIdentifier(itr->value().get_string())) {
            return {
                StatusCode::InputError,
                CreateExceededCharacterLimitMessage(IdentifierSizeLimit, Symbol, IdentifierSymbol)
            };
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Application::Write(boost::json::object& json) const
{
    json[Symbol] = boost::json::object{ { IdentifierSymbol, m_identifier } };
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Application::AreOptionsAllowable() const
{
    if (m_identifier.empty() || m_identifier.size() > IdentifierSizeLimit) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, IdentifierSymbol) };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Application::GetIdentifier() const { return m_identifier; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Application::SetIdentifier(std::string_view identifier)
{
    if (identifier.empty() || identifier.size() > IdentifierSizeLimit) { return false; }
    m_identifier = identifier;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Vault::Vault()
    : m_optDirectory()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Vault::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "vault": {
    //     "directory": Optional String
    // },
    return local::ReadDirectory(json, Symbol, m_optDirectory);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Vault::Write(boost::json::object& json) const
{
    boost::json::object section;
    if (m_optDirectory) { section[DirectorySymbol] = m_optDirectory->string(); }
    json[Symbol] = std::move(section);
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Vault::AreOptionsAllowable() const
{
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Options::Vault::GetDirectory(std::filesystem::path const& base) const
{
    return local::ResolveDirectory(m_optDirectory, base, Defaults::VaultFolder);
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Vault::SetDirectory(std::filesystem::path const& directory)
{
    m_optDirectory = directory;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Key::Key()
    : m_name(Defaults::KeyName)
    , m_optDirectory()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Key::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "key": {
    //     "name": Optional String,
    //     "directory": Optional String
    // },
    if (auto const itr = json.find(NameSymbol); itr != json.end()) {
        if (!itr->value().is_string()) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", Symbol, NameSymbol) };
        }

        if (!SetName(itr->value().get_string())) {
            return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, NameSymbol) };
        }
    }

    return local::ReadDirectory(json, Symbol, m_optDirectory);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Key::Write(boost::json::object& json) const
{
    boost::json::object section;
    section[NameSymbol] = m_name;
    if (m_optDirectory) { section[DirectorySymbol] = m_optDirectory->string(); }
    json[Symbol] = std::move(section);
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Key::AreOptionsAllowable() const
{
    if (!::Vault::SoftwareKeyProvider::IsValidKeyName(m_name)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(Symbol, NameSymbol) };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Options::Key::GetName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Options::Key::GetDirectory(std::filesystem::path const& base) const
{
    return local::ResolveDirectory(m_optDirectory, base, Defaults::KeyFolder);
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Key::SetName(std::string_view name)
{
    if (!::Vault::SoftwareKeyProvider::IsValidKeyName(name)) { return false; }
    m_name = name;
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Key::SetDirectory(std::filesystem::path const& directory)
{
    m_optDirectory = directory;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Presence::Presence()
    : m_command()
    , m_enabled(Defaults::PresenceEnabled)
    , m_timeout(Defaults::PresenceTimeout)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Presence::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "presence": {
    //     "command": Optional [String],
    //     "enabled": Optional Boolean,
    //     "timeout": Optional Integer
    // },
    if (auto const itr = json.find(CommandSymbol); itr != json.end()) {
        auto const pArray = itr->value().if_array();
        if (!pArray) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("array", Symbol, CommandSymbol) };
        }

        std::vector<std::string> command;
        command.reserve(pArray->size());
        for (std::size_t idx = 0; idx < pArray->size(); ++idx) {
            auto const pArgument = (*pArray)[idx].if_string();
            if (!pArgument || pArgument->empty()) {
                return { StatusCode::InputError, CreateInvalidValueInArrayMessage(idx, Symbol, CommandSymbol) };
            }
            command.emplace_back(pArgument->data(), pArgument->size());
        }
        m_command = std::move(command);
    }

    if (auto const itr = json.find(EnabledSymbol); itr != json.end()) {
        auto const pEnabled = itr->value().if_bool();
        if (!pEnabled) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("boolean", Symbol, EnabledSymbol) };
        }
        m_enabled = *pEnabled;
    }

    if (auto const itr = json.find(TimeoutSymbol); itr != json.end()) {
        auto const pTimeout = itr->value().if_int64();
        if (!pTimeout) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("integer", Symbol, TimeoutSymbol) };
        }

        if (*pTimeout < MinimumTimeout || *pTimeout > MaximumTimeout) {
            return {
                StatusCode::InputError,
                CreateValueOutOfRangeMessage(MinimumTimeout, MaximumTimeout, Symbol, TimeoutSymbol)
            };
        }
        m_timeout = std::chrono::seconds{ *pTimeout };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Options::Presence::Write(boost::json::object& json) const
{
    boost::json::array command;
    for (auto const& argument : m_command) { command.emplace_back(std::string_view{ argument }); }

    json[Symbol] = boost::json::object{
        { CommandSymbol, std::move(command) },
        { EnabledSymbol, m_enabled },
        { TimeoutSymbol, m_timeout.count() }
    };

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Presence::AreOptionsAllowable() const
{
    if (m_timeout.count() < MinimumTimeout || m_timeout.count() > MaximumTimeout) {
        return {
            StatusCode::InputError,
            CreateValueOutOfRangeMessage(MinimumTimeout, MaximumTimeout, Symbol, TimeoutSymbol)
        };
    }
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Configuration::Options::Presence::GetCommand() const { return m_command; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Presence::IsEnabled() const { return m_enabled; }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::seconds Configuration::Options::Presence::GetTimeout() const { return m_timeout; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Presence::SetCommand(std::vector<std::string> command) { m_command = std::move(command); }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Presence::SetEnabled(bool enabled) { m_enabled = enabled; }

//----------------------------------------------------------------------------------------------------------------------

void Configuration::Options::Presence::SetTimeout(std::chrono::seconds timeout) { m_timeout = timeout; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path local::ResolveDirectory(
    std::optional<std::filesystem::path> const& optDirectory,
    std::filesystem::path const& base,
    std::string_view fallback)
{
    if (!optDirectory) { return base / fallback; }
    if (optDirectory->is_relative()) { return base / *optDirectory; }
    return *optDirectory;
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult local::ReadDirectory(
    boost::json::object const& json,
    std::string_view section,
    std::optional<std::filesystem::path>& optDirectory)
{
    using namespace Configuration;
    constexpr std::string_view DirectorySymbol = "directory";

    if (auto const itr = json.find(DirectorySymbol); itr != json.end()) {
        auto const pDirectory = itr->value().if_string();
        if (!pDirectory) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", section, DirectorySymbol) };
        }

        if (pDirectory->empty()) {
            return { StatusCode::InputError, CreateInvalidValueMessage(section, DirectorySymbol) };
        }
        optDirectory = std::filesystem::path{ std::string{ pDirectory->data(), pDirectory->size() } };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
