//----------------------------------------------------------------------------------------------------------------------
// File: Parser.cpp 
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Parser.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Vault/SoftwareKeyProvider.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/PrettyPrinter.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <cstdlib>
#include <span>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename SectionType>
[[nodiscard]] Configuration::DeserializationResult MergeSection(boost::json::object const& json, SectionType& section);

[[nodiscard]] std::optional<std::string> GetEnvironmentValue(std::string_view name);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: JSON Schema. 
// Note: Every section is optional. A missing section or field takes its default value, and the defaults are written
// back only when the file is created.
//----------------------------------------------------------------------------------------------------------------------
// "version": String,
// "application": {
//     "identifier": Optional String
// },
// "vault": {
//     "directory": Optional String
// },
// "key": {
//     "name": Optional String,
//     "directory": Optional String
// },
// "presence": {
//     "command": Optional [String],
//     "enabled": Optional Boolean,
//     "timeout": Optional Integer
// }
//----------------------------------------------------------------------------------------------------------------------

Configuration::Parser::Parser(std::filesystem::path const& filepath)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_filepath(filepath)
    , m_version(Biokey::Version)
    , m_application()
    , m_vault()
    , m_key()
    , m_presence()
    , m_optVaultOverride()
    , m_optKeyNameOverride()
    , m_validated(false)
    , m_changed(false)
{
    assert(m_logger);
    // If the filepath names a directory, attach the default config.json
    if (!m_filepath.has_filename()) { m_filepath = m_filepath / Defaults::ConfigurationFilename; }
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::FetchOptions()
{
    if (auto const status = ProcessFile(); status.first != StatusCode::Success) { return status; } 
    if (auto const status = ApplyEnvironmentOverrides(); status.first != StatusCode::Success) { return status; } 
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    // A newly created set of defaults is written out so the operator has a file to edit.
    if (m_changed) {
        auto const status = Serialize(); 
        if (status.first != StatusCode::Success) {
            m_logger->error("Failed to update configuration file at: {}! Reason: {}", m_filepath.string(), status.second);
        }
        return status;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::SerializationResult Configuration::Parser::Serialize()
{
    if (auto const status = ValidateOptions(); status.first != StatusCode::Success) { return status; }

    if (!FileUtils::CreateFolderIfNoneExist(GetBaseFolder())) {
        return { StatusCode::FileError, "Failed to create the configuration folder." };
    }

    boost::json::object json;
    json[VersionSymbol] = m_version;

    if (auto const status = m_application.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_vault.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_key.Write(json); status.first != StatusCode::Success) { return status; } 
    if (auto const status = m_presence.Write(json); status.first != StatusCode::Success) { return status; } 

    auto const serialized = JSON::PrettyPrinter{}.Format(json);
    auto const content = std::span{ reinterpret_cast<std::uint8_t const*>(serialized.data()), serialized.size() };
    if (!FileUtils::WriteFileAtomically(m_filepath, content)) {
        return { StatusCode::FileError, "Failed to write the configuration file." };
    }

    m_changed = false; // On success, reset the changed flag to indicate all changes have been processed. 
    m_logger->debug("Wrote configuration file at: {}.", m_filepath.string());

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Configuration::Parser::GetFilepath() const { return m_filepath; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetVersion() const { return m_version; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetApplicationIdentifier() const { return m_application.GetIdentifier(); }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetVaultDirectory() const
{
    if (m_optVaultOverride) { return *m_optVaultOverride; }
    return m_vault.GetDirectory(GetBaseFolder());
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Configuration::Parser::GetKeyName() const
{
    if (m_optKeyNameOverride) { return *m_optKeyNameOverride; }
    return m_key.GetName();
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetKeyDirectory() const { return m_key.GetDirectory(GetBaseFolder()); }

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Configuration::Parser::GetPresenceCommand() const { return m_presence.GetCommand(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::IsPresenceEnabled() const { return m_presence.IsEnabled(); }

//----------------------------------------------------------------------------------------------------------------------

std::chrono::seconds Configuration::Parser::GetPresenceTimeout() const { return m_presence.GetTimeout(); }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Validated() const { return m_validated; }

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Parser::Changed() const { return m_changed; }

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ProcessFile()
{
    std::error_code error;
    bool const found = std::filesystem::exists(m_filepath, error);
    if (error) { return { StatusCode::FileError, "Failed to access the configuration file." }; }

    if (found) {
        m_logger->debug("Reading configuration file at: {}.", m_filepath.string());
        return Deserialize();
    }

    // Without an existing file the defaults are used and marked for serialization.
    m_logger->info("No configuration file found at: {}. Creating one with default values.", m_filepath.string());
    m_changed = true;
    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::Deserialize()
{
    auto const optContent = FileUtils::ReadFile(m_filepath);
    if (!optContent) [[unlikely]] {
        return { StatusCode::FileError, "Failed to open configuration file for reading." };
    }

    if (optContent->empty()) {
        return { StatusCode::DecodeError, "The configuration file is empty." };
    }

    if (optContent->size() > Defaults::FileSizeLimit) {
        return { StatusCode::FileError, "The configuration file exceeds the maximum allowable size." };
    }

    boost::json::parse_options options;
    options.allow_comments = true;
    options.allow_trailing_commas = true;

    std::string_view const serialized{ reinterpret_cast<char const*>(optContent->data()), optContent->size() };

    boost::json::error_code error;
    auto const json = boost::json::parse(serialized, error, boost::json::storage_ptr{}, options);
    if (error) {
        return { StatusCode::DecodeError, "Failed to read the configuration file as valid JSON." };
    }

    auto const pObject = json.if_object();
    if (!pObject) {
        return { StatusCode::DecodeError, "The configuration file must contain a JSON object." };
    }

    // Required field parsing.
    if (auto const itr = pObject->find(VersionSymbol); itr != pObject->end()) {
        auto const pVersion = itr->value().if_string();
        if (!pVersion) {
            return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", VersionSymbol) };
        }

        if (pVersion->empty()) {
            return { StatusCode::InputError, CreateInvalidValueMessage(VersionSymbol) };
        }
        m_version.assign(pVersion->data(), pVersion->size());
    } else {
        return { StatusCode::DecodeError, CreateMissingFieldMessage(VersionSymbol) };
    }

    if (auto const status = local::MergeSection(*pObject, m_application); status.first != StatusCode::Success) {
        return status;
    }

    if (auto const status = local::MergeSection(*pObject, m_vault); status.first != StatusCode::Success) {
        return status;
    }

    if (auto const status = local::MergeSection(*pObject, m_key); status.first != StatusCode::Success) {
        return status;
    }

    if (auto const status = local::MergeSection(*pObject, m_presence); status.first != StatusCode::Success) {
        return status;
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Parser::ApplyEnvironmentOverrides()
{
    m_optVaultOverride.reset();
    m_optKeyNameOverride.reset();

    if (auto optDirectory = local::GetEnvironmentValue(VaultDirectoryVariable); optDirectory) {
        m_logger->debug("Using the vault directory from {}.", VaultDirectoryVariable);
        m_optVaultOverride = std::filesystem::path{ std::move(*optDirectory) };
    }

    if (auto optName = local::GetEnvironmentValue(KeyNameVariable); optName) {
        if (!::Vault::SoftwareKeyProvider::IsValidKeyName(*optName)) {
            return {
                StatusCode::InputError,
                fmt::format("The {} environment variable does not contain a valid key name.", KeyNameVariable)
            };
        }
        m_logger->debug("Using the key name from {}.", KeyNameVariable);
        m_optKeyNameOverride = std::move(*optName);
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Parser::ValidateOptions()
{
    m_validated = false; // Explicitly disable the validation result in case anything fails. 

    if (auto const status = m_application.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_vault.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_key.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }
    if (auto const status = m_presence.AreOptionsAllowable(); status.first != StatusCode::Success) { return status; }

    m_validated = true;

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Configuration::Parser::GetBaseFolder() const
{
    auto folder = m_filepath.parent_path();
    if (folder.empty()) { folder = "."; }
    return folder;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename SectionType>
Configuration::DeserializationResult local::MergeSection(boost::json::object const& json, SectionType& section)
{
    using namespace Configuration;

    auto const itr = json.find(SectionType::GetFieldName());
    if (itr == json.end()) { return { StatusCode::Success, "" }; }

    auto const pSection = itr->value().if_object();
    if (!pSection) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("object", SectionType::GetFieldName()) };
    }

    return section.Merge(*pSection);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> local::GetEnvironmentValue(std::string_view name)
{
    auto const pValue = std::getenv(name.data());
    if (!pValue || *pValue == '\0') { return {}; }
    return std::string{ pValue };
}

//----------------------------------------------------------------------------------------------------------------------
