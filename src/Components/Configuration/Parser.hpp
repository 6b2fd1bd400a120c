//----------------------------------------------------------------------------------------------------------------------
// File: Parser.hpp
// Description: Reads, validates, and writes the host configuration file. Environment overrides are applied on top of
// the file values and are never written back.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

class Parser;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

class Configuration::Parser final
{
public:
    static constexpr std::string_view VersionSymbol = "version";
    static constexpr std::string_view VaultDirectoryVariable = "BIOKEY_VAULT_DIR";
    static constexpr std::string_view KeyNameVariable = "BIOKEY_KEY_NAME";

    explicit Parser(std::filesystem::path const& filepath);

    [[nodiscard]] DeserializationResult FetchOptions();
    [[nodiscard]] SerializationResult Serialize();

    [[nodiscard]] std::filesystem::path const& GetFilepath() const;
    [[nodiscard]] std::string const& GetVersion() const;
    [[nodiscard]] std::string const& GetApplicationIdentifier() const;
    [[nodiscard]] std::filesystem::path GetVaultDirectory() const;
    [[nodiscard]] std::string const& GetKeyName() const;
    [[nodiscard]] std::filesystem::path GetKeyDirectory() const;
    [[nodiscard]] std::vector<std::string> const& GetPresenceCommand() const;
    [[nodiscard]] bool IsPresenceEnabled() const;
    [[nodiscard]] std::chrono::seconds GetPresenceTimeout() const;

    [[nodiscard]] bool Validated() const;
    [[nodiscard]] bool Changed() const;

private:
    [[nodiscard]] DeserializationResult ProcessFile();
    [[nodiscard]] DeserializationResult Deserialize();
    [[nodiscard]] DeserializationResult ApplyEnvironmentOverrides();
    [[nodiscard]] ValidationResult ValidateOptions();

    [[nodiscard]] std::filesystem::path GetBaseFolder() const;

    std::shared_ptr<spdlog::logger> m_logger;

    std::filesystem::path m_filepath;
    std::string m_version;

    Options::Application m_application;
    Options::Vault m_vault;
    Options::Key m_key;
    Options::Presence m_presence;

    std::optional<std::filesystem::path> m_optVaultOverride;
    std::optional<std::string> m_optKeyNameOverride;

    bool m_validated;
    bool m_changed;
};

//----------------------------------------------------------------------------------------------------------------------
