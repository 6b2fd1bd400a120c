//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description: The sections of the configuration file. Each section merges its values from a decoded JSON object,
// writes them back, and checks that the values it holds are allowable.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StatusCode.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/object.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::filesystem::path GetDefaultBiokeyFolder();
[[nodiscard]] std::filesystem::path GetDefaultConfigurationFilepath();

//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Application;
class Vault;
class Key;
class Presence;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The identity announced to the browser when the host connects.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Application
{
public:
    static constexpr std::string_view Symbol = "application";
    static constexpr std::string_view IdentifierSymbol = "identifier";
    static constexpr std::size_t IdentifierSizeLimit = 256;

    Application();

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetIdentifier() const;
    [[nodiscard]] bool SetIdentifier(std::string_view identifier);

private:
    std::string m_identifier;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The location of the per-user vault entries. Relative directories are resolved against the folder
// containing the configuration file.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Vault
{
public:
    static constexpr std::string_view Symbol = "vault";
    static constexpr std::string_view DirectorySymbol = "directory";

    Vault();

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::filesystem::path GetDirectory(std::filesystem::path const& base) const;
    void SetDirectory(std::filesystem::path const& directory);

private:
    std::optional<std::filesystem::path> m_optDirectory;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The provider key used to wrap vault entries at rest.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Key
{
public:
    static constexpr std::string_view Symbol = "key";
    static constexpr std::string_view NameSymbol = "name";
    static constexpr std::string_view DirectorySymbol = "directory";

    Key();

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::string const& GetName() const;
    [[nodiscard]] std::filesystem::path GetDirectory(std::filesystem::path const& base) const;

    [[nodiscard]] bool SetName(std::string_view name);
    void SetDirectory(std::filesystem::path const& directory);

private:
    std::string m_name;
    std::optional<std::filesystem::path> m_optDirectory;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The external verifier used to confirm the user is present.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Presence
{
public:
    static constexpr std::string_view Symbol = "presence";
    static constexpr std::string_view CommandSymbol = "command";
    static constexpr std::string_view EnabledSymbol = "enabled";
    static constexpr std::string_view TimeoutSymbol = "timeout";

    static constexpr std::int64_t MinimumTimeout = 1;
    static constexpr std::int64_t MaximumTimeout = 600;

    Presence();

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] SerializationResult Write(boost::json::object& json) const;
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] std::vector<std::string> const& GetCommand() const;
    [[nodiscard]] bool IsEnabled() const;
    [[nodiscard]] std::chrono::seconds GetTimeout() const;

    void SetCommand(std::vector<std::string> command);
    void SetEnabled(bool enabled);
    void SetTimeout(std::chrono::seconds timeout);

private:
    std::vector<std::string> m_command;
    bool m_enabled;
    std::chrono::seconds m_timeout;
};

//----------------------------------------------------------------------------------------------------------------------
