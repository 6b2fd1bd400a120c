//----------------------------------------------------------------------------------------------------------------------
#include "Components/Configuration/Defaults.hpp"
#include "Components/Configuration/Options.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

class TemporaryDirectory;
class ScopedVariable;

void WriteFile(std::filesystem::path const& filepath, std::string_view content);
[[nodiscard]] std::string ReadFile(std::filesystem::path const& filepath);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view ConfiguredFile = R"({
    // The browser's native messaging manifest name.
    "version": "0.1.0",
    "application": { "identifier": "com.example.password-manager" },
    "vault": { "directory": "entries" },
    "key": { "name": "workstation", "directory": "/var/lib/biokey/provider" },
    "presence": {
        "command": [ "/usr/bin/fprintd-verify", "--finger", "right-index-finger" ],
        "enabled": false,
        "timeout": 15,
    },
})";

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class local::TemporaryDirectory
{
public:
    TemporaryDirectory()
        : m_path()
    {
        std::random_device device;
        m_path = std::filesystem::temp_directory_path() / 
            ("biokey-configuration-" + std::to_string(device()) + std::to_string(device()));
        std::filesystem::create_directories(m_path);
    }

    ~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
    }

    TemporaryDirectory(TemporaryDirectory const&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

    [[nodiscard]] std::filesystem::path const& GetPath() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//----------------------------------------------------------------------------------------------------------------------

// Sets or clears an environment variable for the lifetime of the instance.
class local::ScopedVariable
{
public:
    ScopedVariable(std::string_view name, std::optional<std::string_view> optValue)
        : m_name(name)
        , m_optPrevious()
    {
        if (auto const pPrevious = std::getenv(m_name.c_str()); pPrevious) { m_optPrevious = pPrevious; }
        if (optValue) {
            ::setenv(m_name.c_str(), std::string{ *optValue }.c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

    ~ScopedVariable()
    {
        if (m_optPrevious) {
            ::setenv(m_name.c_str(), m_optPrevious->c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

    ScopedVariable(ScopedVariable const&) = delete;
    ScopedVariable& operator=(ScopedVariable const&) = delete;

private:
    std::string m_name;
    std::optional<std::string> m_optPrevious;
};

//----------------------------------------------------------------------------------------------------------------------

class ConfigurationParserSuite : public testing::Test
{
protected:
    ConfigurationParserSuite()
        : m_directory()
        , m_vaultVariable(Configuration::Parser::VaultDirectoryVariable, std::nullopt)
        , m_keyNameVariable(Configuration::Parser::KeyNameVariable, std::nullopt)
    {
    }

    [[nodiscard]] std::filesystem::path GetFilepath() const
    {
        return m_directory.GetPath() / Configuration::Defaults::ConfigurationFilename;
    }

    local::TemporaryDirectory m_directory;
    local::ScopedVariable m_vaultVariable;
    local::ScopedVariable m_keyNameVariable;
};

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationFilepathSuite, GenerateConfigurationFilepathTest)
{
    {
        local::ScopedVariable const xdg{ "XDG_CONFIG_HOME", "/tmp/xdg" };
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        EXPECT_EQ(filepath, std::filesystem::path{ "/tmp/xdg/biokey/config.json" });
    }

    {
        local::ScopedVariable const xdg{ "XDG_CONFIG_HOME", std::nullopt };
        local::ScopedVariable const home{ "HOME", "/home/operator" };
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        EXPECT_EQ(filepath, std::filesystem::path{ "/home/operator/.config/biokey/config.json" });
    }

    {
        local::ScopedVariable const xdg{ "XDG_CONFIG_HOME", std::nullopt };
        local::ScopedVariable const home{ "HOME", std::nullopt };
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        EXPECT_EQ(filepath, std::filesystem::path{ "/etc/biokey/config.json" });
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, FileGenerationTest)
{
    using namespace std::chrono_literals;

    Configuration::Parser parser(GetFilepath());
    EXPECT_FALSE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
    EXPECT_FALSE(std::filesystem::exists(parser.GetFilepath()));

    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());
    EXPECT_TRUE(std::filesystem::exists(parser.GetFilepath()));

    // Verify the default options are set the the expected values. 
    EXPECT_EQ(parser.GetVersion(), Biokey::Version);
    EXPECT_EQ(parser.GetApplicationIdentifier(), Configuration::Defaults::ApplicationIdentifier);
    EXPECT_EQ(parser.GetVaultDirectory(), m_directory.GetPath() / Configuration::Defaults::VaultFolder);
    EXPECT_EQ(parser.GetKeyName(), Configuration::Defaults::KeyName);
    EXPECT_EQ(parser.GetKeyDirectory(), m_directory.GetPath() / Configuration::Defaults::KeyFolder);
    EXPECT_TRUE(parser.GetPresenceCommand().empty());
    EXPECT_EQ(parser.IsPresenceEnabled(), Configuration::Defaults::PresenceEnabled);
    EXPECT_EQ(parser.GetPresenceTimeout(), 60s);

    // The generated file should decode to the same options.
    auto const content = local::ReadFile(parser.GetFilepath());
    Configuration::Parser checker(GetFilepath());
    EXPECT_EQ(checker.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(checker.Validated());
    EXPECT_FALSE(checker.Changed());
    EXPECT_EQ(local::ReadFile(checker.GetFilepath()), content); // An existing file should not be rewritten.

    EXPECT_EQ(checker.GetVersion(), parser.GetVersion());
    EXPECT_EQ(checker.GetApplicationIdentifier(), parser.GetApplicationIdentifier());
    EXPECT_EQ(checker.GetVaultDirectory(), parser.GetVaultDirectory());
    EXPECT_EQ(checker.GetKeyName(), parser.GetKeyName());
    EXPECT_EQ(checker.GetKeyDirectory(), parser.GetKeyDirectory());
    EXPECT_EQ(checker.GetPresenceCommand(), parser.GetPresenceCommand());
    EXPECT_EQ(checker.IsPresenceEnabled(), parser.IsPresenceEnabled());
    EXPECT_EQ(checker.GetPresenceTimeout(), parser.GetPresenceTimeout());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, DirectoryFilepathTest)
{
    Configuration::Parser parser(m_directory.GetPath() / "nested" / "");
    EXPECT_EQ(parser.GetFilepath(), m_directory.GetPath() / "nested" / Configuration::Defaults::ConfigurationFilename);

    // Missing folders are created along with the file. 
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(std::filesystem::exists(parser.GetFilepath()));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseGoodFileTest)
{
    using namespace std::chrono_literals;
    local::WriteFile(GetFilepath(), test::ConfiguredFile);

    Configuration::Parser parser(GetFilepath());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());
    EXPECT_FALSE(parser.Changed());

    EXPECT_EQ(parser.GetVersion(), "0.1.0");
    EXPECT_EQ(parser.GetApplicationIdentifier(), "com.example.password-manager");
    EXPECT_EQ(parser.GetVaultDirectory(), m_directory.GetPath() / "entries"); // Relative to the configuration file.
    EXPECT_EQ(parser.GetKeyName(), "workstation");
    EXPECT_EQ(parser.GetKeyDirectory(), std::filesystem::path{ "/var/lib/biokey/provider" });
    EXPECT_EQ(parser.GetPresenceCommand(), 
        (std::vector<std::string>{ "/usr/bin/fprintd-verify", "--finger", "right-index-finger" }));
    EXPECT_FALSE(parser.IsPresenceEnabled());
    EXPECT_EQ(parser.GetPresenceTimeout(), 15s);

    EXPECT_EQ(local::ReadFile(GetFilepath()), test::ConfiguredFile);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, SerializeTest)
{
    local::WriteFile(GetFilepath(), test::ConfiguredFile);

    Configuration::Parser parser(GetFilepath());
    ASSERT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(parser.Serialize().first, Configuration::StatusCode::Success);

    auto const json = boost::json::parse(local::ReadFile(GetFilepath())).as_object();
    EXPECT_EQ(json.at("version").as_string(), "0.1.0");
    EXPECT_EQ(json.at("vault").as_object().at("directory").as_string(), "entries");
    EXPECT_EQ(json.at("key").as_object().at("name").as_string(), "workstation");
    EXPECT_EQ(json.at("presence").as_object().at("command").as_array().size(), std::size_t{ 3 });
    EXPECT_FALSE(json.at("presence").as_object().at("enabled").as_bool());
    EXPECT_EQ(json.at("presence").as_object().at("timeout").to_number<std::int64_t>(), 15);

    Configuration::Parser checker(GetFilepath());
    EXPECT_EQ(checker.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(checker.GetVaultDirectory(), parser.GetVaultDirectory());
    EXPECT_EQ(checker.GetKeyDirectory(), parser.GetKeyDirectory());
    EXPECT_EQ(checker.GetPresenceCommand(), parser.GetPresenceCommand());
    EXPECT_EQ(checker.GetPresenceTimeout(), parser.GetPresenceTimeout());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, PartialFileTest)
{
    using namespace std::chrono_literals;
    constexpr std::string_view content = R"({ "version": "0.1.0", "presence": { "timeout": 5 } })";
    local::WriteFile(GetFilepath(), content);

    Configuration::Parser parser(GetFilepath());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_TRUE(parser.Validated());

    // Every missing section and field takes its default value.
    EXPECT_EQ(parser.GetApplicationIdentifier(), Configuration::Defaults::ApplicationIdentifier);
    EXPECT_EQ(parser.GetVaultDirectory(), m_directory.GetPath() / Configuration::Defaults::VaultFolder);
    EXPECT_EQ(parser.GetKeyName(), Configuration::Defaults::KeyName);
    EXPECT_TRUE(parser.IsPresenceEnabled());
    EXPECT_EQ(parser.GetPresenceTimeout(), 5s);

    EXPECT_EQ(local::ReadFile(GetFilepath()), content);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, ParseMalformedFileTest)
{
    std::string const identifier(Configuration::Options::Application::IdentifierSizeLimit + 1, 'a');

    std::vector<std::pair<std::string, Configuration::StatusCode>> const files = {
        { "", Configuration::StatusCode::DecodeError },
        { "{ \"version\": ", Configuration::StatusCode::DecodeError },
        { "[ \"version\" ]", Configuration::StatusCode::DecodeError },
        { "{}", Configuration::StatusCode::DecodeError },
        { R"({ "version": 1 })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "" })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "application": "identifier" })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "application": { "identifier": "" } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "application": { "identifier": ")" + identifier + "\" } }", 
            Configuration::StatusCode::InputError },
        { R"({ "version": "1", "vault": [] })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "vault": { "directory": 7 } })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "vault": { "directory": "" } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "key": { "name": 7 } })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "key": { "name": "../escape" } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "key": { "name": ".hidden" } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "presence": { "command": "fprintd-verify" } })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "presence": { "command": [ "verify", "" ] } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "presence": { "command": [ 1 ] } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "presence": { "enabled": "yes" } })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "presence": { "timeout": 1.5 } })", Configuration::StatusCode::DecodeError },
        { R"({ "version": "1", "presence": { "timeout": 0 } })", Configuration::StatusCode::InputError },
        { R"({ "version": "1", "presence": { "timeout": 601 } })", Configuration::StatusCode::InputError },
    };

    for (auto const& [content, expected] : files) {
        local::WriteFile(GetFilepath(), content);

        Configuration::Parser parser(GetFilepath());
        auto const [status, message] = parser.FetchOptions();
        EXPECT_EQ(status, expected) << content;
        EXPECT_FALSE(message.empty()) << content;
        EXPECT_FALSE(parser.Validated());
        EXPECT_FALSE(parser.Changed());
        EXPECT_EQ(local::ReadFile(GetFilepath()), content); // A rejected file should never be overwritten.
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, OversizedFileTest)
{
    std::string content = R"({ "version": "1", "application": { "identifier": "x" }, "padding": ")";
    content.append(Configuration::Defaults::FileSizeLimit, ' ');
    content.append("\" }");
    local::WriteFile(GetFilepath(), content);

    Configuration::Parser parser(GetFilepath());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::FileError);
    EXPECT_FALSE(parser.Validated());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, EnvironmentOverrideTest)
{
    local::ScopedVariable const vault{ Configuration::Parser::VaultDirectoryVariable, "/srv/biokey/vault" };
    local::ScopedVariable const key{ Configuration::Parser::KeyNameVariable, "backup" };

    Configuration::Parser parser(GetFilepath());
    EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
    EXPECT_EQ(parser.GetVaultDirectory(), std::filesystem::path{ "/srv/biokey/vault" });
    EXPECT_EQ(parser.GetKeyName(), "backup");
    EXPECT_EQ(parser.GetKeyDirectory(), m_directory.GetPath() / Configuration::Defaults::KeyFolder);

    // The overrides are never persisted to the generated file.
    auto const json = boost::json::parse(local::ReadFile(GetFilepath())).as_object();
    EXPECT_FALSE(json.at("vault").as_object().contains("directory"));
    EXPECT_EQ(json.at("key").as_object().at("name").as_string(), Configuration::Defaults::KeyName);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(ConfigurationParserSuite, EnvironmentOverridePrecedenceTest)
{
    local::WriteFile(GetFilepath(), test::ConfiguredFile);

    {
        local::ScopedVariable const key{ Configuration::Parser::KeyNameVariable, "override" };
        Configuration::Parser parser(GetFilepath());
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
        EXPECT_EQ(parser.GetKeyName(), "override");
        EXPECT_EQ(parser.GetVaultDirectory(), m_directory.GetPath() / "entries");
    }

    {
        // An empty variable is treated as unset.
        local::ScopedVariable const vault{ Configuration::Parser::VaultDirectoryVariable, "" };
        Configuration::Parser parser(GetFilepath());
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::Success);
        EXPECT_EQ(parser.GetVaultDirectory(), m_directory.GetPath() / "entries");
        EXPECT_EQ(parser.GetKeyName(), "workstation");
    }

    {
        local::ScopedVariable const key{ Configuration::Parser::KeyNameVariable, "../escape" };
        Configuration::Parser parser(GetFilepath());
        EXPECT_EQ(parser.FetchOptions().first, Configuration::StatusCode::InputError);
        EXPECT_FALSE(parser.Validated());
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, PresenceBoundsTest)
{
    using namespace std::chrono_literals;

    Configuration::Options::Presence presence;
    EXPECT_EQ(presence.AreOptionsAllowable().first, Configuration::StatusCode::Success);

    presence.SetTimeout(0s);
    EXPECT_EQ(presence.AreOptionsAllowable().first, Configuration::StatusCode::InputError);

    presence.SetTimeout(601s);
    EXPECT_EQ(presence.AreOptionsAllowable().first, Configuration::StatusCode::InputError);

    presence.SetTimeout(600s);
    EXPECT_EQ(presence.AreOptionsAllowable().first, Configuration::StatusCode::Success);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ConfigurationOptionsSuite, IdentifierAndKeyNameTest)
{
    Configuration::Options::Application application;
    EXPECT_FALSE(application.SetIdentifier(""));
    EXPECT_FALSE(application.SetIdentifier(std::string(Configuration::Options::Application::IdentifierSizeLimit + 1, 'a')));
    EXPECT_EQ(application.GetIdentifier(), Configuration::Defaults::ApplicationIdentifier);
    EXPECT_TRUE(application.SetIdentifier("com.example.vault"));
    EXPECT_EQ(application.GetIdentifier(), "com.example.vault");

    Configuration::Options::Key key;
    EXPECT_FALSE(key.SetName(""));
    EXPECT_FALSE(key.SetName("nested/name"));
    EXPECT_EQ(key.GetName(), Configuration::Defaults::KeyName);
    EXPECT_TRUE(key.SetName("workstation-2"));
    EXPECT_EQ(key.GetName(), "workstation-2");

    key.SetDirectory("relative");
    EXPECT_EQ(key.GetDirectory("/base"), std::filesystem::path{ "/base/relative" });
    key.SetDirectory("/absolute");
    EXPECT_EQ(key.GetDirectory("/base"), std::filesystem::path{ "/absolute" });
}

//----------------------------------------------------------------------------------------------------------------------

void local::WriteFile(std::filesystem::path const& filepath, std::string_view content)
{
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) { throw std::runtime_error("Failed to write the test configuration file!"); }
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::ReadFile(std::filesystem::path const& filepath)
{
    std::ifstream file(filepath, std::ios::binary);
    return std::string{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
}

//----------------------------------------------------------------------------------------------------------------------
