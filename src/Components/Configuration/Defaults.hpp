//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

std::filesystem::path const FallbackConfigurationFolder = "/etc/";
constexpr std::string_view FolderName = "biokey";
constexpr std::string_view ConfigurationFilename = "config.json";

constexpr std::string_view ApplicationIdentifier = "com.8bit.bitwarden";

constexpr std::string_view VaultFolder = "keys";

constexpr std::string_view KeyName = "biokey";
constexpr std::string_view KeyFolder = "provider";

constexpr bool PresenceEnabled = true;
constexpr auto PresenceTimeout = std::chrono::seconds{ 60 };

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
