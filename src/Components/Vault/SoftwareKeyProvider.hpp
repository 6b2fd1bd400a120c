//----------------------------------------------------------------------------------------------------------------------
// File: SoftwareKeyProvider.hpp
// Description: A key provider holding an RSA-2048 key in an owner only PEM file. Vault entries are wrapped with 
// RSA-OAEP using SHA-256. The key is generated the first time a provider name is opened.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/OpenSSLHandles.hpp"
#include "Components/Security/SecurityTypes.hpp"
#include "Interfaces/KeyProvider.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Vault {
//----------------------------------------------------------------------------------------------------------------------

class SoftwareKeyProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Vault namespace
//----------------------------------------------------------------------------------------------------------------------

class Vault::SoftwareKeyProvider : public IKeyProvider
{
public:
    static constexpr std::size_t KeyBits = 2048;
    static constexpr std::size_t MaximumKeyNameSize = 64;
    static constexpr std::string_view KeyExtension = ".pem";

    // Opens the named key, generating it if absent. Throws ConfigurationError for an invalid name and CryptoError or
    // VaultIOError when the key can not be loaded or created.
    SoftwareKeyProvider(std::filesystem::path const& directory, std::string_view name);

    // IKeyProvider {
    [[nodiscard]] std::string_view GetName() const override;
    [[nodiscard]] Security::Buffer Encrypt(Security::ReadableView plaintext) override;
    [[nodiscard]] Security::Buffer Decrypt(Security::ReadableView ciphertext) override;
    // } IKeyProvider

    [[nodiscard]] std::filesystem::path const& GetPath() const;

    [[nodiscard]] static bool IsValidKeyName(std::string_view name);
    [[nodiscard]] static std::vector<std::string> ListKeys(std::filesystem::path const& directory);
    static void CreateKey(std::filesystem::path const& directory, std::string_view name);
    [[nodiscard]] static bool DeleteKey(std::filesystem::path const& directory, std::string_view name);

private:
    [[nodiscard]] static std::filesystem::path GetKeyPath(std::filesystem::path const& directory, std::string_view name);
    [[nodiscard]] static Security::OpenSSL::KeyPair GenerateKey();
    static void StoreKey(std::filesystem::path const& path, Security::OpenSSL::KeyPair const& upKey);
    [[nodiscard]] static Security::OpenSSL::KeyPair LoadKey(std::filesystem::path const& path);

    [[nodiscard]] Security::OpenSSL::KeyPairContext CreateContext() const;

    std::string m_name;
    std::filesystem::path m_path;
    Security::OpenSSL::KeyPair m_upKey;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
