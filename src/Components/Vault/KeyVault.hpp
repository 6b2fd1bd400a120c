//----------------------------------------------------------------------------------------------------------------------
// File: KeyVault.hpp
// Description: A directory of per-user secrets. Each entry is a file named by the user identifier containing the
// secret wrapped by the vault's key handle. Plaintext secrets never touch the disk.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
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

class KeyVault;

//----------------------------------------------------------------------------------------------------------------------
} // Vault namespace
//----------------------------------------------------------------------------------------------------------------------

class Vault::KeyVault
{
public:
    KeyVault(std::filesystem::path const& root, std::shared_ptr<IKeyProvider> const& spKeyHandle);

    KeyVault(KeyVault const&) = delete;
    KeyVault& operator=(KeyVault const&) = delete;

    // Wraps the secret and replaces any existing entry for the user.
    void Import(std::string_view userId, std::string_view secret);

    // Only checks for the entry, the key handle is not invoked.
    [[nodiscard]] bool Exists(std::string_view userId) const;

    // Unwraps the user's secret through the key handle, which may request a presence check. Throws VaultIOError when
    // there is no entry, PresenceDenied or CryptoError from the handle, and EncodingError if the secret is not UTF-8.
    [[nodiscard]] std::string Export(std::string_view userId);

    // Removing an entry that does not exist is not an error.
    void Delete(std::string_view userId);

    [[nodiscard]] std::vector<std::string> List() const;

    [[nodiscard]] std::filesystem::path const& GetRoot() const;

private:
    [[nodiscard]] std::filesystem::path GetEntryPath(std::string_view userId) const;

    std::filesystem::path m_root;
    std::shared_ptr<IKeyProvider> m_spKeyHandle;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
