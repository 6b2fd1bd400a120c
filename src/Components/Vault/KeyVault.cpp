//----------------------------------------------------------------------------------------------------------------------
// File: KeyVault.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "KeyVault.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
#include "Utilities/Utf8.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <span>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[noreturn]] void ThrowVaultError(std::string const& reason);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Vault::KeyVault::KeyVault(std::filesystem::path const& root, std::shared_ptr<IKeyProvider> const& spKeyHandle)
    : m_root(root)
    , m_spKeyHandle(spKeyHandle)
    , m_logger(spdlog::get(Logger::Name::Vault.data()))
{
    if (!m_spKeyHandle) {
        throw Biokey::Exception(Biokey::ErrorCode::ConfigurationError, "A key vault requires a key handle!");
    }
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

void Vault::KeyVault::Import(std::string_view userId, std::string_view secret)
{
    auto const path = GetEntryPath(userId);
    if (!FileUtils::CreateFolderIfNoneExist(m_root)) { local::ThrowVaultError("Failed to create the vault directory!"); }

    auto const plaintext = std::span{ reinterpret_cast<std::uint8_t const*>(secret.data()), secret.size() };
    auto const wrapped = m_spKeyHandle->Encrypt(plaintext);
    if (!FileUtils::WriteFileAtomically(path, wrapped)) { local::ThrowVaultError("Failed to write the vault entry!"); }

    m_logger->info("Imported a key for user \"{}\".", userId);
}

//----------------------------------------------------------------------------------------------------------------------

bool Vault::KeyVault::Exists(std::string_view userId) const
{
    auto const path = GetEntryPath(userId);

    std::error_code error;
    bool const exists = std::filesystem::exists(path, error);
    if (error) { local::ThrowVaultError("Failed to access the vault entry!"); }
    return exists;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Vault::KeyVault::Export(std::string_view userId)
{
    auto const path = GetEntryPath(userId);

    auto const optWrapped = FileUtils::ReadFile(path);
    if (!optWrapped) { local::ThrowVaultError("Failed to read the vault entry!"); }

    auto plaintext = m_spKeyHandle->Decrypt(*optWrapped);
    if (!Utf8::IsValid(plaintext)) {
        Security::EraseMemory(plaintext.data(), plaintext.size());
        throw Biokey::Exception(Biokey::ErrorCode::EncodingError, "The recovered key is not valid UTF-8!");
    }

    std::string secret{ plaintext.begin(), plaintext.end() };
    Security::EraseMemory(plaintext.data(), plaintext.size());

    m_logger->info("Exported the key for user \"{}\".", userId);
    return secret;
}

//----------------------------------------------------------------------------------------------------------------------

void Vault::KeyVault::Delete(std::string_view userId)
{
    auto const path = GetEntryPath(userId);

    std::error_code error;
    bool const removed = std::filesystem::remove(path, error);
    if (error) { local::ThrowVaultError("Failed to delete the vault entry!"); }

    if (removed) { m_logger->info("Deleted the key for user \"{}\".", userId); }
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> Vault::KeyVault::List() const
{
    std::vector<std::string> users;

    std::error_code error;
    if (!std::filesystem::is_directory(m_root, error)) { return users; }

    for (auto const& entry : std::filesystem::directory_iterator(m_root, error)) {
        // Hidden files are in flight writes, they are never user entries.
        if (!entry.is_regular_file(error) || FileUtils::IsHiddenFile(entry.path())) { continue; }
        users.emplace_back(entry.path().filename().string());
    }

    if (error) { local::ThrowVaultError("Failed to enumerate the vault directory!"); }

    std::ranges::sort(users);
    return users;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Vault::KeyVault::GetRoot() const
{
    return m_root;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Vault::KeyVault::GetEntryPath(std::string_view userId) const
{
    // Hidden names are reserved for in flight writes.
    if (!FileUtils::IsSinglePathComponent(userId) || userId.front() == '.') {
        local::ThrowVaultError("The user identifier is not valid!");
    }
    return m_root / std::filesystem::path{ userId };
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowVaultError(std::string const& reason)
{
    throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, reason);
}

//----------------------------------------------------------------------------------------------------------------------
