//----------------------------------------------------------------------------------------------------------------------
// File: SoftwareKeyProvider.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "SoftwareKeyProvider.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/FileUtils.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <span>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[noreturn]] void ThrowCryptoError(std::string const& reason);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Vault::SoftwareKeyProvider::SoftwareKeyProvider(std::filesystem::path const& directory, std::string_view name)
    : m_name(name)
    , m_path()
    , m_upKey()
    , m_logger(spdlog::get(Logger::Name::Vault.data()))
{
    assert(m_logger);
    m_path = GetKeyPath(directory, name);

    std::error_code error;
    if (std::filesystem::exists(m_path, error)) {
        m_upKey = LoadKey(m_path);
        m_logger->debug("Opened the provider key \"{}\".", m_name);
    } else if (!error) {
        m_logger->info("The provider key \"{}\" does not exist, generating a new key.", m_name);
        CreateKey(directory, name);
        m_upKey = LoadKey(m_path);
    } else {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Unable to access the provider key directory!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Vault::SoftwareKeyProvider::GetName() const
{
    return m_name;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Vault::SoftwareKeyProvider::Encrypt(Security::ReadableView plaintext)
{
    auto const upContext = CreateContext();
    if (EVP_PKEY_encrypt_init(upContext.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(upContext.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_oaep_md(upContext.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(upContext.get(), EVP_sha256()) <= 0) {
        local::ThrowCryptoError("Failed to configure the provider key for encryption!");
    }

    std::size_t size = 0;
    if (EVP_PKEY_encrypt(upContext.get(), nullptr, &size, plaintext.data(), plaintext.size()) <= 0) {
        local::ThrowCryptoError("Failed to size the provider ciphertext!");
    }

    Security::Buffer ciphertext(size, 0x00);
    if (EVP_PKEY_encrypt(upContext.get(), ciphertext.data(), &size, plaintext.data(), plaintext.size()) <= 0) {
        local::ThrowCryptoError("The provider key failed to encrypt the content!");
    }
    ciphertext.resize(size);

    return ciphertext;
}

//----------------------------------------------------------------------------------------------------------------------

Security::Buffer Vault::SoftwareKeyProvider::Decrypt(Security::ReadableView ciphertext)
{
    auto const upContext = CreateContext();
    if (EVP_PKEY_decrypt_init(upContext.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(upContext.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_rsa_oaep_md(upContext.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(upContext.get(), EVP_sha256()) <= 0) {
        local::ThrowCryptoError("Failed to configure the provider key for decryption!");
    }

    std::size_t size = 0;
    if (EVP_PKEY_decrypt(upContext.get(), nullptr, &size, ciphertext.data(), ciphertext.size()) <= 0) {
        local::ThrowCryptoError("Failed to size the provider plaintext!");
    }

    Security::Buffer plaintext(size, 0x00);
    if (EVP_PKEY_decrypt(upContext.get(), plaintext.data(), &size, ciphertext.data(), ciphertext.size()) <= 0) {
        Security::EraseMemory(plaintext.data(), plaintext.size());
        local::ThrowCryptoError("The provider key failed to decrypt the content!");
    }
    plaintext.resize(size);

    return plaintext;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Vault::SoftwareKeyProvider::GetPath() const
{
    return m_path;
}

//----------------------------------------------------------------------------------------------------------------------

bool Vault::SoftwareKeyProvider::IsValidKeyName(std::string_view name)
{
    if (name.empty() || name.size() > MaximumKeyNameSize) { return false; }
    if (name.front() == '.') { return false; }
    return std::ranges::all_of(name, [] (char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '.' || c == '_' || c == '-';
    });
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> Vault::SoftwareKeyProvider::ListKeys(std::filesystem::path const& directory)
{
    std::vector<std::string> keys;

    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) { return keys; }

    for (auto const& entry : std::filesystem::directory_iterator(directory, error)) {
        if (!entry.is_regular_file(error) || entry.path().extension() != KeyExtension) { continue; }
        auto const name = entry.path().stem().string();
        if (IsValidKeyName(name)) { keys.emplace_back(name); }
    }

    if (error) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Failed to enumerate the provider keys!");
    }

    std::ranges::sort(keys);
    return keys;
}

//----------------------------------------------------------------------------------------------------------------------

void Vault::SoftwareKeyProvider::CreateKey(std::filesystem::path const& directory, std::string_view name)
{
    auto const path = GetKeyPath(directory, name);
    if (!FileUtils::CreateFolderIfNoneExist(directory)) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Failed to create the provider key directory!");
    }

    StoreKey(path, GenerateKey());
}

//----------------------------------------------------------------------------------------------------------------------

bool Vault::SoftwareKeyProvider::DeleteKey(std::filesystem::path const& directory, std::string_view name)
{
    auto const path = GetKeyPath(directory, name);

    std::error_code error;
    bool const removed = std::filesystem::remove(path, error);
    if (error) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Failed to delete the provider key!");
    }

    return removed;
}

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path Vault::SoftwareKeyProvider::GetKeyPath(
    std::filesystem::path const& directory, std::string_view name)
{
    if (!IsValidKeyName(name)) {
        throw Biokey::Exception(Biokey::ErrorCode::ConfigurationError, "The provider key name is not valid!");
    }

    return directory / (std::string{ name } + std::string{ KeyExtension });
}

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::KeyPair Vault::SoftwareKeyProvider::GenerateKey()
{
    auto const upContext = Security::OpenSSL::KeyPairContext{ EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr) };
    if (!upContext) { local::ThrowCryptoError("Failed to create the provider key generation context!"); }

    if (EVP_PKEY_keygen_init(upContext.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(upContext.get(), static_cast<std::int32_t>(KeyBits)) <= 0) {
        local::ThrowCryptoError("Failed to configure the provider key generation!");
    }

    EVP_PKEY* pKey = nullptr;
    if (EVP_PKEY_generate(upContext.get(), &pKey) <= 0) {
        local::ThrowCryptoError("Failed to generate the provider key!");
    }

    return Security::OpenSSL::KeyPair{ pKey };
}

//----------------------------------------------------------------------------------------------------------------------

void Vault::SoftwareKeyProvider::StoreKey(std::filesystem::path const& path, Security::OpenSSL::KeyPair const& upKey)
{
    auto const upBio = Security::OpenSSL::BasicInputOutput{ BIO_new(BIO_s_secmem()) };
    if (!upBio) { local::ThrowCryptoError("Failed to allocate the provider key encoder!"); }

    if (PEM_write_bio_PrivateKey(upBio.get(), upKey.get(), nullptr, nullptr, 0, nullptr, nullptr) <= 0) {
        local::ThrowCryptoError("Failed to encode the provider key!");
    }

    char* pData = nullptr;
    long const size = BIO_get_mem_data(upBio.get(), &pData);
    if (size <= 0 || !pData) { local::ThrowCryptoError("Failed to encode the provider key!"); }

    auto const encoded = std::span{ reinterpret_cast<std::uint8_t const*>(pData), static_cast<std::size_t>(size) };
    if (!FileUtils::WriteFileAtomically(path, encoded)) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Failed to write the provider key!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::KeyPair Vault::SoftwareKeyProvider::LoadKey(std::filesystem::path const& path)
{
    auto optEncoded = FileUtils::ReadFile(path);
    if (!optEncoded) {
        throw Biokey::Exception(Biokey::ErrorCode::VaultIOError, "Failed to read the provider key!");
    }

    auto const upBio = Security::OpenSSL::BasicInputOutput{ 
        BIO_new_mem_buf(optEncoded->data(), static_cast<std::int32_t>(optEncoded->size())) };
    if (!upBio) { local::ThrowCryptoError("Failed to allocate the provider key decoder!"); }

    Security::OpenSSL::KeyPair upKey{ PEM_read_bio_PrivateKey(upBio.get(), nullptr, nullptr, nullptr) };
    Security::EraseMemory(optEncoded->data(), optEncoded->size());
    if (!upKey) { local::ThrowCryptoError("Failed to decode the provider key!"); }

    if (EVP_PKEY_is_a(upKey.get(), "RSA") != 1) { local::ThrowCryptoError("The provider key is not an RSA key!"); }

    return upKey;
}

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::KeyPairContext Vault::SoftwareKeyProvider::CreateContext() const
{
    auto upContext = Security::OpenSSL::KeyPairContext{ EVP_PKEY_CTX_new_from_pkey(nullptr, m_upKey.get(), nullptr) };
    if (!upContext) { local::ThrowCryptoError("Failed to create a provider key context!"); }
    return upContext;
}

//----------------------------------------------------------------------------------------------------------------------

void local::ThrowCryptoError(std::string const& reason)
{
    throw Biokey::Exception(Biokey::ErrorCode::CryptoError, reason);
}

//----------------------------------------------------------------------------------------------------------------------
