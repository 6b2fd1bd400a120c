//----------------------------------------------------------------------------------------------------------------------
// File: FileUtils.hpp
// Description: Filesystem helpers for the owner-only directories and files kept by the host.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace FileUtils {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool CreateFolderIfNoneExist(std::filesystem::path const& path);
[[nodiscard]] bool WriteFileAtomically(std::filesystem::path const& path, std::span<std::uint8_t const> content);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> ReadFile(std::filesystem::path const& path);
[[nodiscard]] bool IsSinglePathComponent(std::string_view name);
[[nodiscard]] bool IsHiddenFile(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // FileUtils namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Function: CreateFolderIfNoneExist
// Description: Creates the provided directory (and any missing parents). A newly created leaf is restricted to the
// owner. Returns true when the directory exists on return.
//----------------------------------------------------------------------------------------------------------------------
inline bool FileUtils::CreateFolderIfNoneExist(std::filesystem::path const& path)
{
    std::error_code error;
    if (std::filesystem::is_directory(path, error)) { return true; }

    std::filesystem::create_directories(path, error);
    if (error) { return false; }

    std::filesystem::permissions(path, std::filesystem::perms::owner_all, error);
    return !error;
}

//----------------------------------------------------------------------------------------------------------------------
// Function: WriteFileAtomically
// Description: Writes the content to a hidden sibling file readable only by the owner and renames it over the
// destination. A reader never observes a partially written file.
//----------------------------------------------------------------------------------------------------------------------
inline bool FileUtils::WriteFileAtomically(std::filesystem::path const& path, std::span<std::uint8_t const> content)
{
    static std::atomic_uint32_t counter = 0;

    auto const name = "." + path.filename().string() + ".tmp." + std::to_string(::getpid()) + "." + 
        std::to_string(counter++);
    auto const temporary = path.parent_path() / name;

    std::error_code error;
    {
        std::ofstream writer(temporary, std::ios::binary | std::ios::trunc);
        if (!writer.is_open()) { return false; }
        std::filesystem::permissions(
            temporary, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write, error);
        writer.write(reinterpret_cast<char const*>(content.data()), static_cast<std::streamsize>(content.size()));
        writer.flush();
        if (!writer.good() || error) {
            writer.close();
            std::filesystem::remove(temporary, error);
            return false;
        }
    }

    std::filesystem::rename(temporary, path, error);
    if (error) {
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        return false;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> FileUtils::ReadFile(std::filesystem::path const& path)
{
    std::ifstream reader(path, std::ios::binary);
    if (!reader.is_open()) { return {}; }

    std::vector<std::uint8_t> content{ std::istreambuf_iterator<char>(reader), std::istreambuf_iterator<char>() };
    if (reader.bad()) { return {}; }
    return content;
}

//----------------------------------------------------------------------------------------------------------------------
// Function: IsSinglePathComponent
// Description: Identifiers used as file names must not be able to escape their parent directory.
//----------------------------------------------------------------------------------------------------------------------
inline bool FileUtils::IsSinglePathComponent(std::string_view name)
{
    if (name.empty() || name == "." || name == "..") { return false; }
    return name.find_first_of(std::string_view{ "/\\\0", 3 }) == std::string_view::npos;
}

//----------------------------------------------------------------------------------------------------------------------

inline bool FileUtils::IsHiddenFile(std::filesystem::path const& path)
{
    auto const filename = path.filename().string();
    return !filename.empty() && filename.front() == '.';
}

//----------------------------------------------------------------------------------------------------------------------
