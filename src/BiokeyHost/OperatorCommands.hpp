//----------------------------------------------------------------------------------------------------------------------
// File: OperatorCommands.hpp
// Description: The command line surface used by an operator to manage the vault and the provider keys outside of a 
// browser session. Results are written to the output stream and failures to the error stream.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IPresenceGate;
namespace spdlog { class logger; }
namespace Vault { class KeyVault; }

//----------------------------------------------------------------------------------------------------------------------
namespace Host {
//----------------------------------------------------------------------------------------------------------------------

class OperatorCommands;

//----------------------------------------------------------------------------------------------------------------------
} // Host namespace
//----------------------------------------------------------------------------------------------------------------------

class Host::OperatorCommands final
{
public:
    // The vault is opened on first use so the key lifecycle commands never provision a provider key.
    using VaultFactory = std::function<std::shared_ptr<Vault::KeyVault>()>;

    struct Dependencies
    {
        VaultFactory createKeyVault;
        std::shared_ptr<IPresenceGate> spPresenceGate;
        std::filesystem::path keyDirectory;
    };

    static constexpr std::int32_t Success = 0;
    static constexpr std::int32_t Failure = 1;

    OperatorCommands(Dependencies const& dependencies, std::ostream& output, std::ostream& error);

    // Returns the process exit status for the command.
    [[nodiscard]] std::int32_t Execute(std::vector<std::string> const& arguments);

private:
    using Arguments = std::vector<std::string>;

    [[nodiscard]] std::int32_t OnList();
    [[nodiscard]] std::int32_t OnImport(std::string_view userId, std::string_view key);
    [[nodiscard]] std::int32_t OnExport(std::string_view userId);
    [[nodiscard]] std::int32_t OnDelete(std::string_view userId);
    [[nodiscard]] std::int32_t OnCheck(std::string_view userId);
    [[nodiscard]] std::int32_t OnStatus();
    [[nodiscard]] std::int32_t OnKeyCommand(Arguments const& arguments);

    [[nodiscard]] std::shared_ptr<Vault::KeyVault> GetKeyVault();
    [[nodiscard]] std::int32_t OnUsageError(std::string_view reason);

    Dependencies m_dependencies;
    std::shared_ptr<Vault::KeyVault> m_spKeyVault;
    std::ostream& m_output;
    std::ostream& m_error;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
