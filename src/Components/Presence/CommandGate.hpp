//----------------------------------------------------------------------------------------------------------------------
// File: CommandGate.hpp
// Description: A presence gate backed by an operator configured verifier program (for example a fingerprint or polkit
// prompt helper). The verifier confirms presence by exiting with a zero status.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Availability.hpp"
#include "Interfaces/PresenceGate.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Presence {
//----------------------------------------------------------------------------------------------------------------------

class CommandGate;

//----------------------------------------------------------------------------------------------------------------------
} // Presence namespace
//----------------------------------------------------------------------------------------------------------------------

class Presence::CommandGate : public IPresenceGate
{
public:
    struct Options
    {
        std::vector<std::string> command;
        bool enabled = true;
        std::chrono::seconds timeout = std::chrono::seconds{ 60 };
    };

    explicit CommandGate(Options const& options);

    // IPresenceGate {
    [[nodiscard]] Availability CheckAvailability() override;
    [[nodiscard]] bool VerifyPresence() override;
    // } IPresenceGate

    [[nodiscard]] Options const& GetOptions() const;

private:
    [[nodiscard]] std::optional<std::filesystem::path> ResolveExecutable() const;
    [[nodiscard]] std::optional<std::int32_t> Execute(std::filesystem::path const& executable) const;

    Options m_options;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
