//----------------------------------------------------------------------------------------------------------------------
// File: CommandGate.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "CommandGate.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::int32_t ExecuteFailureStatus = 127;
constexpr auto PollInterval = std::chrono::milliseconds{ 25 };

[[nodiscard]] bool IsExecutable(std::filesystem::path const& path);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Presence::CommandGate::CommandGate(Options const& options)
    : m_options(options)
    , m_logger(spdlog::get(Logger::Name::Presence.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

Presence::Availability Presence::CommandGate::CheckAvailability()
{
    if (m_options.command.empty() || m_options.command.front().empty()) { return Availability::NotConfigured; }
    if (!m_options.enabled) { return Availability::DisabledByPolicy; }
    if (!ResolveExecutable()) { return Availability::DeviceAbsent; }
    return Availability::Available;
}

//----------------------------------------------------------------------------------------------------------------------

bool Presence::CommandGate::VerifyPresence()
{
    if (auto const availability = CheckAvailability(); availability != Availability::Available) {
        m_logger->warn("Unable to verify presence, the verifier is {}.", ToString(availability));
        return false;
    }

    auto const optExecutable = ResolveExecutable();
    if (!optExecutable) { return false; }

    m_logger->info("Requesting presence verification from {}.", optExecutable->string());
    auto const optStatus = Execute(*optExecutable);
    if (!optStatus) { return false; }

    if (*optStatus != 0) {
        m_logger->warn("The presence verifier refused with exit status {}.", *optStatus);
        return false;
    }

    m_logger->info("Presence has been verified.");
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

Presence::CommandGate::Options const& Presence::CommandGate::GetOptions() const
{
    return m_options;
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::filesystem::path> Presence::CommandGate::ResolveExecutable() const
{
    if (m_options.command.empty()) { return {}; }

    std::filesystem::path const program = m_options.command.front();
    if (program.empty()) { return {}; }

    // Explicit paths are used as provided, bare names are resolved against the search path. 
    if (program.has_parent_path()) {
        if (local::IsExecutable(program)) { return program; }
        return {};
    }

    char const* const pSearchPath = std::getenv("PATH");
    if (!pSearchPath) { return {}; }

    std::string_view remaining = pSearchPath;
    while (!remaining.empty()) {
        auto const seperator = remaining.find(':');
        auto const directory = remaining.substr(0, seperator);
        if (!directory.empty()) {
            auto const candidate = std::filesystem::path{ directory } / program;
            if (local::IsExecutable(candidate)) { return candidate; }
        }
        if (seperator == std::string_view::npos) { break; }
        remaining.remove_prefix(seperator + 1);
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Runs the verifier and waits for its exit status. The child never inherits the channel: its standard 
// input and output are redirected to /dev/null while standard error is left attached for diagnostics. A verifier
// that outlives the configured timeout is killed and reported as having failed.
//----------------------------------------------------------------------------------------------------------------------
std::optional<std::int32_t> Presence::CommandGate::Execute(std::filesystem::path const& executable) const
{
    std::string const program = executable.string();
    std::vector<char*> arguments;
    arguments.reserve(m_options.command.size() + 1);
    for (auto const& argument : m_options.command) { arguments.emplace_back(const_cast<char*>(argument.c_str())); }
    arguments.emplace_back(nullptr);

    pid_t const pid = ::fork();
    if (pid < 0) {
        m_logger->error("Failed to spawn the presence verifier: {}.", std::strerror(errno));
        return {};
    }

    if (pid == 0) {
        if (std::int32_t const devnull = ::open("/dev/null", O_RDWR); devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            if (devnull > STDERR_FILENO) { ::close(devnull); }
        } else {
            ::_exit(local::ExecuteFailureStatus);
        }

        ::execv(program.c_str(), arguments.data());
        ::_exit(local::ExecuteFailureStatus);
    }

    auto const deadline = std::chrono::steady_clock::now() + m_options.timeout;
    while (true) {
        std::int32_t status = 0;
        pid_t const result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            if (WIFEXITED(status)) { return WEXITSTATUS(status); }
            m_logger->warn("The presence verifier terminated abnormally.");
            return {};
        }

        if (result < 0 && errno != EINTR) {
            m_logger->error("Failed to wait on the presence verifier: {}.", std::strerror(errno));
            return {};
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            m_logger->warn("The presence verifier did not respond within {} seconds.", m_options.timeout.count());
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return {};
        }

        std::this_thread::sleep_for(local::PollInterval);
    }
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsExecutable(std::filesystem::path const& path)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) { return false; }
    return ::access(path.c_str(), X_OK) == 0;
}

//----------------------------------------------------------------------------------------------------------------------
