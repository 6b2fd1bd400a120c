//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/program_options.hpp>
#include <spdlog/common.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Startup {
//----------------------------------------------------------------------------------------------------------------------

enum class ParseCode : std::uint32_t { Malformed, ExitRequested, Success };

class Options;

//----------------------------------------------------------------------------------------------------------------------
} // Startup namespace
//----------------------------------------------------------------------------------------------------------------------

class Startup::Options
{
public:
    static constexpr std::string_view Help = "help";
    static constexpr std::string_view Version = "version";
    static constexpr std::string_view Verbosity = "verbosity";
    static constexpr std::string_view Quiet = "quiet";
    static constexpr std::string_view ConfigurationFilepath = "config";
    static constexpr std::string_view Arguments = "arguments";

    // Browsers launch a native messaging host with the calling extension's origin as the first argument.
    static constexpr std::string_view ExtensionOriginPrefix = "chrome-extension://";

    Options();

    [[nodiscard]] ParseCode Parse(std::int32_t argc, char const* const* argv);

    [[nodiscard]] std::string GenerateHelpText(std::string_view program) const;
    [[nodiscard]] std::string GenerateVersionText(std::string_view program) const;

    [[nodiscard]] spdlog::level::level_enum GetVerbosity() const;
    [[nodiscard]] bool IsQuiet() const;
    [[nodiscard]] std::filesystem::path const& GetConfigPath() const;
    [[nodiscard]] bool IsHostInvocation() const;
    [[nodiscard]] std::vector<std::string> const& GetArguments() const;

private:
    using VerbosityLevels = std::vector<std::pair<std::string, spdlog::level::level_enum>>;

    void SetupDescriptions();

    boost::program_options::options_description m_descriptions;
    boost::program_options::options_description m_hidden;
    boost::program_options::positional_options_description m_positional;
    boost::program_options::variables_map m_options;
    VerbosityLevels m_levels;

    spdlog::level::level_enum m_verbosity;
    bool m_quiet;
    std::filesystem::path m_configurationFilepath;
    std::vector<std::string> m_arguments;
};

//----------------------------------------------------------------------------------------------------------------------
