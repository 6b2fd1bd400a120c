//----------------------------------------------------------------------------------------------------------------------
// File: StartupOptions.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Options.hpp"
#include "Utilities/Version.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
//----------------------------------------------------------------------------------------------------------------------
#include <sys/ioctl.h>
#include <unistd.h>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::uint32_t GetTerminalWidth();

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Startup::Options::Options()
    : m_descriptions()
    , m_hidden()
    , m_positional()
    , m_options()
    , m_levels()
    , m_verbosity(spdlog::level::info)
    , m_quiet(false)
    , m_configurationFilepath()
    , m_arguments()
{
    SetupDescriptions();
}

//----------------------------------------------------------------------------------------------------------------------

void Startup::Options::SetupDescriptions()
{
    std::uint32_t const width = local::GetTerminalWidth();
    boost::program_options::options_description general("General Options", width);
    auto AddGeneralOption = general.add_options();

    AddGeneralOption(Help.data(), "Display this help text and exit.");
    AddGeneralOption(Version.data(), "Display the version information and exit.");

    // Option to set the log verbosity level.
    {
        m_levels = {
            { "trace", spdlog::level::trace },
            { "debug", spdlog::level::debug },
            { "info", spdlog::level::info },
            { "warning", spdlog::level::warn },
            { "error", spdlog::level::err },
            { "critical", spdlog::level::critical },
            { "none", spdlog::level::off },
        };
        
        std::ostringstream oss;
        oss << "Sets the maximum log level for the diagnostic output on stderr. ";
        oss << "Options: [";
        std::size_t idx = 0;
        for (auto const& [name, value] : m_levels) {
            oss << name << ((++idx < m_levels.size()) ? ", " : "");
        }
        oss << "]";
        AddGeneralOption(
            Verbosity.data(),
            boost::program_options::value<std::string>()->value_name("<level>")->default_value("info"),
            oss.str().c_str());
    }

    // Option to disable diagnostic output.
    {
        AddGeneralOption(
            Quiet.data(),
            boost::program_options::bool_switch()->default_value(false),
            "Disables all diagnostic output. Command results and errors are still reported.");
    }

    m_descriptions.add(general);

    boost::program_options::options_description configuration("Configuration Options", width);
    auto AddConfigurationOption = configuration.add_options();

    // Option to set the configuration filepath.
    {
        auto const filepath = Configuration::GetDefaultConfigurationFilepath();
        std::ostringstream oss;
        oss << "Set the configuration filepath. If a directory is specified \"config.json\" is assumed. ";
        oss << "A missing file is created with the default options.";
        AddConfigurationOption(
            ConfigurationFilepath.data(),
            boost::program_options::value<std::string>()->value_name("<filepath>")->default_value(
                filepath.string()), oss.str().c_str());
    }

    m_descriptions.add(configuration);

    m_hidden.add_options()(Arguments.data(), boost::program_options::value<std::vector<std::string>>());
    m_positional.add(Arguments.data(), -1);
}

//----------------------------------------------------------------------------------------------------------------------

Startup::ParseCode Startup::Options::Parse(std::int32_t argc, char const* const* argv)
{
    constexpr auto IsOptionSupplied = [] (
        boost::program_options::variables_map const& options,
        std::string_view option) -> bool
    {
        return options.count(option.data()) && !options[option.data()].defaulted();
    };

    constexpr auto CheckConflictingOptions = [] (
        boost::program_options::variables_map const& options,
        std::string_view left,
        std::string_view right) -> std::optional<std::string>
    {
        if (options.count(left.data()) && !options[left.data()].defaulted() && 
            options.count(right.data()) && !options[right.data()].defaulted()) {
            std::ostringstream oss;
            oss << "Conflicting options '" << left << "' and '" << right << "'.";
            return oss.str();
        }
        return {};
    };

    std::string_view const program = (argc > 0 && argv[0]) ? argv[0] : Biokey::Name;

    // The browser owns stdout while the host is running, all parsing errors are written to stderr. 
    try {
        boost::program_options::options_description all;
        all.add(m_descriptions).add(m_hidden);

        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv)
                .options(all)
                .positional(m_positional)
                .run(),
            m_options);
        boost::program_options::notify(m_options);
    } catch (std::exception const& exception) {
        std::cerr << "An error occurred parsing startup options due to: " << exception.what() << "." << std::endl;
        return ParseCode::Malformed;
    }

    if (m_options.count(Arguments.data())) {
        m_arguments = m_options[Arguments.data()].as<std::vector<std::string>>();
    }

    m_configurationFilepath = m_options[ConfigurationFilepath.data()].as<std::string>();

    if (!IsHostInvocation() && IsOptionSupplied(m_options, Help)) {
        std::cout << GenerateHelpText(program) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (!IsHostInvocation() && IsOptionSupplied(m_options, Version)) {
        std::cout << GenerateVersionText(program) << std::endl;
        return ParseCode::ExitRequested;
    }

    if (auto const optError = CheckConflictingOptions(m_options, Verbosity, Quiet); optError) {
        std::cerr << *optError << std::endl;
        return ParseCode::Malformed;
    }

    if (IsOptionSupplied(m_options, Verbosity)) {
        auto const& argument = m_options[Verbosity.data()].as<std::string>();
        auto const itr = std::ranges::find_if(m_levels, [&argument] (auto const& item) -> bool {
            return (argument == item.first);
        });

        if (itr == m_levels.end()) {
            std::cerr << "Unrecognized verbosity level!" << std::endl;
            return ParseCode::Malformed;
        }

        m_verbosity = itr->second;
    }

    if (m_options[Quiet.data()].as<bool>()) {
        m_quiet = true;
        m_verbosity = spdlog::level::off;
    }

    if (m_configurationFilepath.empty()) { 
        std::cerr << "The configuration filepath cannot be empty." << std::endl;
        return ParseCode::Malformed;
    }

    if (IsHostInvocation()) { return ParseCode::Success; }

    if (m_arguments.empty()) {
        std::cerr << "No command was provided. See --" << Help << " for usage." << std::endl;
        return ParseCode::Malformed;
    }

    return ParseCode::Success;
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateHelpText(std::string_view program) const
{   
    std::ostringstream oss;
    std::string const name = std::filesystem::path(program).stem().string();
    oss << "Usage: " << name << " [options] <command> [arguments]\n\n";
    oss << "Commands:\n";
    oss << "  chrome-extension://<id>/   Run the native messaging host over stdin and stdout.\n";
    oss << "  list                       List the users with a stored key.\n";
    oss << "  import <user> <key>        Store a key for the user, replacing any existing key.\n";
    oss << "  export <user>              Print the user's key. Requires a presence check.\n";
    oss << "  delete <user>              Remove the user's key.\n";
    oss << "  check <user>               Report whether a key is stored for the user.\n";
    oss << "  status                     Report the availability of the presence check.\n";
    oss << "  key list                   List the provider keys.\n";
    oss << "  key create <name>          Create or replace a provider key.\n";
    oss << "  key delete <name>          Delete a provider key.\n\n";
    oss << m_descriptions;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Startup::Options::GenerateVersionText(std::string_view program) const
{   
    std::ostringstream oss;
    std::string const name = std::filesystem::path(program).stem().string();
    oss << name << " (" << Biokey::Name << ") " << Biokey::Version;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

spdlog::level::level_enum Startup::Options::GetVerbosity() const { return m_verbosity; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::IsQuiet() const { return m_quiet; }

//----------------------------------------------------------------------------------------------------------------------

std::filesystem::path const& Startup::Options::GetConfigPath() const { return m_configurationFilepath; }

//----------------------------------------------------------------------------------------------------------------------

bool Startup::Options::IsHostInvocation() const
{
    return !m_arguments.empty() && m_arguments.front().starts_with(ExtensionOriginPrefix);
}

//----------------------------------------------------------------------------------------------------------------------

std::vector<std::string> const& Startup::Options::GetArguments() const { return m_arguments; }

//----------------------------------------------------------------------------------------------------------------------

std::uint32_t local::GetTerminalWidth()
{
    constexpr std::uint32_t DefaultWidth = 80;
    struct winsize size{};
    if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &size) != 0 || size.ws_col < DefaultWidth) { return DefaultWidth; }
    return static_cast<std::uint32_t>(size.ws_col);
}

//----------------------------------------------------------------------------------------------------------------------
