//----------------------------------------------------------------------------------------------------------------------
// File: Logger.hpp
// Description: Named spdlog loggers used by the host. The inter-process channel owns stdout, so every sink attached
// here writes to stderr.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Logger {
//----------------------------------------------------------------------------------------------------------------------

void Initialize(spdlog::level::level_enum verbosity, bool useConsoleSink = true);

//----------------------------------------------------------------------------------------------------------------------
namespace Name {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "core";
constexpr std::string_view Channel = "channel";
constexpr std::string_view Vault = "vault";
constexpr std::string_view Presence = "presence";

//----------------------------------------------------------------------------------------------------------------------
} // Name namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Pattern {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Prefix = "==";
constexpr std::string_view TagOpen = "[";
constexpr std::string_view TagClose = "]";
constexpr std::string_view TagSeperator = " ";
constexpr std::string_view Date = "[%a, %d %b %Y %T]";
constexpr std::string_view Message = "%^[%l] - %v%$";

std::string Generate(std::string_view color, std::string_view tag);

//----------------------------------------------------------------------------------------------------------------------
} // Pattern namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Color {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Core = "\x1b[1;38;2;0;255;175m";
constexpr std::string_view Channel = "\x1b[1;38;2;0;195;255m";
constexpr std::string_view Vault = "\x1b[1;38;2;255;175;0m";
constexpr std::string_view Presence = "\x1b[1;38;2;200;120;255m";

constexpr spdlog::string_view_t Info = "\x1b[38;2;26;204;148m";
constexpr spdlog::string_view_t Warn = "\x1b[38;2;255;214;102m";
constexpr spdlog::string_view_t Error = "\x1b[38;2;255;56;56m";
constexpr spdlog::string_view_t Critical = "\x1b[1;38;2;255;56;56m";
constexpr spdlog::string_view_t Debug = "\x1b[38;2;45;204;255m";
constexpr spdlog::string_view_t Trace = "\x1b[38;2;255;255;255m";

constexpr std::string_view Reset = "\x1b[0m";

std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> CreateTrueColorConsole();

//----------------------------------------------------------------------------------------------------------------------
} // Color namespace
} // Logger namespace
//----------------------------------------------------------------------------------------------------------------------

inline void Logger::Initialize(spdlog::level::level_enum verbosity, bool useConsoleSink)
{
    constexpr std::array<std::pair<std::string_view, std::string_view>, 4> Loggers = {{
        { Name::Core, Color::Core },
        { Name::Channel, Color::Channel },
        { Name::Vault, Color::Vault },
        { Name::Presence, Color::Presence },
    }};

    for (auto const& [name, color] : Loggers) {
        if (spdlog::get(name.data())) { continue; } // Loggers may only be registered once per process. 

        std::shared_ptr<spdlog::logger> spLogger;
        if (useConsoleSink) {
            spLogger = std::make_shared<spdlog::logger>(name.data(), Color::CreateTrueColorConsole());
        } else {
            spLogger = std::make_shared<spdlog::logger>(name.data(), std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        spLogger->set_pattern(Pattern::Generate(color, name));
        spdlog::register_logger(spLogger);
    }

    spdlog::set_level(verbosity);
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string Logger::Pattern::Generate(std::string_view color, std::string_view tag)
{
    std::ostringstream oss;
    oss << Prefix << TagSeperator << Date << TagSeperator;
    oss << TagOpen << color << tag << Color::Reset << TagClose << TagSeperator;
    oss << Message;
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------

inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> Logger::Color::CreateTrueColorConsole()
{
    auto spColorSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    spColorSink->set_color_mode(spdlog::color_mode::automatic);
    spColorSink->set_color(spdlog::level::info, Color::Info);
    spColorSink->set_color(spdlog::level::warn, Color::Warn);
    spColorSink->set_color(spdlog::level::err, Color::Error);
    spColorSink->set_color(spdlog::level::critical, Color::Critical);
    spColorSink->set_color(spdlog::level::debug, Color::Debug);
    spColorSink->set_color(spdlog::level::trace, Color::Trace);

    return spColorSink;
}

//----------------------------------------------------------------------------------------------------------------------
