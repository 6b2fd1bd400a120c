//----------------------------------------------------------------------------------------------------------------------
#include "Components/Presence/CommandGate.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Shell = "/bin/sh";

[[nodiscard]] Presence::CommandGate::Options CreateShellOptions(std::string const& script);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, NotConfiguredTest)
{
    {
        Presence::CommandGate gate{ Presence::CommandGate::Options{} };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::NotConfigured);
        EXPECT_FALSE(gate.VerifyPresence());
    }

    {
        Presence::CommandGate gate{ Presence::CommandGate::Options{ .command = { "" } } };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::NotConfigured);
        EXPECT_FALSE(gate.VerifyPresence());
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, DisabledByPolicyTest)
{
    auto options = test::CreateShellOptions("exit 0");
    options.enabled = false;

    Presence::CommandGate gate{ options };
    EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::DisabledByPolicy);
    EXPECT_FALSE(gate.VerifyPresence()); // The verifier must not be consulted while disabled.
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, DeviceAbsentTest)
{
    {
        Presence::CommandGate gate{ Presence::CommandGate::Options{ .command = { "/nonexistent/biokey-verifier" } } };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::DeviceAbsent);
        EXPECT_FALSE(gate.VerifyPresence());
    }

    {
        Presence::CommandGate gate{ Presence::CommandGate::Options{ .command = { "biokey-verifier-not-on-path" } } };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::DeviceAbsent);
    }

    {
        // A directory is not an executable verifier.
        Presence::CommandGate gate{ Presence::CommandGate::Options{ .command = { "/tmp" } } };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::DeviceAbsent);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, ConfirmedTest)
{
    Presence::CommandGate gate{ test::CreateShellOptions("exit 0") };
    EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::Available);
    EXPECT_TRUE(gate.VerifyPresence());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, RefusedTest)
{
    Presence::CommandGate gate{ test::CreateShellOptions("exit 1") };
    EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::Available);
    EXPECT_FALSE(gate.VerifyPresence());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, ArgumentsTest)
{
    // The configured arguments are passed through verbatim, including the program name.
    Presence::CommandGate gate{ Presence::CommandGate::Options{
        .command = { std::string{ test::Shell }, "-c", "test \"$0\" = fingerprint && test \"$1\" = --user", 
            "fingerprint", "--user" } } };
    EXPECT_TRUE(gate.VerifyPresence());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, DetachedFromChannelTest)
{
    // The verifier's standard input is not the host's channel.
    Presence::CommandGate gate{ test::CreateShellOptions("test ! -t 0 && read line; test -z \"$line\"") };
    EXPECT_TRUE(gate.VerifyPresence());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, SearchPathTest)
{
    char const* const pSearchPath = std::getenv("PATH");
    std::optional<std::string> const optPreviousPath = pSearchPath ? std::optional<std::string>{ pSearchPath } : std::nullopt;
    ASSERT_EQ(::setenv("PATH", "/nonexistent:/usr/bin:/bin", 1), 0);

    {
        Presence::CommandGate gate{ Presence::CommandGate::Options{ .command = { "sh", "-c", "exit 0" } } };
        EXPECT_EQ(gate.CheckAvailability(), Presence::Availability::Available);
        EXPECT_TRUE(gate.VerifyPresence());
    }

    if (optPreviousPath) {
        ::setenv("PATH", optPreviousPath->c_str(), 1);
    } else {
        ::unsetenv("PATH");
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, TimeoutTest)
{
    auto options = test::CreateShellOptions("sleep 30");
    options.timeout = std::chrono::seconds{ 1 };

    Presence::CommandGate gate{ options };
    auto const start = std::chrono::steady_clock::now();
    EXPECT_FALSE(gate.VerifyPresence());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{ 10 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST(CommandGateSuite, AbnormalTerminationTest)
{
    Presence::CommandGate gate{ test::CreateShellOptions("kill -9 $$") };
    EXPECT_FALSE(gate.VerifyPresence());
}

//----------------------------------------------------------------------------------------------------------------------

Presence::CommandGate::Options test::CreateShellOptions(std::string const& script)
{
    return Presence::CommandGate::Options{ .command = { std::string{ Shell }, "-c", script } };
}

//----------------------------------------------------------------------------------------------------------------------
