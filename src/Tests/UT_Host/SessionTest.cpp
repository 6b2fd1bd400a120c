//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "BiokeyHost/ServiceProvider.hpp"
#include "BiokeyHost/Session.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Security/CipherPackage.hpp"
#include "Components/Security/SealedEnvelope.hpp"
#include "Components/Security/SessionSecret.hpp"
#include "Components/Vault/GatedKeyHandle.hpp"
#include "Components/Vault/KeyVault.hpp"
#include "Utilities/Base64.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace test {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view AppId = "chrome-extension://nngceckbapebfimnlniiiahkandclblb/";
constexpr std::string_view UserIdentifier = "0f3a51d6-8b2c-4e9a-b7d1-6c5e4f3a2b10";
constexpr std::string_view UserKey = "dXNlciBrZXkgcmVsZWFzZWQgdG8gdGhlIGJyb3dzZXI=";

[[nodiscard]] std::string CreateHandshakeRequest(std::string_view publicKey);
[[nodiscard]] std::string CreateSealedRequest(Security::CipherPackage const& package, boost::json::object const& command);
[[nodiscard]] boost::json::object OpenSealedReply(Security::CipherPackage const& package, std::string_view frame);

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class SessionSuite : public testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        m_upKeyPair = Host::Test::GenerateRsaKeyPair();
        m_publicKey = Base64::Encode(Host::Test::GetPublicKeyDer(m_upKeyPair));
    }

    static void TearDownTestSuite()
    {
        m_upKeyPair.reset();
        m_publicKey.clear();
    }

    SessionSuite()
        : m_directory()
        , m_spGate(std::make_shared<Host::Test::PresenceGate>(Presence::Availability::Available, true))
        , m_spKeyVault(std::make_shared<Vault::KeyVault>(m_directory.GetPath() / "keys", 
            std::make_shared<Vault::GatedKeyHandle>(std::make_shared<Host::Test::KeyProvider>(), m_spGate)))
        , m_spServiceProvider(std::make_shared<Host::ServiceProvider>())
        , m_input()
        , m_output()
    {
        m_spServiceProvider->Register(m_spKeyVault);
        m_spServiceProvider->Register<IPresenceGate>(m_spGate);
    }

    void Send(std::string_view body)
    {
        m_input.clear(); // A previous run leaves the input at its end.
        auto const frame = Host::Test::EncodeFrame(body);
        m_input.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    }

    // Runs the session over every frame sent so far and returns the frames it wrote, excluding the connected notice.
    [[nodiscard]] std::vector<std::string> Run(Host::Session& session)
    {
        m_input.clear();
        session.Run();

        auto frames = Host::Test::DecodeFrames(m_output.str());
        m_output.str("");

        EXPECT_FALSE(frames.empty());
        if (frames.empty()) { return frames; }

        auto const notice = boost::json::parse(frames.front()).as_object();
        EXPECT_EQ(notice.at("command").as_string(), "connected");
        frames.erase(frames.begin());
        return frames;
    }

    [[nodiscard]] Security::SessionSecret Handshake(Host::Session& session)
    {
        Send(test::CreateHandshakeRequest(m_publicKey));
        auto const frames = Run(session);
        if (frames.size() != 1) { throw std::runtime_error("The handshake did not produce a single reply!"); }
        return RecoverSecret(frames.front());
    }

    [[nodiscard]] Security::SessionSecret RecoverSecret(std::string_view frame)
    {
        auto const reply = boost::json::parse(frame).as_object();
        EXPECT_EQ(reply.at("command").as_string(), "setupEncryption");
        EXPECT_EQ(reply.at("appId").as_string(), test::AppId);

        auto const& encoded = reply.at("sharedSecret").as_string();
        auto const optWrapped = Base64::Decode(std::string_view{ encoded.data(), encoded.size() });
        if (!optWrapped) { throw std::runtime_error("The shared secret is not valid base64!"); }

        auto const unwrapped = Host::Test::DecryptOaepSha1(m_upKeyPair, *optWrapped);
        EXPECT_EQ(unwrapped.size(), Security::SessionSecretSize);
        return Security::SessionSecret::FromBytes(unwrapped);
    }

    [[nodiscard]] Biokey::ErrorCode GetRunError(Host::Session& session)
    {
        m_input.clear();
        try {
            session.Run();
        } catch (Biokey::Exception const& exception) {
            return exception.GetCode();
        }

        ADD_FAILURE() << "The session ended without an error.";
        return Biokey::ErrorCode::ConfigurationError;
    }

    static Security::OpenSSL::KeyPair m_upKeyPair;
    static std::string m_publicKey;

    Host::Test::TemporaryDirectory m_directory;
    std::shared_ptr<Host::Test::PresenceGate> m_spGate;
    std::shared_ptr<Vault::KeyVault> m_spKeyVault;
    std::shared_ptr<Host::ServiceProvider> m_spServiceProvider;
    std::stringstream m_input;
    std::ostringstream m_output;
};

//----------------------------------------------------------------------------------------------------------------------

Security::OpenSSL::KeyPair SessionSuite::m_upKeyPair = {};
std::string SessionSuite::m_publicKey = {};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, ConnectedNoticeTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    session.Run();

    auto const frames = Host::Test::DecodeFrames(m_output.str());
    ASSERT_EQ(frames.size(), std::size_t{ 1 });

    auto const notice = boost::json::parse(frames.front()).as_object();
    EXPECT_EQ(notice.at("command").as_string(), "connected");
    EXPECT_EQ(notice.at("app_id").as_string(), test::AppId);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, HandshakeTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    EXPECT_EQ(session.GetHandshakeCount(), std::size_t{ 1 });
    EXPECT_EQ(session.GetDispatchedCount(), std::size_t{ 0 });
    EXPECT_EQ(secret.GetEncryptionKey().size(), Security::EncryptionKeySize);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, RepeatedHandshakeTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    Send(test::CreateHandshakeRequest(m_publicKey));
    Send(test::CreateHandshakeRequest(m_publicKey));

    auto const frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 2 });
    EXPECT_NE(frames[0], frames[1]); // The wrapping is randomized.

    // Every handshake within a session transports the same secret.
    auto const first = RecoverSecret(frames[0]);
    auto const second = RecoverSecret(frames[1]);
    EXPECT_EQ(first.Serialize(), second.Serialize());
    EXPECT_EQ(session.GetHandshakeCount(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, StatusRequestTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    Send(test::CreateSealedRequest(package, { { "command", "getBiometricsStatus" }, { "messageId", 5 } }));
    auto const frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 1 });

    auto const reply = boost::json::parse(frames.front()).as_object();
    EXPECT_EQ(reply.at("appId").as_string(), test::AppId);
    EXPECT_EQ(reply.at("messageId").to_number<std::int64_t>(), 5);

    auto const response = test::OpenSealedReply(package, frames.front());
    EXPECT_EQ(response.at("command").as_string(), "getBiometricsStatus");
    EXPECT_EQ(response.at("messageId").to_number<std::int64_t>(), 5);
    EXPECT_EQ(response.at("response").to_number<std::int64_t>(), 0);
    EXPECT_TRUE(response.at("timestamp").is_number());
    EXPECT_EQ(session.GetDispatchedCount(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, UnlockRequestTest)
{
    m_spKeyVault->Import(test::UserIdentifier, test::UserKey);

    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    boost::json::object command = {
        { "command", "unlockWithBiometricsForUser" }, { "messageId", 6 }, { "userId", test::UserIdentifier } };
    Send(test::CreateSealedRequest(package, command));

    auto frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 1 });

    auto const released = test::OpenSealedReply(package, frames.front());
    EXPECT_EQ(released.at("messageId").to_number<std::int64_t>(), 6);
    EXPECT_TRUE(released.at("response").as_bool());
    EXPECT_EQ(released.at("userKeyB64").as_string(), test::UserKey);

    m_spGate->SetVerdict(false);
    command["messageId"] = 7;
    Send(test::CreateSealedRequest(package, command));

    frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 1 });

    auto const refused = test::OpenSealedReply(package, frames.front());
    EXPECT_EQ(refused.at("messageId").to_number<std::int64_t>(), 7);
    EXPECT_FALSE(refused.at("response").as_bool());
    EXPECT_FALSE(refused.contains("userKeyB64"));
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, UnknownCommandTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    Send(test::CreateSealedRequest(package, { { "command", "bw-credential-retrieval" }, { "messageId", 8 } }));
    Send(test::CreateSealedRequest(package, { 
        { "command", "getBiometricsStatusForUser" }, { "messageId", 9 }, { "userId", test::UserIdentifier } }));

    auto const frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 1 });

    auto const response = test::OpenSealedReply(package, frames.front());
    EXPECT_EQ(response.at("messageId").to_number<std::int64_t>(), 9);
    EXPECT_EQ(response.at("response").to_number<std::int64_t>(), Presence::StatusCode::NotEnabledForUser);
    EXPECT_EQ(session.GetDispatchedCount(), std::size_t{ 1 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, StructuredEnvelopeTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    auto const payload = boost::json::serialize(
        boost::json::object{ { "command", "authenticateWithBiometrics" }, { "messageId", 10 } });
    auto const envelope = package.Seal(
        Security::ReadableView{ reinterpret_cast<std::uint8_t const*>(payload.data()), payload.size() });

    boost::json::object request;
    request["appId"] = test::AppId;
    request["message"] = boost::json::object{
        { "encryptionType", envelope.type },
        { "iv", envelope.GetEncodedInitializationVector() },
        { "data", envelope.GetEncodedData() },
        { "mac", envelope.GetEncodedSignature() }
    };
    Send(boost::json::serialize(request));

    auto const frames = Run(session);
    ASSERT_EQ(frames.size(), std::size_t{ 1 });
    EXPECT_TRUE(test::OpenSealedReply(package, frames.front()).at("response").as_bool());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, MalformedFrameTest)
{
    {
        Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
        Send("{\"appId\":");
        EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::ProtocolError);
    }

    {
        m_input.str("");
        Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
        Send(R"({"message":{"command":"setupEncryption","publicKey":"AAAA"}})");
        EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::ProtocolError);
    }

    {
        m_input.str("");
        Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
        Send(R"({"appId":"ext","message":{"command":"setupEncryption","publicKey":"not base64"}})");
        EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::ProtocolError);
    }

    {
        m_input.str("");
        Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
        Send(R"({"appId":"ext","message":{"command":"setupEncryption","publicKey":"AAAAAAAA"}})");
        EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::CryptoError);
    }
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, TamperedRequestTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    auto const payload = std::string_view{ R"({"command":"getBiometricsStatus","messageId":11})" };
    auto envelope = package.Seal(
        Security::ReadableView{ reinterpret_cast<std::uint8_t const*>(payload.data()), payload.size() });
    envelope.data.front() ^= 0x80;

    boost::json::object request;
    request["appId"] = test::AppId;
    request["message"] = boost::json::object{ { "encryptedString", envelope.ToString() } };
    Send(boost::json::serialize(request));

    EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::IntegrityError);
    EXPECT_EQ(Host::Test::DecodeFrames(m_output.str()).size(), std::size_t{ 1 }); // Only the connected notice.
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, ForeignSecretTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const foreignSecret = Security::SessionSecret::Generate();
    Security::CipherPackage const package{ foreignSecret };

    Send(test::CreateSealedRequest(package, { { "command", "getBiometricsStatus" }, { "messageId", 12 } }));
    EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::IntegrityError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, MissingUserIdTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    Send(test::CreateSealedRequest(package, { { "command", "unlockWithBiometricsForUser" }, { "messageId", 13 } }));
    EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::ProtocolError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, MalformedCommandTest)
{
    Host::Session session{ test::AppId, m_input, m_output, m_spServiceProvider };
    auto const secret = Handshake(session);
    Security::CipherPackage const package{ secret };

    Send(test::CreateSealedRequest(package, { { "command", "getBiometricsStatus" } }));
    EXPECT_EQ(GetRunError(session), Biokey::ErrorCode::ProtocolError);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(SessionSuite, MissingServicesTest)
{
    EXPECT_THROW(
        Host::Session(test::AppId, m_input, m_output, std::make_shared<Host::ServiceProvider>()), Biokey::Exception);
    EXPECT_THROW(Host::Session(test::AppId, m_input, m_output, nullptr), Biokey::Exception);
}

//----------------------------------------------------------------------------------------------------------------------

std::string test::CreateHandshakeRequest(std::string_view publicKey)
{
    boost::json::object request;
    request["appId"] = AppId;
    request["message"] = boost::json::object{
        { "command", "setupEncryption" }, { "publicKey", publicKey }, { "userId", UserIdentifier } };
    return boost::json::serialize(request);
}

//----------------------------------------------------------------------------------------------------------------------

std::string test::CreateSealedRequest(Security::CipherPackage const& package, boost::json::object const& command)
{
    auto const payload = boost::json::serialize(command);
    auto const envelope = package.Seal(
        Security::ReadableView{ reinterpret_cast<std::uint8_t const*>(payload.data()), payload.size() });

    boost::json::object request;
    request["appId"] = AppId;
    request["message"] = boost::json::object{ { "encryptedString", envelope.ToString() } };
    return boost::json::serialize(request);
}

//----------------------------------------------------------------------------------------------------------------------

boost::json::object test::OpenSealedReply(Security::CipherPackage const& package, std::string_view frame)
{
    auto const reply = boost::json::parse(frame).as_object();
    auto const& message = reply.at("message").as_object();

    auto const& text = message.at("encryptedString").as_string();
    auto const optEnvelope = Security::SealedEnvelope::FromString(std::string_view{ text.data(), text.size() });
    if (!optEnvelope) { throw std::runtime_error("The reply does not carry a valid envelope!"); }
    EXPECT_EQ(optEnvelope->GetEncodedData(), std::string_view(message.at("data").as_string()));

    auto const plaintext = package.Open(*optEnvelope);
    auto const response = boost::json::parse(
        std::string_view{ reinterpret_cast<char const*>(plaintext.data()), plaintext.size() });
    return response.as_object();
}

//----------------------------------------------------------------------------------------------------------------------
