//----------------------------------------------------------------------------------------------------------------------
// File: Session.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Session.hpp"
#include "ServiceProvider.hpp"
#include "Components/Core/Exception.hpp"
#include "Components/Message/Command.hpp"
#include "Components/Route/Biometrics.hpp"
#include "Components/Security/KeyTransport.hpp"
#include "Components/Security/SecureBuffer.hpp"
#include "Components/Security/SecurityUtils.hpp"
#include "Utilities/Base64.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <string_view>
#include <variant>
//----------------------------------------------------------------------------------------------------------------------

Host::Session::Session(
    std::string_view appId,
    std::istream& input,
    std::ostream& output,
    std::shared_ptr<ServiceProvider> const& spServiceProvider)
    : m_logger(spdlog::get(Logger::Name::Core.data()))
    , m_appId(appId)
    , m_secret()
    , m_upCipherPackage()
    , m_channel(input, output)
    , m_router()
    , m_handshakes(0)
    , m_dispatched(0)
{
    assert(m_logger);
    m_upCipherPackage = std::make_unique<Security::CipherPackage>(m_secret.Get());

    using namespace Route::Biometrics;
    [[maybe_unused]] bool registered = true;
    registered &= m_router.Register<UnlockHandler>(UnlockHandler::Command);
    registered &= m_router.Register<AuthenticateHandler>(AuthenticateHandler::Command);
    registered &= m_router.Register<StatusHandler>(StatusHandler::Command);
    registered &= m_router.Register<UserStatusHandler>(UserStatusHandler::Command);
    assert(registered);

    if (!spServiceProvider || !m_router.Initialize(spServiceProvider)) {
        throw Biokey::Exception(
            Biokey::ErrorCode::ConfigurationError, "The command handlers could not acquire their services!");
    }
}

//----------------------------------------------------------------------------------------------------------------------

void Host::Session::Run()
{
    m_channel.Write(Message::CreateConnectedNotice(m_appId));
    m_logger->info("Announced the host to the browser as \"{}\".", m_appId);

    while (auto const optFrame = m_channel.Read()) {
        auto const inbound = Message::ParseInbound(*optFrame);
        if (auto const pHandshake = std::get_if<Message::HandshakeRequest>(&inbound); pHandshake) {
            OnHandshake(*pHandshake);
        } else {
            OnSealedRequest(std::get<Message::SealedRequest>(inbound));
        }
    }

    m_logger->info(
        "The browser closed the channel after {} frames ({} requests dispatched).",
        m_channel.GetReceivedCount(), m_dispatched);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Host::Session::GetHandshakeCount() const { return m_handshakes; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Host::Session::GetDispatchedCount() const { return m_dispatched; }

//----------------------------------------------------------------------------------------------------------------------

void Host::Session::OnHandshake(Message::HandshakeRequest const& request)
{
    auto const optPublicKey = Base64::Decode(request.publicKey);
    if (!optPublicKey || optPublicKey->empty()) {
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "The handshake public key is not valid base64!");
    }

    Security::KeyTransport const transport{ *optPublicKey };
    auto const serialized = m_secret.Get().Serialize();
    auto const sharedSecret = transport.Wrap(serialized.GetData());

    m_channel.Write(Message::CreateHandshakeReply(request.appId, sharedSecret));
    ++m_handshakes;

    m_logger->info("Completed the encryption handshake with \"{}\".", request.appId);
}

//----------------------------------------------------------------------------------------------------------------------

void Host::Session::OnSealedRequest(Message::SealedRequest const& request)
{
    // The plaintext is scrubbed when it leaves scope, even if the command fails to parse.
    Security::SecureBuffer const plaintext{ m_upCipherPackage->Open(request.envelope) };
    auto const data = plaintext.GetData();
    std::string_view const payload{ reinterpret_cast<char const*>(data.data()), data.size() };
    auto const command = Message::InboundCommand::FromJson(payload);

    m_logger->debug("Received the \"{}\" command (message {}).", command.command, command.messageId);

    auto optResponse = m_router.Route(command);
    if (!optResponse) { return; }
    ++m_dispatched;

    auto serialized = optResponse->ToJson();
    auto const envelope = m_upCipherPackage->Seal(
        Security::ReadableView{ reinterpret_cast<std::uint8_t const*>(serialized.data()), serialized.size() });
    Security::EraseMemory(serialized.data(), serialized.size());
    if (optResponse->optExportedKey) {
        Security::EraseMemory(optResponse->optExportedKey->data(), optResponse->optExportedKey->size());
    }

    m_channel.Write(Message::CreateSealedReply(request.appId, command.messageId, envelope));
}

//----------------------------------------------------------------------------------------------------------------------
