//----------------------------------------------------------------------------------------------------------------------
// File: FramedChannel.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "FramedChannel.hpp"
#include "Components/Core/Exception.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cassert>
#include <cstring>
#include <istream>
#include <ostream>
//----------------------------------------------------------------------------------------------------------------------

Channel::FramedChannel::FramedChannel(std::istream& input, std::ostream& output)
    : m_input(input)
    , m_output(output)
    , m_received(0)
    , m_sent(0)
    , m_logger(spdlog::get(Logger::Name::Channel.data()))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<std::string> Channel::FramedChannel::Read()
{
    std::array<char, PrefixSize> prefix = {};
    m_input.read(prefix.data(), prefix.size());
    if (static_cast<std::size_t>(m_input.gcount()) != prefix.size()) {
        m_logger->debug("The input closed while waiting for a frame header.");
        return {};
    }

    LengthPrefix length = 0;
    std::memcpy(&length, prefix.data(), sizeof(length));

    if (length > MaximumFrameSize) {
        m_logger->error("Received a frame declaring {} bytes, exceeding the {} byte limit.", length, MaximumFrameSize);
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "Received a frame exceeding the size limit!");
    }

    // A declared body that can not be read in full is treated as an orderly shutdown by the peer.
    std::string body(length, '\0');
    if (length != 0) { m_input.read(body.data(), static_cast<std::streamsize>(length)); }
    if (length == 0 || static_cast<std::size_t>(m_input.gcount()) != length) {
        m_logger->debug("The input closed while reading a frame body.");
        return {};
    }

    ++m_received;
    m_logger->trace("Received a frame of {} bytes.", length);
    return body;
}

//----------------------------------------------------------------------------------------------------------------------

void Channel::FramedChannel::Write(std::string_view body)
{
    if (body.size() > MaximumFrameSize) {
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "Unable to send a frame exceeding the size limit!");
    }

    auto const length = static_cast<LengthPrefix>(body.size());
    std::array<char, PrefixSize> prefix = {};
    std::memcpy(prefix.data(), &length, sizeof(length));

    m_output.write(prefix.data(), prefix.size());
    m_output.write(body.data(), static_cast<std::streamsize>(body.size()));
    m_output.flush();

    if (!m_output.good()) {
        throw Biokey::Exception(Biokey::ErrorCode::ProtocolError, "Failed to write a frame to the channel!");
    }

    ++m_sent;
    m_logger->trace("Sent a frame of {} bytes.", length);
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Channel::FramedChannel::GetReceivedCount() const { return m_received; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Channel::FramedChannel::GetSentCount() const { return m_sent; }

//----------------------------------------------------------------------------------------------------------------------
