//----------------------------------------------------------------------------------------------------------------------
// File: FramedChannel.hpp
// Description: Reads and writes length prefixed frames over a pair of byte streams. Each frame is a native endian 
// 32-bit length followed by that many bytes of UTF-8 JSON.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Channel {
//----------------------------------------------------------------------------------------------------------------------

class FramedChannel;

//----------------------------------------------------------------------------------------------------------------------
} // Channel namespace
//----------------------------------------------------------------------------------------------------------------------

class Channel::FramedChannel
{
public:
    using LengthPrefix = std::uint32_t;

    static constexpr std::size_t PrefixSize = sizeof(LengthPrefix);
    static constexpr std::size_t MaximumFrameSize = 64 * 1024 * 1024;

    FramedChannel(std::istream& input, std::ostream& output);

    FramedChannel(FramedChannel const&) = delete;
    FramedChannel& operator=(FramedChannel const&) = delete;

    // Returns the next frame's body, or nothing when the input closes before a complete frame could be read. Throws 
    // ProtocolError when the declared size exceeds the frame limit.
    [[nodiscard]] std::optional<std::string> Read();

    // Writes and flushes a single frame. Throws ProtocolError when the body is too large or the output fails.
    void Write(std::string_view body);

    [[nodiscard]] std::size_t GetReceivedCount() const;
    [[nodiscard]] std::size_t GetSentCount() const;

private:
    std::istream& m_input;
    std::ostream& m_output;
    std::size_t m_received;
    std::size_t m_sent;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
