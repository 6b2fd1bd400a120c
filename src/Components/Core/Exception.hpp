//----------------------------------------------------------------------------------------------------------------------
// File: Exception.hpp
// Description: The typed error raised across component boundaries. Each error carries a code identifying the failure
// class so callers may decide whether the session can continue.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Biokey {
//----------------------------------------------------------------------------------------------------------------------

enum class ErrorCode : std::uint32_t {
    ProtocolError,
    IntegrityError,
    PaddingError,
    CryptoError,
    VaultIOError,
    PresenceDenied,
    EncodingError,
    ConfigurationError
};

class Exception;

[[nodiscard]] constexpr std::string_view ToString(ErrorCode code);

//----------------------------------------------------------------------------------------------------------------------
} // Biokey namespace
//----------------------------------------------------------------------------------------------------------------------

class Biokey::Exception : public std::runtime_error
{
public:
    Exception(ErrorCode code, std::string const& what) : std::runtime_error(what), m_code(code) {}

    [[nodiscard]] ErrorCode GetCode() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Biokey::ToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::ProtocolError: return "protocol error";
        case ErrorCode::IntegrityError: return "integrity error";
        case ErrorCode::PaddingError: return "padding error";
        case ErrorCode::CryptoError: return "crypto error";
        case ErrorCode::VaultIOError: return "vault i/o error";
        case ErrorCode::PresenceDenied: return "presence denied";
        case ErrorCode::EncodingError: return "encoding error";
        case ErrorCode::ConfigurationError: return "configuration error";
    }
    return "unknown error";
}

//----------------------------------------------------------------------------------------------------------------------
