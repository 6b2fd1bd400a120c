//----------------------------------------------------------------------------------------------------------------------
// File: Utf8.hpp
// Description: Validation of UTF-8 byte sequences (RFC 3629). Overlong forms, surrogates and code points beyond 
// U+10FFFF are rejected.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <span>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Utf8 {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] constexpr bool IsValid(std::span<std::uint8_t const> buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Utf8 namespace
//----------------------------------------------------------------------------------------------------------------------

constexpr bool Utf8::IsValid(std::span<std::uint8_t const> buffer)
{
    std::size_t index = 0;
    while (index < buffer.size()) {
        std::uint8_t const lead = buffer[index];
        if (lead < 0x80) { ++index; continue; }

        std::size_t continuations = 0;
        std::uint8_t lower = 0x80;
        std::uint8_t upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            continuations = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            continuations = 2;
            if (lead == 0xE0) { lower = 0xA0; }
            if (lead == 0xED) { upper = 0x9F; }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            continuations = 3;
            if (lead == 0xF0) { lower = 0x90; }
            if (lead == 0xF4) { upper = 0x8F; }
        } else {
            return false;
        }

        if (buffer.size() - index <= continuations) { return false; }

        // Only the first continuation byte carries the tighter bounds.
        for (std::size_t offset = 1; offset <= continuations; ++offset) {
            std::uint8_t const next = buffer[index + offset];
            if (next < lower || next > upper) { return false; }
            lower = 0x80;
            upper = 0xBF;
        }

        index += continuations + 1;
    }

    return true;
}

//----------------------------------------------------------------------------------------------------------------------
