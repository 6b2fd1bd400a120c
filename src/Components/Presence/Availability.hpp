//----------------------------------------------------------------------------------------------------------------------
// File: Availability.hpp
// Description: The availability of the user presence check and the status codes reported to the browser extension.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Presence {
//----------------------------------------------------------------------------------------------------------------------

enum class Availability : std::uint32_t { 
    Available, DeviceAbsent, DeviceBusy, NotConfigured, DisabledByPolicy, Unknown 
};

namespace StatusCode {
    constexpr std::int32_t Available = 0;
    constexpr std::int32_t Unavailable = 2;
    constexpr std::int32_t NotEnabledForUser = 4;
    constexpr std::int32_t Disabled = 5;
    constexpr std::int32_t NotConfigured = 7;
}

[[nodiscard]] constexpr std::int32_t ToStatusCode(Availability availability);
[[nodiscard]] constexpr std::string_view ToString(Availability availability);

//----------------------------------------------------------------------------------------------------------------------
} // Presence namespace
//----------------------------------------------------------------------------------------------------------------------

constexpr std::int32_t Presence::ToStatusCode(Availability availability)
{
    switch (availability) {
        case Availability::Available: return StatusCode::Available;
        case Availability::DeviceAbsent: [[fallthrough]];
        case Availability::DeviceBusy: return StatusCode::Unavailable;
        case Availability::NotConfigured: return StatusCode::NotConfigured;
        case Availability::DisabledByPolicy: [[fallthrough]];
        case Availability::Unknown: return StatusCode::Disabled;
    }
    return StatusCode::Disabled;
}

//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Presence::ToString(Availability availability)
{
    switch (availability) {
        case Availability::Available: return "available";
        case Availability::DeviceAbsent: return "device absent";
        case Availability::DeviceBusy: return "device busy";
        case Availability::NotConfigured: return "not configured";
        case Availability::DisabledByPolicy: return "disabled by policy";
        case Availability::Unknown: return "unknown";
    }
    return "unknown";
}

//----------------------------------------------------------------------------------------------------------------------
