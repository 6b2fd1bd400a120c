//----------------------------------------------------------------------------------------------------------------------
// File: TimeUtils.hpp
// Description: Wall clock helpers used to stamp outbound responses.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <chrono>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace TimeUtils {
//----------------------------------------------------------------------------------------------------------------------

using Timestamp = std::chrono::milliseconds;
using Timepoint = std::chrono::time_point<std::chrono::system_clock, Timestamp>;

[[nodiscard]] Timepoint GetSystemTimepoint();
[[nodiscard]] Timestamp GetSystemTimestamp();
[[nodiscard]] std::uint64_t GetEpochMilliseconds();

//----------------------------------------------------------------------------------------------------------------------
} // TimeUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timepoint TimeUtils::GetSystemTimepoint()
{
    return std::chrono::time_point_cast<Timestamp>(std::chrono::system_clock::now());
}

//----------------------------------------------------------------------------------------------------------------------

inline TimeUtils::Timestamp TimeUtils::GetSystemTimestamp()
{
    Timepoint const timepoint = GetSystemTimepoint();
    return std::chrono::duration_cast<Timestamp>(timepoint.time_since_epoch());
}

//----------------------------------------------------------------------------------------------------------------------

inline std::uint64_t TimeUtils::GetEpochMilliseconds()
{
    auto const count = GetSystemTimestamp().count();
    return (count > 0) ? static_cast<std::uint64_t>(count) : 0;
}

//----------------------------------------------------------------------------------------------------------------------
