//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Biokey {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Name = "Biokey";
constexpr std::string_view Version = "1.0.0";

//----------------------------------------------------------------------------------------------------------------------
} // Biokey namespace
//----------------------------------------------------------------------------------------------------------------------
