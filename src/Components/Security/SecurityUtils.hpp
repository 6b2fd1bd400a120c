//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.hpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstddef>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] OptionalBuffer GenerateRandomData(std::size_t size);
[[nodiscard]] bool GenerateRandomData(WriteableView writeable);
[[nodiscard]] bool ConstantTimeEquals(ReadableView lhs, ReadableView rhs);
void EraseMemory(void* begin, std::size_t size);

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------
