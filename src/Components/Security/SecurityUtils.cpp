//----------------------------------------------------------------------------------------------------------------------
// File: SecurityUtils.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <openssl/crypto.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstring>
#include <limits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: Generate and return a buffer of the provided size filled with random data. 
//----------------------------------------------------------------------------------------------------------------------
Security::OptionalBuffer Security::GenerateRandomData(std::size_t size)
{
    auto buffer = std::vector<std::uint8_t>(size, 0x00);
    if (!GenerateRandomData(buffer)) { return {}; }
    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::GenerateRandomData(WriteableView writeable)
{
    if (!std::in_range<std::int32_t>(writeable.size())) { return false; }
    return RAND_bytes(writeable.data(), static_cast<std::int32_t>(writeable.size())) == 1;
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Compare two buffers without leaking the position of the first mismatch through timing. Buffers of 
// differing length are never equal.
//----------------------------------------------------------------------------------------------------------------------
bool Security::ConstantTimeEquals(ReadableView lhs, ReadableView rhs)
{
    if (lhs.size() != rhs.size()) { return false; }
    if (lhs.empty()) { return true; }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

//----------------------------------------------------------------------------------------------------------------------

void Security::EraseMemory(void* begin, std::size_t size)
{
    if (begin == nullptr || size == 0) { return; }
    OPENSSL_cleanse(begin, size);
}

//----------------------------------------------------------------------------------------------------------------------
