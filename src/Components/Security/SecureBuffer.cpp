//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.cpp
// Description: 
//----------------------------------------------------------------------------------------------------------------------
#include "SecureBuffer.hpp"
#include "SecurityUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <stdexcept>
//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::SecureBuffer(std::size_t size)
    : m_buffer(size, 0x00)
{
}

//----------------------------------------------------------------------------------------------------------------------

Security::SecureBuffer::~SecureBuffer()
{
    Erase();
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::operator==(SecureBuffer const& other) const noexcept
{
    return ConstantTimeEquals(m_buffer, other.m_buffer);
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SecureBuffer::GetData() const
{
    return m_buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Security::WriteableView Security::SecureBuffer::GetData()
{
    return m_buffer;
}

//----------------------------------------------------------------------------------------------------------------------

Security::ReadableView Security::SecureBuffer::GetCordon(std::size_t offset, std::size_t size) const
{
    if (offset > m_buffer.size() || size > m_buffer.size() - offset) {
        throw std::out_of_range("The requested cordon exceeds the bounds of the secure buffer!");
    }
    return ReadableView{ m_buffer.data() + offset, size };
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Security::SecureBuffer::GetSize() const
{
    return m_buffer.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Security::SecureBuffer::IsEmpty() const
{
    return m_buffer.empty();
}

//----------------------------------------------------------------------------------------------------------------------

void Security::SecureBuffer::Erase()
{
    EraseMemory(m_buffer.data(), m_buffer.size());
    m_buffer.clear();
}

//----------------------------------------------------------------------------------------------------------------------
// Description: Growing the vector in place would leave a stale copy of the key material in the released allocation, 
// so the contents are moved into a fresh allocation and the old one is scrubbed first.
//----------------------------------------------------------------------------------------------------------------------
void Security::SecureBuffer::Reserve(std::size_t capacity)
{
    Buffer replacement;
    replacement.reserve(capacity);
    replacement.insert(replacement.end(), m_buffer.begin(), m_buffer.end());
    Erase();
    m_buffer = std::move(replacement);
}

//----------------------------------------------------------------------------------------------------------------------
