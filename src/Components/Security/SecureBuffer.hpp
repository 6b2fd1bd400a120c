//----------------------------------------------------------------------------------------------------------------------
// File: SecureBuffer.hpp
// Description: A byte buffer that scrubs its contents on destruction. Used for key material held in memory.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Security {
//----------------------------------------------------------------------------------------------------------------------

class SecureBuffer;

using OptionalSecureBuffer = std::optional<Security::SecureBuffer>;

template <typename Buffer>
concept ByteLikeBuffer = std::same_as<std::remove_cv_t<typename Buffer::value_type>, std::uint8_t> ||
                         std::same_as<std::remove_cv_t<typename Buffer::value_type>, char>;

//----------------------------------------------------------------------------------------------------------------------
} // Security namespace
//----------------------------------------------------------------------------------------------------------------------

class Security::SecureBuffer
{
public:
    SecureBuffer() = default;

    template <typename... Buffers>
    explicit SecureBuffer(Buffers const&... buffers) requires (sizeof...(Buffers) != 0 && (ByteLikeBuffer<Buffers> && ...))
    {
        Append(buffers...);
    }

    explicit SecureBuffer(std::size_t size);

    // Takes ownership of the allocation without leaving a copy behind.
    explicit SecureBuffer(Buffer&& buffer) noexcept : m_buffer(std::move(buffer)) {}

    SecureBuffer(SecureBuffer const& other) : m_buffer(other.m_buffer) {}

    SecureBuffer& operator=(SecureBuffer const& other)
    {
        if (this != &other) {
            Erase();
            m_buffer = other.m_buffer;
        }
        return *this;
    }

    SecureBuffer(SecureBuffer&& other) noexcept : m_buffer(std::exchange(other.m_buffer, {})) {}

    SecureBuffer& operator=(SecureBuffer&& other) noexcept
    {
        if (this != &other) {
            Erase();
            m_buffer = std::exchange(other.m_buffer, {});
        }
        return *this;
    }

    ~SecureBuffer();

    [[nodiscard]] bool operator==(SecureBuffer const& other) const noexcept;

    [[nodiscard]] ReadableView GetData() const;
    [[nodiscard]] WriteableView GetData();
    [[nodiscard]] ReadableView GetCordon(std::size_t offset, std::size_t size) const;
    [[nodiscard]] std::size_t GetSize() const;
    [[nodiscard]] bool IsEmpty() const;

    template <typename... Buffers>
    void Append(Buffers const&... buffers) requires (ByteLikeBuffer<Buffers> && ...)
    {
        if constexpr (sizeof...(Buffers) != 0) {
            std::size_t const total = m_buffer.size() + (buffers.size() + ...);
            if (total > m_buffer.capacity()) { Reserve(total); }
            (m_buffer.insert(m_buffer.end(), buffers.begin(), buffers.end()), ...);
        }
    }

    void Erase();
    
private:
    void Reserve(std::size_t capacity);

    Buffer m_buffer;
};

//----------------------------------------------------------------------------------------------------------------------
