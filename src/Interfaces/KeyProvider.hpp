//----------------------------------------------------------------------------------------------------------------------
// File: KeyProvider.hpp
// Description: Defines a handle to a non-extractable asymmetric key. Callers may only invoke the key by reference to 
// wrap and unwrap vault entries. Implementations report failures with a CryptoError.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Security/SecurityTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IKeyProvider
{
public:
    virtual ~IKeyProvider() = default;

    [[nodiscard]] virtual std::string_view GetName() const = 0;
    [[nodiscard]] virtual Security::Buffer Encrypt(Security::ReadableView plaintext) = 0;
    [[nodiscard]] virtual Security::Buffer Decrypt(Security::ReadableView ciphertext) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
