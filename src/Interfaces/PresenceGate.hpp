//----------------------------------------------------------------------------------------------------------------------
// File: PresenceGate.hpp
// Description: Defines the capability used to confirm that the user is physically present before a sensitive 
// operation is allowed to proceed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Presence/Availability.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IPresenceGate
{
public:
    virtual ~IPresenceGate() = default;

    [[nodiscard]] virtual Presence::Availability CheckAvailability() = 0;

    // Blocks until the user has confirmed or refused, which may take several seconds. It must be invoked at most once
    // per authorization decision.
    [[nodiscard]] virtual bool VerifyPresence() = 0;
};

//----------------------------------------------------------------------------------------------------------------------
