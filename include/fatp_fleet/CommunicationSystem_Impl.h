#pragma once

/**
 * @file CommunicationSystem_Impl.h
 * @brief Out-of-line implementations for CommunicationSystem.
 *
 * Do not include directly. Requires CommunicationHub to be fully defined,
 * ensured by FatpFleet.h include order.
 */

#include "CommunicationHub.h"
#include "CommunicationSystem.h"

namespace fatp_fleet
{

inline void CommunicationSystem::processOutgoing(const Vec3& origin)
{
    std::size_t remaining = mOutbound.size();
    AIMessage msg;
    while (remaining > 0 && mOutbound.pop(msg))
    {
        --remaining;
        if (msg.isBroadcast)
        {
            (void)mHub->broadcast(msg, origin);
        }
        else if (!mHub->send(msg))
        {
            FATP_FLEET_LOG_DEBUG("agent %u: %.*s has no live recipient",
                                 mOwner.get(),
                                 static_cast<int>(toString(msg.type).size()),
                                 toString(msg.type).data());
        }

        if (onMessageSent.slotCount() > 0)
        {
            onMessageSent.emit(msg);
        }
    }
}

} // namespace fatp_fleet
