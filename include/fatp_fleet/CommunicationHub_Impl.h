#pragma once

/**
 * @file CommunicationHub_Impl.h
 * @brief Out-of-line implementations for CommunicationHub.
 *
 * Do not include directly. Requires AIEnemyShip to be fully defined, ensured
 * by FatpFleet.h include order.
 */

#include <vector>

#include "AIEnemyShip.h"
#include "CommunicationHub.h"

namespace fatp_fleet
{

inline void CommunicationHub::registerAgent(AIEnemyShip& ship)
{
    if (mAgents.find(ship.id()) != nullptr)
    {
        return;
    }
    mAgents.insert(ship.id(), &ship);
    mOrder.push_back(ship.id());
}

inline std::vector<AIEnemyShip*> CommunicationHub::agentsWithin(const Vec3& center,
                                                                float radius,
                                                                AgentId exclude) const
{
    std::vector<AIEnemyShip*> result;
    for (AgentId id : mOrder)
    {
        if (id == exclude)
        {
            continue;
        }
        AIEnemyShip* ship = find(id);
        if (ship != nullptr && !ship->isDestroyed() && distance(center, ship->position()) <= radius)
        {
            result.push_back(ship);
        }
    }
    return result;
}

inline std::size_t CommunicationHub::broadcast(const AIMessage& msg, const Vec3& origin)
{
    std::size_t recipients = 0;
    for (AgentId id : mOrder)
    {
        if (id == msg.sender)
        {
            continue;
        }
        AIEnemyShip* ship = find(id);
        if (ship == nullptr || ship->isDestroyed())
        {
            continue;
        }
        if (distance(origin, ship->position()) > mRange)
        {
            continue;
        }
        if (ship->communication().receiveMessage(msg))
        {
            ++recipients;
        }
    }
    mDelivered += recipients;
    return recipients;
}

inline bool CommunicationHub::send(const AIMessage& msg)
{
    if (!msg.target)
    {
        return false;
    }
    AIEnemyShip* ship = find(*msg.target);
    if (ship == nullptr || ship->isDestroyed())
    {
        return false;
    }
    if (!ship->communication().receiveMessage(msg))
    {
        return false;
    }
    ++mDelivered;
    return true;
}

} // namespace fatp_fleet
