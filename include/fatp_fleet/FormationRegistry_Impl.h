#pragma once

/**
 * @file FormationRegistry_Impl.h
 * @brief Out-of-line implementations for FormationRegistry.
 *
 * Do not include directly. Requires AIEnemyShip to be fully defined, ensured
 * by FatpFleet.h include order.
 */

#include "AIEnemyShip.h"
#include "FormationRegistry.h"
#include "Log.h"

namespace fatp_fleet
{

inline bool FormationRegistry::join(FormationId formation, const AIEnemyShip& ship)
{
    FormationController* controller = find(formation);
    if (controller == nullptr)
    {
        return false;
    }

    if (const FormationId* current = mMembership.find(ship.id()))
    {
        FATP_FLEET_LOG_ERROR("agent %u is already in formation %u, refusing join to %u",
                             ship.id().get(),
                             current->get(),
                             formation.get());
        return false;
    }

    if (!controller->addMember(ship))
    {
        return false;
    }
    mMembership.insert(ship.id(), formation);
    return true;
}

} // namespace fatp_fleet
