#pragma once

/**
 * @file FormationController_Impl.h
 * @brief Out-of-line implementations for FormationController.
 *
 * Do not include directly. Requires AIEnemyShip and CommunicationHub to be
 * fully defined, ensured by FatpFleet.h include order.
 */

#include <algorithm>

#include "AIEnemyShip.h"
#include "CommunicationHub.h"
#include "FormationController.h"

namespace fatp_fleet
{

// =============================================================================
// Membership
// =============================================================================

inline bool FormationController::addMember(const AIEnemyShip& ship)
{
    const AgentId agent = ship.id();
    if (contains(agent))
    {
        return false;
    }

    mMembers.push_back(agent);
    mPeakMembers = std::max(mPeakMembers, mMembers.size());
    if (mMembers.size() == 1)
    {
        mCenter = ship.position();
    }
    recomputeSlots();

    onMemberAdded.emit(mId, agent);
    if (mMembers.size() == 1)
    {
        onLeaderChanged.emit(mId, agent);
    }
    return true;
}

inline bool FormationController::removeMember(AgentId agent)
{
    const int index = indexOf(agent);
    if (index < 0)
    {
        return false;
    }

    mMembers.erase(mMembers.begin() + index);
    onMemberRemoved.emit(mId, agent);

    if (index == 0 && !mMembers.empty())
    {
        selectNewLeader();
    }
    recomputeSlots();
    return true;
}

inline void FormationController::setLeader(AgentId agent)
{
    const int index = indexOf(agent);
    if (index <= 0)
    {
        return;
    }
    mMembers.erase(mMembers.begin() + index);
    mMembers.insert(mMembers.begin(), agent);
    recomputeSlots();
    onLeaderChanged.emit(mId, agent);
}

inline float FormationController::leadershipScore(const AIEnemyShip& ship)
{
    float typeBonus = 0.0f;
    switch (ship.shipType())
    {
    case ShipType::Fighter:     typeBonus = 20.0f; break;
    case ShipType::Bomber:      typeBonus = 15.0f; break;
    case ShipType::Scout:       typeBonus = 10.0f; break;
    case ShipType::Interceptor: typeBonus = 5.0f; break;
    }
    return ship.healthRatio() * 30.0f + typeBonus + ship.teamwork() * 10.0f;
}

inline void FormationController::selectNewLeader()
{
    std::size_t best = 0;
    float bestScore = -1.0f;
    for (std::size_t i = 0; i < mMembers.size(); ++i)
    {
        const AIEnemyShip* ship = mDirectory->find(mMembers[i]);
        if (ship == nullptr || ship->isDestroyed() || ship->healthRatio() <= kLeaderHealthFloor)
        {
            continue;
        }
        const float score = leadershipScore(*ship);
        if (score > bestScore)
        {
            bestScore = score;
            best = i;
        }
    }

    if (best != 0)
    {
        const AgentId chosen = mMembers[best];
        mMembers.erase(mMembers.begin() + static_cast<std::ptrdiff_t>(best));
        mMembers.insert(mMembers.begin(), chosen);
    }
    onLeaderChanged.emit(mId, mMembers.front());
}

// =============================================================================
// Movement
// =============================================================================

inline void FormationController::setDestination(const Vec3& destination)
{
    mDestination = destination;
    mHasDestination = true;

    const Vec3 heading = normalize(destination - mCenter);
    if (heading.lengthSquared() > 0.0f)
    {
        mDirection = heading;
    }
    recomputeSlots();

    AIEnemyShip* leaderShip = mDirectory->find(leader());
    if (leaderShip != nullptr && !leaderShip->isDestroyed())
    {
        leaderShip->navigator().setDestination(destination);
    }
}

inline void FormationController::update(float dt)
{
    const AIEnemyShip* leaderShip = mDirectory->find(leader());
    if (leaderShip != nullptr)
    {
        mCenter = leaderShip->position();
        const Vec3 heading = normalize(leaderShip->velocity());
        if (heading.lengthSquared() > 0.0f)
        {
            mDirection = heading;
        }
    }
    recomputeSlots();

    if (mDynamic)
    {
        adjustDynamically(dt);
    }
}

inline bool FormationController::inCombat() const
{
    for (AgentId agent : mMembers)
    {
        const AIEnemyShip* ship = mDirectory->find(agent);
        if (ship != nullptr && ship->hasTarget())
        {
            return true;
        }
    }
    return false;
}

inline void FormationController::adjustDynamically(float dt)
{
    if (inCombat())
    {
        if (mTacticalSpread < kCombatSpread)
        {
            setTacticalSpread(kCombatSpread);
        }

        if (mPeakMembers > 0 && mType != FormationType::Sphere)
        {
            const float lost = static_cast<float>(mPeakMembers - mMembers.size());
            if (lost / static_cast<float>(mPeakMembers) > kCasualtyRateForSphere)
            {
                changeFormation(FormationType::Sphere);
            }
        }
        return;
    }

    if (mTacticalSpread > kMinSpread)
    {
        setTacticalSpread(std::max(kMinSpread, mTacticalSpread - kSpreadRecoveryPerSecond * dt));
    }
}

} // namespace fatp_fleet
