#pragma once

/**
 * @file FormationMember_Impl.h
 * @brief Out-of-line implementations for FormationMember.
 *
 * Do not include directly. Requires AIEnemyShip and FormationController to be
 * fully defined, ensured by FatpFleet.h include order.
 */

#include <algorithm>

#include "AIEnemyShip.h"
#include "FormationController.h"
#include "FormationMember.h"

namespace fatp_fleet
{

inline void FormationMember::update(float dt)
{
    const FormationController* f = mShip->formation();
    if (f == nullptr)
    {
        return;
    }
    const int index = f->indexOf(mShip->id());
    if (index <= 0)
    {
        return;
    }

    const Vec3 target = f->slotPosition(index);
    if (mHasLastTarget && dt > 0.0f)
    {
        mSlotVelocity = (target - mLastTarget) / dt;
    }
    mLastTarget = target;
    mHasLastTarget = true;
    mTarget = target;

    steer(*f);
}

inline void FormationMember::steer(const FormationController& formation)
{
    const Vec3 toSlot = mTarget - mShip->position();
    const float gap = toSlot.length();

    float cruise = mShip->speed() * mShip->cruiseMultiplier();
    if (formation.formationSpeed() > 0.0f)
    {
        cruise = std::min(cruise, formation.formationSpeed());
    }

    Vec3 desired;
    if (gap <= mTolerance)
    {
        desired = mSlotVelocity + toSlot * kVelocityBlend;
    }
    else
    {
        const float catchUp = std::min(mMaxCatchUp, gap / std::max(mTolerance, 1.0f));
        desired = normalize(toSlot) * (cruise * catchUp) + mSlotVelocity * kVelocityBlend;
    }

    mShip->setVelocity(lerp(mShip->velocity(), desired, mSmoothing));

    if (gap > mTolerance)
    {
        mShip->lookAt(mTarget);
    }
    else if (mSlotVelocity.lengthSquared() > 0.0f)
    {
        mShip->lookAt(mShip->position() + mSlotVelocity);
    }
}

inline void FormationMember::snap()
{
    const FormationController* f = mShip->formation();
    if (f == nullptr)
    {
        return;
    }
    const int index = f->indexOf(mShip->id());
    if (index < 0)
    {
        return;
    }
    mTarget = f->slotPosition(index);
    mShip->setPosition(mTarget);
    mShip->setVelocity(Vec3::zero());
    mLastTarget = mTarget;
    mHasLastTarget = true;
    mSlotVelocity = Vec3::zero();
}

inline bool FormationMember::canBreakFormation() const
{
    const FormationController* f = mShip->formation();
    return f != nullptr && f->indexOf(mShip->id()) > 0 && f->memberCount() > 3;
}

inline float FormationMember::formationPriority() const
{
    const FormationController* f = mShip->formation();
    if (f == nullptr)
    {
        return 0.0f;
    }
    const int index = f->indexOf(mShip->id());
    if (index < 0)
    {
        return 0.0f;
    }

    float priority = 0.5f;
    if (index == 0)
    {
        priority += 0.3f;
    }

    switch (f->type())
    {
    case FormationType::VFormation:
        if (index <= 2)
        {
            priority += 0.2f;
        }
        break;
    case FormationType::Diamond:
        if (index <= 3)
        {
            priority += 0.2f;
        }
        break;
    case FormationType::Sphere:
        priority += 0.1f;
        break;
    default:
        break;
    }

    switch (mShip->shipType())
    {
    case ShipType::Bomber:      priority += 0.2f; break;
    case ShipType::Scout:       priority -= 0.1f; break;
    case ShipType::Interceptor: priority -= 0.2f; break;
    case ShipType::Fighter:     break;
    }

    return std::clamp(priority, 0.0f, 1.0f);
}

inline float FormationMember::distanceFromPosition() const
{
    const FormationController* f = mShip->formation();
    if (f == nullptr)
    {
        return 0.0f;
    }
    const int index = f->indexOf(mShip->id());
    if (index < 0)
    {
        return 0.0f;
    }
    return distance(mShip->position(), f->slotPosition(index));
}

inline bool FormationMember::isInPosition() const
{
    return distanceFromPosition() <= mTolerance;
}

} // namespace fatp_fleet
