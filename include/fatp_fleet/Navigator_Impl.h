#pragma once

/**
 * @file Navigator_Impl.h
 * @brief Out-of-line implementations for Navigator.
 *
 * Do not include directly. Requires AIEnemyShip to be fully defined, ensured
 * by FatpFleet.h include order.
 */

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "AIEnemyShip.h"
#include "Navigator.h"

namespace fatp_fleet
{

// =============================================================================
// Path following
// =============================================================================

inline void Navigator::update(float /*dt*/)
{
    if (!hasPath())
    {
        return;
    }
    followPath();
    if (hasPath())
    {
        applyAvoidance();
    }
}

inline void Navigator::setDestination(const Vec3& destination)
{
    mDestination = destination;
    mPath = planPath(mShip->position(), destination);
    mIndex = 0;
}

inline void Navigator::stop()
{
    cancel();
    mShip->stop();
}

inline bool Navigator::hasReachedDestination() const
{
    return distance(mShip->position(), mDestination) <= mArrivalThreshold;
}

inline float Navigator::distanceToDestination() const
{
    if (!hasPath())
    {
        return distance(mShip->position(), mDestination);
    }
    float total = distance(mShip->position(), mPath[mIndex]);
    for (std::size_t i = mIndex + 1; i < mPath.size(); ++i)
    {
        total += distance(mPath[i - 1], mPath[i]);
    }
    return total;
}

inline float Navigator::estimatedTimeToDestination() const
{
    const float speed = mShip->velocity().length();
    if (speed < 1e-3f)
    {
        return std::numeric_limits<float>::max();
    }
    return distanceToDestination() / speed;
}

inline void Navigator::followPath()
{
    while (hasPath() && distance(mShip->position(), mPath[mIndex]) < mArrivalThreshold)
    {
        ++mIndex;
    }
    if (!hasPath())
    {
        mShip->stop();
        return;
    }

    const Vec3& waypoint = mPath[mIndex];
    mShip->moveToward(waypoint, mShip->cruiseMultiplier());
    mShip->lookAt(waypoint);
}

// =============================================================================
// Obstacle avoidance
// =============================================================================

inline void Navigator::applyAvoidance()
{
    const Vec3 avoidance = computeAvoidance();
    if (avoidance.lengthSquared() == 0.0f)
    {
        return;
    }

    const float speed = mShip->velocity().length();
    const Vec3 heading = normalize(normalize(mShip->velocity()) + normalize(avoidance));
    if (heading.lengthSquared() > 0.0f)
    {
        mShip->setVelocity(heading * speed);
    }

    if (avoidance.length() > kReplanThreshold)
    {
        const Vec3 destination = mDestination;
        setDestination(destination);
    }
}

inline Vec3 Navigator::computeAvoidance() const
{
    const Vec3 forward = mShip->forward();
    const Vec3 right = mShip->right();
    const Vec3 up = mShip->up();

    const std::array<Vec3, 9> rays = {
        forward,
        forward + right,
        forward - right,
        forward + up,
        forward - up,
        forward + right + up,
        forward + right - up,
        forward - right + up,
        forward - right - up,
    };

    const Vec3 start = mShip->position();
    Vec3 sum;
    for (const Vec3& ray : rays)
    {
        const Vec3 end = start + normalize(ray) * kAvoidanceRadius;
        Vec3 obstacle;
        float radius = 0.0f;
        if (!detectObstacle(start, end, obstacle, radius))
        {
            continue;
        }
        const float reach = kAvoidanceRadius + radius;
        const float weight = std::max(0.0f, 1.0f - distance(start, obstacle) / reach);
        sum += avoidanceDirection(obstacle - start) * weight;
    }
    return sum;
}

inline bool Navigator::detectObstacle(const Vec3& start,
                                      const Vec3& end,
                                      Vec3& obstacle,
                                      float& radius) const
{
    bool found = false;
    float nearest = std::numeric_limits<float>::max();

    for (const AIEnemyShip* other : mShip->nearbyAllyShips())
    {
        if (!segmentHitsSphere(start, end, other->position(), other->size()))
        {
            continue;
        }
        const float d = distance(start, other->position());
        if (d < nearest)
        {
            nearest = d;
            obstacle = other->position();
            radius = other->size();
            found = true;
        }
    }
    if (found)
    {
        return true;
    }

    const WorldBounds& world = mShip->context().world;
    if (world.exits(start, end))
    {
        obstacle = world.surfacePoint(end);
        radius = kWorldObstacleRadius;
        return true;
    }
    return false;
}

inline Vec3 Navigator::avoidanceDirection(const Vec3& toObstacle) const
{
    const Vec3 away = -normalize(toObstacle);
    Vec3 lateral = cross(normalize(toObstacle), mShip->up());
    lateral = normalize(lateral);
    return normalize(away + lateral * 0.5f);
}

} // namespace fatp_fleet
