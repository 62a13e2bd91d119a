#pragma once

/**
 * @file Navigator.h
 * @brief Waypoint path following with ray-probe obstacle avoidance.
 */

// A path is a straight line from the agent to the destination, split into
// waypoints every kWaypointSpacing units when the leg is longer than
// kDirectPathLimit. The start point is not part of the path.
//
// Each update steers toward the current waypoint, advances when it is within
// the arrival threshold, and stops the ship on the last one. Obstacle
// avoidance casts nine short rays along the ship's basis and blends an
// escape velocity into the steering result. The only obstacles the core
// knows about are neighboring agents (spheres of radius Size) and the surface
// of the world sphere (FleetContext::world), which counts only for probes that
// start inside it; anything else belongs to the physics layer.
//
// The navigator only writes intents through the ship (moveToward, lookAt,
// stop, setVelocity). It never moves the ship itself.

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

#include "Vec3.h"

namespace fatp_fleet
{

class AIEnemyShip;

/**
 * @brief Per-agent path follower.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class Navigator
{
public:
    static constexpr float kDefaultArrivalThreshold = 15.0f;
    static constexpr float kWaypointSpacing = 80.0f;
    static constexpr float kDirectPathLimit = 100.0f;
    static constexpr float kAvoidanceRadius = 30.0f;
    static constexpr float kWorldObstacleRadius = 10.0f;

    /// @brief Raw avoidance magnitude above which the path is re-planned.
    static constexpr float kReplanThreshold = 0.7f;

    explicit Navigator(AIEnemyShip& ship)
        : mShip(&ship)
    {
    }

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    /// @brief Follows the path and applies avoidance. No-op without a path.
    void update(float dt);

    /// @brief Plans a fresh path from the ship's position to destination.
    void setDestination(const Vec3& destination);

    /// @brief Drops the path and zeroes the ship's velocity.
    void stop();

    /// @brief Drops the path and leaves velocity to whoever steers next.
    void cancel() noexcept
    {
        mPath.clear();
        mIndex = 0;
    }

    [[nodiscard]] bool hasPath() const noexcept { return mIndex < mPath.size(); }
    [[nodiscard]] bool hasReachedDestination() const;

    [[nodiscard]] const Vec3& destination() const noexcept { return mDestination; }

    /// @brief Waypoint being steered toward, or the destination when idle.
    [[nodiscard]] Vec3 currentWaypoint() const noexcept
    {
        return hasPath() ? mPath[mIndex] : mDestination;
    }

    [[nodiscard]] const std::vector<Vec3>& path() const noexcept { return mPath; }

    [[nodiscard]] float distanceToDestination() const;

    /// @brief Seconds to the destination at current speed; FLT_MAX if stationary.
    [[nodiscard]] float estimatedTimeToDestination() const;

    /// @throws std::invalid_argument if threshold is not positive.
    void setArrivalThreshold(float threshold)
    {
        if (!(threshold > 0.0f))
        {
            throw std::invalid_argument("Navigator: arrival threshold must be > 0");
        }
        mArrivalThreshold = threshold;
    }

    [[nodiscard]] float arrivalThreshold() const noexcept { return mArrivalThreshold; }

    /// @brief Waypoints from start (exclusive) to end (inclusive).
    [[nodiscard]] static std::vector<Vec3> planPath(const Vec3& start, const Vec3& end)
    {
        std::vector<Vec3> path;
        const float length = distance(start, end);
        if (length > kDirectPathLimit)
        {
            const int segments = static_cast<int>(length / kWaypointSpacing);
            for (int i = 1; i < segments; ++i)
            {
                const float t = static_cast<float>(i) / static_cast<float>(segments);
                path.push_back(lerp(start, end, t));
            }
        }
        path.push_back(end);
        return path;
    }

    /// @brief Segment start..end against a sphere.
    [[nodiscard]] static bool segmentHitsSphere(const Vec3& start,
                                                const Vec3& end,
                                                const Vec3& center,
                                                float radius) noexcept
    {
        const Vec3 dir = normalize(end - start);
        const float length = distance(start, end);
        float along = dot(center - start, dir);
        along = along < 0.0f ? 0.0f : (along > length ? length : along);
        const Vec3 closest = start + dir * along;
        return distance(closest, center) <= radius;
    }

private:
    void followPath();
    void applyAvoidance();

    /// @brief Sum of weighted escape directions, not normalized.
    [[nodiscard]] Vec3 computeAvoidance() const;
    [[nodiscard]] bool detectObstacle(const Vec3& start,
                                      const Vec3& end,
                                      Vec3& obstacle,
                                      float& radius) const;
    [[nodiscard]] Vec3 avoidanceDirection(const Vec3& toObstacle) const;

    AIEnemyShip* mShip;
    Vec3 mDestination;
    std::vector<Vec3> mPath;
    std::size_t mIndex = 0;
    float mArrivalThreshold = kDefaultArrivalThreshold;
};

} // namespace fatp_fleet
