#pragma once

/**
 * @file SwarmBehavior.h
 * @brief Flocking steering and fleet-wide emergent behaviors.
 */

// FAT-P components used:
// - SmallVector: Per-ship neighbor snapshots and avoidance rays
//
// Steering is the classic three-rule flock plus world-edge avoidance:
//   separation  steer away from neighbors inside kSeparationRadius,
//               weighted by 1 / distance
//   alignment   match the average heading of neighbors inside
//               kAlignmentRadius
//   cohesion    head for the centroid of neighbors inside kCohesionRadius
//   avoidance   five look-ahead rays; a ray that leaves the world sphere
//               steers back inward, harder the closer the exit
//
// update() computes every force from one snapshot of the swarm before it
// moves anyone, so the result does not depend on iteration order.
//
// Emergent behaviors run at a coarser cadence (FleetManager's formation pass):
//   leadership  a follower clearly fitter than its leader takes over
//   mood        fleet-wide damage sets each ship's swarm BehaviorBias; the
//               bias replaces the previous one, so repeated passes never
//               ratchet the dials
//   group       when two or more ships have a target, attacking ships run
//               their type's group maneuver

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <fat_p/SmallVector.h>

#include "AIEnemyShip.h"
#include "FormationController.h"
#include "FormationRegistry.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

/// @brief Per-rule steering forces for one ship, before weighting.
struct SteeringForces
{
    Vec3 separation;
    Vec3 alignment;
    Vec3 cohesion;
    Vec3 avoidance;
};

/**
 * @brief Boids steering plus the emergent fleet behaviors.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class SwarmBehavior
{
public:
    static constexpr float kDefaultSeparationRadius = 25.0f;
    static constexpr float kDefaultAlignmentRadius = 40.0f;
    static constexpr float kDefaultCohesionRadius = 60.0f;

    static constexpr float kDefaultSeparationWeight = 2.0f;
    static constexpr float kDefaultAlignmentWeight = 1.0f;
    static constexpr float kDefaultCohesionWeight = 1.5f;
    static constexpr float kDefaultAvoidanceWeight = 3.0f;

    static constexpr float kLookAhead = 50.0f;
    static constexpr float kMinForceSquared = 0.001f;
    static constexpr float kMaxForceFactor = 2.0f;

    static constexpr float kLeadershipMargin = 0.1f;
    static constexpr float kHighThreat = 0.7f;
    static constexpr float kLowThreat = 0.3f;

    using Swarm = std::vector<AIEnemyShip*>;

    // =========================================================================
    // Tuning
    // =========================================================================

    /// @throws std::invalid_argument if any weight is negative.
    void setBehaviorWeights(float separation, float alignment, float cohesion, float avoidance)
    {
        if (separation < 0.0f || alignment < 0.0f || cohesion < 0.0f || avoidance < 0.0f)
        {
            throw std::invalid_argument("SwarmBehavior: weights must be >= 0");
        }
        mSeparationWeight = separation;
        mAlignmentWeight = alignment;
        mCohesionWeight = cohesion;
        mAvoidanceWeight = avoidance;
    }

    /// @throws std::invalid_argument if any radius is not positive.
    void setBehaviorRadii(float separation, float alignment, float cohesion)
    {
        if (!(separation > 0.0f) || !(alignment > 0.0f) || !(cohesion > 0.0f))
        {
            throw std::invalid_argument("SwarmBehavior: radii must be > 0");
        }
        mSeparationRadius = separation;
        mAlignmentRadius = alignment;
        mCohesionRadius = cohesion;
    }

    [[nodiscard]] float separationRadius() const noexcept { return mSeparationRadius; }
    [[nodiscard]] float alignmentRadius() const noexcept { return mAlignmentRadius; }
    [[nodiscard]] float cohesionRadius() const noexcept { return mCohesionRadius; }

    // =========================================================================
    // Steering
    // =========================================================================

    /// @brief Unweighted per-rule forces acting on ship.
    [[nodiscard]] SteeringForces forcesFor(const AIEnemyShip& ship, const Swarm& swarm) const
    {
        SteeringForces forces;
        forces.separation = separation(ship, swarm);
        forces.alignment = alignment(ship, swarm);
        forces.cohesion = cohesion(ship, swarm);
        forces.avoidance = avoidance(ship);
        return forces;
    }

    /// @brief Weighted sum of the four rules.
    [[nodiscard]] Vec3 steeringFor(const AIEnemyShip& ship, const Swarm& swarm) const
    {
        const SteeringForces f = forcesFor(ship, swarm);
        return f.separation * mSeparationWeight
             + f.alignment * mAlignmentWeight
             + f.cohesion * mCohesionWeight
             + f.avoidance * mAvoidanceWeight;
    }

    /// @brief Steers every live ship in swarm for dt seconds.
    void update(const Swarm& swarm, float dt)
    {
        mForces.clear();
        mForces.reserve(swarm.size());
        for (const AIEnemyShip* ship : swarm)
        {
            mForces.push_back(ship->isDestroyed() ? Vec3::zero() : steeringFor(*ship, swarm));
        }
        for (std::size_t i = 0; i < swarm.size(); ++i)
        {
            if (!swarm[i]->isDestroyed())
            {
                applySteering(*swarm[i], mForces[i], dt);
            }
        }
    }

    /**
     * @brief Integrates one steering force into velocity and heading.
     *
     * Force is clamped to twice the ship's speed, velocity to its speed.
     */
    static void applySteering(AIEnemyShip& ship, const Vec3& force, float dt)
    {
        if (force.lengthSquared() < kMinForceSquared)
        {
            return;
        }

        const float maxForce = ship.speed() * kMaxForceFactor;
        Vec3 f = force;
        if (f.length() > maxForce)
        {
            f = normalize(f) * maxForce;
        }

        Vec3 v = ship.velocity() + f * dt;
        if (v.length() > ship.speed())
        {
            v = normalize(v) * ship.speed();
        }
        ship.setVelocity(v);

        if (v.lengthSquared() > 0.0f)
        {
            const float t = std::clamp(ship.rotationSpeed() * dt, 0.0f, 1.0f);
            ship.setForward(lerp(ship.forward(), normalize(v), t));
        }
    }

    // =========================================================================
    // Emergent behaviors
    // =========================================================================

    void updateEmergent(const Swarm& swarm, FormationRegistry& formations)
    {
        handleLeadershipEmergence(swarm, formations);
        adaptToThreatLevel(swarm);
        coordinateGroupActions(swarm);
    }

    /// @brief Leadership suitability by hull class.
    [[nodiscard]] static float leadershipTypeScore(ShipType type) noexcept
    {
        switch (type)
        {
        case ShipType::Fighter:     return 1.0f;
        case ShipType::Bomber:      return 0.8f;
        case ShipType::Scout:       return 0.6f;
        case ShipType::Interceptor: return 0.4f;
        }
        return 0.5f;
    }

    [[nodiscard]] static bool isMoreSuitableLeader(const AIEnemyShip& candidate, const AIEnemyShip& leader) noexcept
    {
        const float health = candidate.healthRatio() - leader.healthRatio();
        const float type = leadershipTypeScore(candidate.shipType()) - leadershipTypeScore(leader.shipType());
        const float teamwork = candidate.teamwork() - leader.teamwork();
        return health * 0.4f + type * 0.4f + teamwork * 0.2f > kLeadershipMargin;
    }

    static void handleLeadershipEmergence(const Swarm& swarm, FormationRegistry& formations)
    {
        for (AIEnemyShip* ship : swarm)
        {
            if (ship->isDestroyed())
            {
                continue;
            }
            FormationController* f = formations.formationOf(ship->id());
            if (f == nullptr || f->leader() == ship->id())
            {
                continue;
            }
            const AIEnemyShip* leader = ship->context().hub.find(f->leader());
            if (leader != nullptr && isMoreSuitableLeader(*ship, *leader))
            {
                f->setLeader(ship->id());
            }
        }
    }

    /// @brief 1 - average health ratio over the live ships; 0 when none.
    [[nodiscard]] static float swarmThreatLevel(const Swarm& swarm) noexcept
    {
        float total = 0.0f;
        std::size_t live = 0;
        for (const AIEnemyShip* ship : swarm)
        {
            if (!ship->isDestroyed())
            {
                total += ship->healthRatio();
                ++live;
            }
        }
        return live == 0 ? 0.0f : 1.0f - total / static_cast<float>(live);
    }

    [[nodiscard]] static BehaviorBias moodBias(float threat) noexcept
    {
        BehaviorBias bias;
        if (threat > kHighThreat)
        {
            bias.caution = 0.2f;
            bias.teamwork = 0.3f;
        }
        else if (threat < kLowThreat)
        {
            bias.aggressiveness = 0.1f;
        }
        return bias;
    }

    static void adaptToThreatLevel(const Swarm& swarm)
    {
        const BehaviorBias bias = moodBias(swarmThreatLevel(swarm));
        for (AIEnemyShip* ship : swarm)
        {
            if (!ship->isDestroyed())
            {
                ship->setSwarmBias(bias);
            }
        }
    }

    static void coordinateGroupActions(const Swarm& swarm)
    {
        std::size_t engaged = 0;
        for (const AIEnemyShip* ship : swarm)
        {
            if (!ship->isDestroyed() && ship->hasTarget())
            {
                ++engaged;
            }
        }
        if (engaged < 2)
        {
            return;
        }

        for (AIEnemyShip* ship : swarm)
        {
            if (ship->isDestroyed() || !ship->hasTarget() || !ship->isInState(StateId::Attack))
            {
                continue;
            }
            switch (ship->shipType())
            {
            case ShipType::Scout:
                ship->executeHitAndRun(ship->target()->position);
                break;
            case ShipType::Interceptor:
                ship->executeInterceptManeuver();
                break;
            case ShipType::Fighter:
            case ShipType::Bomber:
                ship->executeCoordinatedManeuver();
                break;
            }
        }
    }

private:
    using RayList = fat_p::SmallVector<Vec3, 8>;

    [[nodiscard]] Vec3 separation(const AIEnemyShip& ship, const Swarm& swarm) const
    {
        Vec3 sum;
        int count = 0;
        for (const AIEnemyShip* other : swarm)
        {
            if (other == &ship || other->isDestroyed())
            {
                continue;
            }
            const float d = ship.distanceTo(other->position());
            if (d > 0.0f && d < mSeparationRadius)
            {
                sum += normalize(ship.position() - other->position()) / d;
                ++count;
            }
        }
        return count > 0 ? normalize(sum / static_cast<float>(count)) : Vec3::zero();
    }

    [[nodiscard]] Vec3 alignment(const AIEnemyShip& ship, const Swarm& swarm) const
    {
        Vec3 sum;
        int count = 0;
        for (const AIEnemyShip* other : swarm)
        {
            if (other == &ship || other->isDestroyed())
            {
                continue;
            }
            if (ship.distanceTo(other->position()) < mAlignmentRadius)
            {
                sum += other->velocity();
                ++count;
            }
        }
        return count > 0 ? normalize(sum / static_cast<float>(count)) : Vec3::zero();
    }

    [[nodiscard]] Vec3 cohesion(const AIEnemyShip& ship, const Swarm& swarm) const
    {
        Vec3 sum;
        int count = 0;
        for (const AIEnemyShip* other : swarm)
        {
            if (other == &ship || other->isDestroyed())
            {
                continue;
            }
            if (ship.distanceTo(other->position()) < mCohesionRadius)
            {
                sum += other->position();
                ++count;
            }
        }
        if (count == 0)
        {
            return Vec3::zero();
        }
        return normalize(sum / static_cast<float>(count) - ship.position());
    }

    [[nodiscard]] static Vec3 avoidance(const AIEnemyShip& ship)
    {
        const WorldBounds& world = ship.context().world;
        const Vec3 forward = ship.forward();
        const Vec3 right = ship.right();
        const Vec3 up = ship.up();

        RayList rays;
        rays.push_back(forward);
        rays.push_back(normalize(forward + right * 0.5f));
        rays.push_back(normalize(forward - right * 0.5f));
        rays.push_back(normalize(forward + up * 0.3f));
        rays.push_back(normalize(forward - up * 0.3f));

        Vec3 sum;
        for (const Vec3& ray : rays)
        {
            const Vec3 end = ship.position() + ray * kLookAhead;
            if (!world.exits(ship.position(), end))
            {
                continue;
            }
            const Vec3 obstacle = world.surfacePoint(end);
            const Vec3 toObstacle = obstacle - ship.position();
            const float d = toObstacle.length();
            const Vec3 n = normalize(toObstacle);
            const Vec3 lateral = normalize(cross(n, up));
            const float weight = std::max(0.0f, 1.0f - d / kLookAhead);
            sum += normalize(-n + lateral * 0.5f) * weight;
        }
        return sum;
    }

    float mSeparationRadius = kDefaultSeparationRadius;
    float mAlignmentRadius = kDefaultAlignmentRadius;
    float mCohesionRadius = kDefaultCohesionRadius;

    float mSeparationWeight = kDefaultSeparationWeight;
    float mAlignmentWeight = kDefaultAlignmentWeight;
    float mCohesionWeight = kDefaultCohesionWeight;
    float mAvoidanceWeight = kDefaultAvoidanceWeight;

    std::vector<Vec3> mForces;
};

} // namespace fatp_fleet
