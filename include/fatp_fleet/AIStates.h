#pragma once

/**
 * @file AIStates.h
 * @brief The five behavior states: Patrol, Attack, Pursue, Flee, Support.
 */

// Transition graph:
//
//   Patrol  --target visible-->                         Attack
//   Attack  --badly hurt and cautious-->                Flee
//   Attack  --no target, or unseen for 5 s-->           Pursue
//   Attack  --a neighbor is in distress-->              Support
//   Pursue  --target visible-->                         Attack
//   Pursue  --10 s without contact-->                   Patrol
//   Flee    --5 s, health > 60%, 2+ neighbors-->        Attack
//   Flee    --no target, or far out of detection-->     Patrol
//   Support --ally recovered, lost, or 15 s elapsed-->  Attack
//
// Random choices (patrol route, search points) draw from the shared
// FleetContext engine so a seeded run replays exactly.
//
// checkTransitions() bodies are defined at the bottom of this file, after
// every state class is complete.

#include <array>
#include <cmath>
#include <cstddef>
#include <memory>

#include "AIEnemyShip.h"
#include "AIState.h"
#include "Message.h"
#include "Vec3.h"

namespace fatp_fleet
{

// =============================================================================
// PatrolState
// =============================================================================

/// @brief Loops a four-point route around the entry position.
class PatrolState final : public AIState
{
public:
    static constexpr std::size_t kPointCount = 4;
    static constexpr float kPatrolRadius = 100.0f;
    static constexpr float kAngleJitterDeg = 30.0f;
    static constexpr float kVerticalSpread = 50.0f;
    static constexpr float kPointReached = 20.0f;

    [[nodiscard]] StateId id() const noexcept override { return StateId::Patrol; }

    void onEnter(AIEnemyShip& ship) override
    {
        generateRoute(ship.position(), ship.context());
        mIndex = 0;
        ship.navigator().setDestination(mPoints[mIndex]);
    }

    void update(AIEnemyShip& ship, float /*dt*/) override
    {
        if (ship.isFollowingFormation())
        {
            ship.navigator().cancel();
            return;
        }

        if (distance(ship.position(), mPoints[mIndex]) < kPointReached)
        {
            mIndex = (mIndex + 1) % kPointCount;
            ship.navigator().setDestination(mPoints[mIndex]);
        }
        else if (!ship.navigator().hasPath())
        {
            ship.navigator().setDestination(mPoints[mIndex]);
        }
    }

    [[nodiscard]] std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) override;

    [[nodiscard]] const std::array<Vec3, kPointCount>& route() const noexcept { return mPoints; }
    [[nodiscard]] std::size_t routeIndex() const noexcept { return mIndex; }

private:
    void generateRoute(const Vec3& center, FleetContext& ctx)
    {
        constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;
        for (std::size_t i = 0; i < kPointCount; ++i)
        {
            const float angle = (360.0f / static_cast<float>(kPointCount)) * static_cast<float>(i) +
                                ctx.randomRange(-kAngleJitterDeg, kAngleJitterDeg);
            const float radius = kPatrolRadius * ctx.randomRange(0.7f, 1.3f);
            const float height = ctx.randomRange(-0.5f, 0.5f) * kVerticalSpread;
            mPoints[i] = center + Vec3(std::cos(angle * kDegToRad) * radius,
                                       height,
                                       std::sin(angle * kDegToRad) * radius);
        }
    }

    std::array<Vec3, kPointCount> mPoints{};
    std::size_t mIndex = 0;
};

// =============================================================================
// AttackState
// =============================================================================

/// @brief Holds preferred range on the target and makes periodic group calls.
class AttackState final : public AIState
{
public:
    static constexpr float kTacticalInterval = 2.0f;
    static constexpr float kCloseInFactor = 1.2f;
    static constexpr float kBackOffFactor = 0.8f;
    static constexpr float kBackOffDistance = 30.0f;

    static constexpr float kFleeHealthRatio = 0.25f;
    static constexpr float kFleeCaution = 0.6f;
    static constexpr float kTargetLostAfter = 5.0f;
    static constexpr float kAllyDistressRatio = 0.3f;
    static constexpr float kSupportTeamwork = 0.7f;

    static constexpr std::size_t kOutnumberedBelow = 2;
    static constexpr float kRequestSupportTeamwork = 0.5f;

    [[nodiscard]] StateId id() const noexcept override { return StateId::Attack; }

    void onEnter(AIEnemyShip& ship) override
    {
        if (!ship.hasTarget())
        {
            return;
        }
        const Contact& target = *ship.target();
        mLastKnownTarget = target.position;

        ContactReport report;
        report.velocity = target.velocity;
        report.health = target.health;
        (void)ship.communication().broadcastMessage(
            makeMessage(MessageType::EngagingTarget, ship.id(), target.position, report));
    }

    void update(AIEnemyShip& ship, float dt) override
    {
        mEngagementTime += dt;
        mTacticalTimer += dt;

        if (!ship.hasTarget())
        {
            return;
        }
        const Vec3 targetPos = ship.target()->position;

        if (ship.canSee(targetPos))
        {
            mLastKnownTarget = targetPos;
            ship.setLastKnownPlayerPosition(targetPos);
            ship.setLastPlayerSightingTime(0.0f);
        }

        engage(ship, targetPos);

        if (mTacticalTimer >= kTacticalInterval * ship.reactionTime())
        {
            decide(ship);
            mTacticalTimer = 0.0f;
        }
    }

    [[nodiscard]] std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) override;

    [[nodiscard]] float engagementTime() const noexcept { return mEngagementTime; }
    [[nodiscard]] const Vec3& lastKnownTarget() const noexcept { return mLastKnownTarget; }

private:
    static void engage(AIEnemyShip& ship, const Vec3& targetPos)
    {
        const float range = ship.distanceTo(targetPos);
        const float preferred = ship.preferredEngagementRange();

        if (range > preferred * kCloseInFactor)
        {
            ship.navigator().setDestination(targetPos);
        }
        else if (range < preferred * kBackOffFactor)
        {
            const Vec3 away = normalize(ship.position() - targetPos);
            ship.navigator().setDestination(ship.position() + away * kBackOffDistance);
        }
        else
        {
            ship.executeSignatureManeuver();
        }

        if (ship.canAttack() && ship.isInRange(targetPos, ship.attackRange()))
        {
            ship.attack();
        }
    }

    static void decide(AIEnemyShip& ship)
    {
        const std::size_t allies = ship.nearbyAllyCount();

        if (allies < kOutnumberedBelow && ship.teamwork() > kRequestSupportTeamwork)
        {
            SupportRequest request;
            request.healthRatio = ship.healthRatio();
            request.shipType = ship.shipType();
            (void)ship.communication().broadcastMessage(
                makeMessage(MessageType::RequestSupport, ship.id(), ship.position(), request));
        }

        if (allies >= kOutnumberedBelow)
        {
            ship.executeCoordinatedManeuver();
        }
    }

    Vec3 mLastKnownTarget;
    float mEngagementTime = 0.0f;
    float mTacticalTimer = 0.0f;
};

// =============================================================================
// PursueState
// =============================================================================

/// @brief Searches an expanding volume around the last sighting.
class PursueState final : public AIState
{
public:
    static constexpr float kInitialSearchRadius = 80.0f;
    static constexpr float kSearchGrowthPerSecond = 20.0f;
    static constexpr float kMaxSearchTime = 10.0f;
    static constexpr float kPointReached = 15.0f;

    [[nodiscard]] StateId id() const noexcept override { return StateId::Pursue; }

    void onEnter(AIEnemyShip& ship) override
    {
        mCenter = ship.lastKnownPlayerPosition();
        mSearchTime = 0.0f;
        mSearchRadius = kInitialSearchRadius;
        ship.navigator().setDestination(mCenter);
    }

    void update(AIEnemyShip& ship, float dt) override
    {
        mSearchTime += dt;
        mSearchRadius += dt * kSearchGrowthPerSecond;

        if (distance(ship.position(), ship.navigator().destination()) < kPointReached)
        {
            FleetContext& ctx = ship.context();
            const Vec3 offset(ctx.randomRange(-0.5f, 0.5f) * mSearchRadius,
                              ctx.randomRange(-0.5f, 0.5f) * mSearchRadius * 0.5f,
                              ctx.randomRange(-0.5f, 0.5f) * mSearchRadius);
            ship.navigator().setDestination(mCenter + offset);
        }
    }

    [[nodiscard]] std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) override;

    [[nodiscard]] float searchRadius() const noexcept { return mSearchRadius; }
    [[nodiscard]] float searchTime() const noexcept { return mSearchTime; }
    [[nodiscard]] const Vec3& searchCenter() const noexcept { return mCenter; }

private:
    Vec3 mCenter;
    float mSearchRadius = kInitialSearchRadius;
    float mSearchTime = 0.0f;
};

// =============================================================================
// FleeState
// =============================================================================

/// @brief Runs away from the target toward friends and asks for an escort.
class FleeState final : public AIState
{
public:
    static constexpr float kMinFleeTime = 5.0f;
    static constexpr float kRecoveredRatio = 0.6f;
    static constexpr std::size_t kRegroupAllies = 2;
    static constexpr float kSafetyDistance = 100.0f;
    static constexpr float kDisengageFactor = 1.5f;

    [[nodiscard]] StateId id() const noexcept override { return StateId::Flee; }

    void onEnter(AIEnemyShip& ship) override
    {
        mSafety = safetyPosition(ship);
        mFleeTime = 0.0f;
        ship.navigator().setDestination(mSafety);

        EscortRequest request;
        request.healthRatio = ship.healthRatio();
        (void)ship.communication().broadcastMessage(
            makeMessage(MessageType::RequestEscort, ship.id(), ship.position(), request));
    }

    void update(AIEnemyShip& ship, float dt) override
    {
        mFleeTime += dt;
        ship.executeEvasion();
    }

    [[nodiscard]] std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) override;

    [[nodiscard]] const Vec3& safetyPoint() const noexcept { return mSafety; }
    [[nodiscard]] float fleeTime() const noexcept { return mFleeTime; }

    /// @brief 100 units away from the target, bent toward the allies' centroid.
    [[nodiscard]] static Vec3 safetyPosition(const AIEnemyShip& ship)
    {
        Vec3 direction;
        if (ship.hasTarget())
        {
            direction += normalize(ship.position() - ship.target()->position) * 2.0f;
        }
        if (ship.nearbyAllyCount() > 0)
        {
            direction += normalize(ship.averageAllyPosition() - ship.position());
        }
        direction = normalize(direction);
        if (direction.lengthSquared() == 0.0f)
        {
            direction = -ship.forward();
        }
        return ship.position() + direction * kSafetyDistance;
    }

private:
    Vec3 mSafety;
    float mFleeTime = 0.0f;
};

// =============================================================================
// SupportState
// =============================================================================

/// @brief Covers the neediest neighbor from the side facing its attacker.
class SupportState final : public AIState
{
public:
    static constexpr float kNeedRatio = 0.5f;
    static constexpr float kRecoveredRatio = 0.7f;
    static constexpr float kMaxSupportTime = 15.0f;
    static constexpr float kLateralOffset = 30.0f;

    [[nodiscard]] StateId id() const noexcept override { return StateId::Support; }

    void onEnter(AIEnemyShip& ship) override
    {
        mAlly = neediestAlly(ship);
        mSupportTime = 0.0f;
    }

    void update(AIEnemyShip& ship, float dt) override
    {
        mSupportTime += dt;

        AIEnemyShip* ally = resolveAlly(ship);
        if (ally == nullptr)
        {
            return;
        }

        ship.navigator().setDestination(coverPosition(*ally));

        if (ally->hasTarget() && ship.isInRange(ally->target()->position, ship.attackRange()))
        {
            ship.setTarget(*ally->target());
            if (ship.canAttack())
            {
                ship.attack();
            }
        }
    }

    [[nodiscard]] std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) override;

    [[nodiscard]] AgentId supportedAlly() const noexcept { return mAlly; }

    /// @brief Lowest-health neighbor below kNeedRatio, or NullAgent.
    [[nodiscard]] static AgentId neediestAlly(const AIEnemyShip& ship)
    {
        AgentId best = NullAgent;
        float lowest = kNeedRatio;
        for (AIEnemyShip* ally : ship.nearbyAllyShips())
        {
            const float ratio = ally->healthRatio();
            if (ratio < lowest)
            {
                lowest = ratio;
                best = ally->id();
            }
        }
        return best;
    }

    /// @brief Beside the ally, offset perpendicular to its line of fire.
    [[nodiscard]] static Vec3 coverPosition(const AIEnemyShip& ally)
    {
        if (!ally.hasTarget())
        {
            return ally.position();
        }
        const Vec3 toTarget = normalize(ally.target()->position - ally.position());
        return ally.position() + normalize(cross(toTarget, Vec3::unitY())) * kLateralOffset;
    }

private:
    [[nodiscard]] AIEnemyShip* resolveAlly(const AIEnemyShip& ship) const
    {
        if (mAlly == NullAgent)
        {
            return nullptr;
        }
        AIEnemyShip* ally = ship.context().hub.find(mAlly);
        return (ally != nullptr && !ally->isDestroyed()) ? ally : nullptr;
    }

    AgentId mAlly = NullAgent;
    float mSupportTime = 0.0f;
};

// =============================================================================
// Transitions
// =============================================================================

inline std::unique_ptr<AIState> PatrolState::checkTransitions(AIEnemyShip& ship)
{
    if (ship.hasTarget() && ship.canSee(ship.target()->position))
    {
        return std::make_unique<AttackState>();
    }
    return nullptr;
}

inline std::unique_ptr<AIState> AttackState::checkTransitions(AIEnemyShip& ship)
{
    if (ship.healthRatio() < kFleeHealthRatio && ship.caution() > kFleeCaution)
    {
        return std::make_unique<FleeState>();
    }

    if (!ship.hasTarget() || ship.lastPlayerSightingTime() > kTargetLostAfter)
    {
        return std::make_unique<PursueState>();
    }

    if (ship.teamwork() > kSupportTeamwork)
    {
        for (AIEnemyShip* ally : ship.nearbyAllyShips())
        {
            if (ally->healthRatio() < kAllyDistressRatio)
            {
                if (ally->hasTarget())
                {
                    ship.setTarget(*ally->target());
                }
                return std::make_unique<SupportState>();
            }
        }
    }
    return nullptr;
}

inline std::unique_ptr<AIState> PursueState::checkTransitions(AIEnemyShip& ship)
{
    if (ship.hasTarget() && ship.canSee(ship.target()->position))
    {
        return std::make_unique<AttackState>();
    }
    if (mSearchTime > kMaxSearchTime)
    {
        return std::make_unique<PatrolState>();
    }
    return nullptr;
}

inline std::unique_ptr<AIState> FleeState::checkTransitions(AIEnemyShip& ship)
{
    if (mFleeTime > kMinFleeTime &&
        ship.healthRatio() > kRecoveredRatio &&
        ship.nearbyAllyCount() >= kRegroupAllies)
    {
        return std::make_unique<AttackState>();
    }

    if (!ship.hasTarget() ||
        ship.distanceTo(ship.target()->position) > ship.detectionRange() * kDisengageFactor)
    {
        return std::make_unique<PatrolState>();
    }
    return nullptr;
}

inline std::unique_ptr<AIState> SupportState::checkTransitions(AIEnemyShip& ship)
{
    const AIEnemyShip* ally = resolveAlly(ship);
    if (ally == nullptr ||
        ally->healthRatio() > kRecoveredRatio ||
        mSupportTime > kMaxSupportTime)
    {
        return std::make_unique<AttackState>();
    }
    return nullptr;
}

} // namespace fatp_fleet
