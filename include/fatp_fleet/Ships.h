#pragma once

/**
 * @file Ships.h
 * @brief The four enemy subtypes: Scout, Fighter, Bomber, Interceptor.
 */

// Each subtype fixes its baseline stats and personality, its weapon cadence,
// and its tactical hooks. Weapons fire by publishing AttackIntents; the
// projectile layer outside the core turns them into shots.
//
// All timers are dt accumulators driven from update().

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "AIEnemyShip.h"
#include "AIStates.h"
#include "Message.h"
#include "Vec3.h"

namespace fatp_fleet
{

// =============================================================================
// FighterShip
// =============================================================================

/// @brief Balanced ship firing three-round bursts; flanks and rings targets.
class FighterShip final : public AIEnemyShip
{
public:
    static constexpr float kCooldown = 1.2f;
    static constexpr int kBurstLength = 3;
    static constexpr float kBurstInterval = 0.3f;
    static constexpr float kProjectileSpeed = 200.0f;
    static constexpr float kFlankClearance = 30.0f;
    static constexpr float kRingSlotReached = 20.0f;

    [[nodiscard]] static ShipStats defaultStats() noexcept
    {
        ShipStats s;
        s.maxHealth = 80.0f;
        s.speed = 80.0f;
        s.rotationSpeed = 2.5f;
        s.detectionRange = 150.0f;
        s.attackRange = 100.0f;
        s.size = 12.0f;
        s.aggressiveness = 0.6f;
        s.caution = 0.4f;
        s.teamwork = 0.7f;
        return s;
    }

    FighterShip(AgentId id, FleetContext& context, const Vec3& position = Vec3::zero())
        : AIEnemyShip(id, defaultStats(), Personality::Balanced, context, position)
    {
        initializeBehavior();
    }

    [[nodiscard]] ShipType shipType() const noexcept override { return ShipType::Fighter; }
    [[nodiscard]] float preferredEngagementRange() const noexcept override { return attackRange() * 0.7f; }

    [[nodiscard]] bool canAttack() const override
    {
        const bool burstReady = mBurstCount > 0 && mBurstCount < kBurstLength && mBurstTimer >= kBurstInterval;
        return timeSinceLastAttack() >= kCooldown || burstReady;
    }

    void attack() override
    {
        if (!hasTarget() || !canAttack())
        {
            return;
        }
        const Contact& t = *target();
        const float lead = distanceTo(t.position) / kProjectileSpeed;
        emitAttack(AttackKind::Medium, t.position + t.velocity * lead);

        if (mBurstCount == 0)
        {
            resetAttackTimer();
            mBurstCount = 1;
        }
        else
        {
            ++mBurstCount;
            if (mBurstCount >= kBurstLength)
            {
                mBurstCount = 0;
            }
        }
        mBurstTimer = 0.0f;
    }

    void update(float dt) override
    {
        AIEnemyShip::update(dt);
        mBurstTimer += dt;
    }

    /// @brief Flanks on whichever side of the target has fewer allies.
    void executeSignatureManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        const Vec3 targetPos = target()->position;
        const Vec3 flank = cross(normalize(targetPos - position()), up());
        const Vec3 rightFlank = targetPos + flank * preferredEngagementRange();
        const Vec3 leftFlank = targetPos - flank * preferredEngagementRange();

        const bool useRight = countAlliesNear(rightFlank, kFlankClearance) <=
                              countAlliesNear(leftFlank, kFlankClearance);
        navigator().setDestination(useRight ? rightFlank : leftFlank);
    }

    /// @brief Takes an evenly spaced slot on a ring around the target.
    void executeCoordinatedManeuver() override
    {
        if (!hasTarget() || nearbyAllyCount() == 0)
        {
            return;
        }
        constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;
        const Vec3 targetPos = target()->position;
        const float anglePerShip = 360.0f / static_cast<float>(nearbyAllyCount() + 1);
        const float angle = static_cast<float>(std::max(0, formationIndex())) * anglePerShip * kDegToRad;
        const float radius = preferredEngagementRange();
        const Vec3 slot = targetPos + Vec3(std::cos(angle) * radius, 0.0f, std::sin(angle) * radius);

        navigator().setDestination(slot);

        if (distanceTo(slot) < kRingSlotReached && isInRange(targetPos, attackRange()))
        {
            attack();
        }
    }

    [[nodiscard]] int burstCount() const noexcept { return mBurstCount; }

private:
    int mBurstCount = 0;
    float mBurstTimer = 0.0f;
};

// =============================================================================
// BomberShip
// =============================================================================

/// @brief Slow heavy hitter: charges a shot, fights from cover, needs escort.
class BomberShip final : public AIEnemyShip
{
public:
    static constexpr float kCooldown = 4.0f;
    static constexpr float kChargeDuration = 2.0f;
    static constexpr float kProjectileSpeed = 100.0f;
    static constexpr float kRecoil = 20.0f;
    static constexpr float kCoverOffset = 30.0f;
    static constexpr float kRetreatDistance = 100.0f;
    static constexpr float kEscortRequestInterval = 2.0f;

    [[nodiscard]] static ShipStats defaultStats() noexcept
    {
        ShipStats s;
        s.maxHealth = 150.0f;
        s.speed = 50.0f;
        s.rotationSpeed = 1.5f;
        s.detectionRange = 120.0f;
        s.attackRange = 120.0f;
        s.size = 18.0f;
        s.aggressiveness = 0.4f;
        s.caution = 0.7f;
        s.teamwork = 0.9f;
        return s;
    }

    BomberShip(AgentId id, FleetContext& context, const Vec3& position = Vec3::zero())
        : AIEnemyShip(id, defaultStats(), Personality::Defensive, context, position)
    {
        initializeBehavior();
    }

    [[nodiscard]] ShipType shipType() const noexcept override { return ShipType::Bomber; }
    [[nodiscard]] float preferredEngagementRange() const noexcept override { return attackRange() * 0.9f; }

    [[nodiscard]] bool canAttack() const override
    {
        return timeSinceLastAttack() >= kCooldown && !mCharging;
    }

    /// @brief Starts the charge. The shot leaves kChargeDuration later.
    void attack() override
    {
        if (!hasTarget() || !canAttack())
        {
            return;
        }
        mCharging = true;
        mChargeTime = 0.0f;
        stop();
    }

    void update(float dt) override
    {
        AIEnemyShip::update(dt);
        mEscortTimer += dt;

        if (mCharging)
        {
            mChargeTime += dt;
            if (mChargeTime >= kChargeDuration)
            {
                fireHeavy();
                mCharging = false;
                resetAttackTimer();
            }
        }
    }

    /// @brief Fires from behind an ally at a good range, else sidesteps.
    void executeSignatureManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        const Vec3 targetPos = target()->position;
        const Vec3 toTarget = normalize(targetPos - position());

        for (AIEnemyShip* ally : nearbyAllyShips())
        {
            const Vec3 behind = ally->position() - normalize(targetPos - ally->position()) * kCoverOffset;
            const float range = distance(behind, targetPos);
            if (range <= attackRange() * 1.1f && range >= attackRange() * 0.8f)
            {
                navigator().setDestination(behind);
                return;
            }
        }

        const Vec3 side = cross(toTarget, up());
        navigator().setDestination(position() + side * 40.0f - toTarget * 20.0f);
    }

    /// @brief Fires together with every neighboring bomber once all are ready.
    void executeCoordinatedManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        bool anyBomber = false;
        for (AIEnemyShip* ally : nearbyAllyShips())
        {
            if (ally->shipType() != ShipType::Bomber)
            {
                continue;
            }
            anyBomber = true;
            if (!ally->canAttack())
            {
                return;
            }
        }
        if (!anyBomber || !canAttack())
        {
            return;
        }

        (void)communication().broadcastMessage(makeMessage(MessageType::CoordinatedAttack,
                                                           id(),
                                                           target()->position,
                                                           CoordinatedAttack::BombardmentReady));
        attack();
    }

    /// @brief Retreats toward friends and keeps asking for an escort.
    void executeEvasion() override
    {
        Vec3 direction;
        if (hasTarget())
        {
            direction += normalize(position() - target()->position) * 2.0f;
        }
        if (nearbyAllyCount() > 0)
        {
            direction += normalize(averageAllyPosition() - position());
        }
        direction = normalize(direction);
        if (direction.lengthSquared() > 0.0f)
        {
            navigator().setDestination(position() + direction * kRetreatDistance);
        }

        if (mEscortTimer >= kEscortRequestInterval)
        {
            EscortRequest request;
            request.healthRatio = healthRatio();
            (void)communication().broadcastMessage(
                makeMessage(MessageType::RequestEscort, id(), position(), request));
            mEscortTimer = 0.0f;
        }
    }

    [[nodiscard]] bool isCharging() const noexcept { return mCharging; }

    /// @brief Holds position while the shot charges.
    [[nodiscard]] float cruiseMultiplier() const noexcept override { return mCharging ? 0.0f : 1.0f; }

private:
    void fireHeavy()
    {
        if (!hasTarget())
        {
            return;
        }
        const Contact& t = *target();
        const float lead = distanceTo(t.position) / kProjectileSpeed;
        const Vec3 aim = t.position + t.velocity * lead;
        emitAttack(AttackKind::Heavy, aim);
        setVelocity(velocity() - normalize(aim - position()) * kRecoil);
    }

    bool mCharging = false;
    float mChargeTime = 0.0f;
    float mEscortTimer = kEscortRequestInterval;
};

// =============================================================================
// InterceptorShip
// =============================================================================

/// @brief Very fast close-range striker with a timed speed boost.
class InterceptorShip final : public AIEnemyShip
{
public:
    static constexpr float kCooldown = 0.8f;
    static constexpr float kBoostDuration = 3.0f;
    static constexpr float kBoostCooldown = 8.0f;
    static constexpr float kBoostMultiplier = 2.0f;
    static constexpr float kBoostEngageDistance = 80.0f;
    static constexpr float kStrikeRadius = 100.0f;
    static constexpr float kStrikeSlotReached = 20.0f;
    static constexpr float kSpiralRate = 2.0f;
    static constexpr float kRetreatDistance = 80.0f;

    [[nodiscard]] static ShipStats defaultStats() noexcept
    {
        ShipStats s;
        s.maxHealth = 45.0f;
        s.speed = 140.0f;
        s.rotationSpeed = 5.0f;
        s.detectionRange = 180.0f;
        s.attackRange = 60.0f;
        s.size = 6.0f;
        s.aggressiveness = 0.9f;
        s.caution = 0.2f;
        s.teamwork = 0.4f;
        return s;
    }

    InterceptorShip(AgentId id, FleetContext& context, const Vec3& position = Vec3::zero())
        : AIEnemyShip(id, defaultStats(), Personality::Aggressive, context, position)
    {
        initializeBehavior();
    }

    [[nodiscard]] ShipType shipType() const noexcept override { return ShipType::Interceptor; }
    [[nodiscard]] float preferredEngagementRange() const noexcept override { return attackRange() * 0.6f; }

    [[nodiscard]] bool canAttack() const override { return timeSinceLastAttack() >= kCooldown; }

    /// @brief Two fast rounds with a slight lateral spread.
    void attack() override
    {
        if (!hasTarget() || !canAttack())
        {
            return;
        }
        const Vec3 targetPos = target()->position;
        const Vec3 direction = normalize(targetPos - position());
        const float range = distanceTo(targetPos);
        for (int i = 0; i < 2; ++i)
        {
            const float spread = (static_cast<float>(i) - 0.5f) * 0.1f;
            emitAttack(AttackKind::Fast, position() + normalize(direction + right() * spread) * range);
        }
        resetAttackTimer();
    }

    void update(float dt) override
    {
        AIEnemyShip::update(dt);

        if (mBoostCooldown > 0.0f)
        {
            mBoostCooldown -= dt;
        }
        if (mBoostActive)
        {
            mBoostRemaining -= dt;
            if (mBoostRemaining <= 0.0f)
            {
                mBoostActive = false;
            }
        }
    }

    /// @return false while boosting or cooling down.
    bool activateBoost() noexcept
    {
        if (mBoostCooldown > 0.0f || mBoostActive)
        {
            return false;
        }
        mBoostActive = true;
        mBoostRemaining = kBoostDuration;
        mBoostCooldown = kBoostCooldown;
        return true;
    }

    [[nodiscard]] bool isBoosting() const noexcept { return mBoostActive; }

    [[nodiscard]] float cruiseMultiplier() const noexcept override
    {
        return mBoostActive ? kBoostMultiplier : 1.0f;
    }
    [[nodiscard]] float boostCooldown() const noexcept { return mBoostCooldown; }

    /// @brief Steers for the lead-collision point and boosts when far.
    void executeInterceptManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        const Contact& t = *target();
        const float closingSpeed = mBoostActive ? speed() * kBoostMultiplier : speed();
        navigator().setDestination(interceptPoint(position(), t.position, t.velocity, closingSpeed));

        if (distanceTo(t.position) > kBoostEngageDistance)
        {
            (void)activateBoost();
        }
    }

    /// @brief Intercepts from afar, orbits the target up close.
    void executeSignatureManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        const Vec3 targetPos = target()->position;
        const float optimal = preferredEngagementRange();
        if (distanceTo(targetPos) > optimal * 1.5f)
        {
            executeInterceptManeuver();
            return;
        }

        const Vec3 toTarget = normalize(targetPos - position());
        const Vec3 tangent = cross(toTarget, up());
        const float phase = static_cast<float>(context().clock.now()) * kSpiralRate;
        const Vec3 orbit = targetPos +
                           tangent * (std::cos(phase) * optimal) +
                           cross(tangent, toTarget) * (std::sin(phase) * optimal);
        navigator().setDestination(orbit);

        if (canSee(targetPos) && isInRange(targetPos, attackRange()))
        {
            attack();
        }
    }

    void executeHitAndRun(const Vec3& point) override
    {
        if (distanceTo(point) > attackRange())
        {
            (void)activateBoost();
            navigator().setDestination(point);
            return;
        }
        attack();
        navigator().setDestination(position() + normalize(position() - point) * kRetreatDistance);
    }

    /// @brief Neighboring interceptors split a ring around the target and
    ///        strike together once all are on station.
    void executeCoordinatedManeuver() override
    {
        if (!hasTarget())
        {
            return;
        }
        ShipList wing;
        for (AIEnemyShip* ally : nearbyAllyShips())
        {
            if (ally->shipType() == ShipType::Interceptor)
            {
                wing.push_back(ally);
            }
        }
        if (wing.empty())
        {
            return;
        }

        const Vec3 targetPos = target()->position;
        const int slots = static_cast<int>(wing.size()) + 1;
        const int mine = formationIndex() >= 0 ? formationIndex() % slots : 0;
        const Vec3 station = strikeStation(targetPos, mine, slots);
        navigator().setDestination(station);

        for (AIEnemyShip* ally : wing)
        {
            const int theirs = ally->formationIndex() >= 0 ? ally->formationIndex() % slots : 1;
            if (distance(ally->position(), strikeStation(targetPos, theirs, slots)) > kStrikeSlotReached)
            {
                return;
            }
        }
        if (distanceTo(station) >= kStrikeSlotReached)
        {
            return;
        }

        (void)communication().broadcastMessage(makeMessage(MessageType::CoordinatedAttack,
                                                           id(),
                                                           targetPos,
                                                           CoordinatedAttack::InterceptorStrike));
        executeInterceptManeuver();
    }

    /**
     * @brief Earliest point where a chaser at chaserSpeed meets a target
     *        moving at targetVelocity; the target's position if none exists.
     */
    [[nodiscard]] static Vec3 interceptPoint(const Vec3& chaser,
                                             const Vec3& targetPos,
                                             const Vec3& targetVelocity,
                                             float chaserSpeed) noexcept
    {
        const Vec3 toTarget = targetPos - chaser;
        const float a = dot(targetVelocity, targetVelocity) - chaserSpeed * chaserSpeed;
        const float b = 2.0f * dot(targetVelocity, toTarget);
        const float c = dot(toTarget, toTarget);

        if (std::fabs(a) < 1e-6f)
        {
            return targetPos;
        }
        const float discriminant = b * b - 4.0f * a * c;
        if (discriminant < 0.0f)
        {
            return targetPos;
        }
        const float root = std::sqrt(discriminant);
        const float t1 = (-b + root) / (2.0f * a);
        const float t2 = (-b - root) / (2.0f * a);
        const float t = t1 > 0.0f ? (t2 > 0.0f ? std::min(t1, t2) : t1) : t2;
        if (t < 0.0f)
        {
            return targetPos;
        }
        return targetPos + targetVelocity * t;
    }

private:
    [[nodiscard]] static Vec3 strikeStation(const Vec3& center, int index, int slots) noexcept
    {
        constexpr float kTwoPi = 2.0f * 3.14159265358979323846f;
        const float angle = kTwoPi * static_cast<float>(index) / static_cast<float>(slots);
        return center + Vec3(std::cos(angle), 0.0f, std::sin(angle)) * kStrikeRadius;
    }

    bool mBoostActive = false;
    float mBoostRemaining = 0.0f;
    float mBoostCooldown = 0.0f;
};

// =============================================================================
// ScoutShip
// =============================================================================

/// @brief Fragile long-range spotter that feeds contact reports to the fleet.
class ScoutShip final : public AIEnemyShip
{
public:
    static constexpr float kCooldown = 2.0f;
    static constexpr float kReportInterval = 5.0f;
    static constexpr float kReportConfidence = 0.9f;
    static constexpr float kEvasionDistance = 30.0f;
    static constexpr float kEvasionJitter = 0.5f;
    static constexpr float kEvasionBoost = 1.2f;

    [[nodiscard]] static ShipStats defaultStats() noexcept
    {
        ShipStats s;
        s.maxHealth = 30.0f;
        s.speed = 120.0f;
        s.rotationSpeed = 4.0f;
        s.detectionRange = 200.0f;
        s.attackRange = 80.0f;
        s.size = 8.0f;
        s.aggressiveness = 0.3f;
        s.caution = 0.8f;
        s.teamwork = 0.9f;
        return s;
    }

    ScoutShip(AgentId id, FleetContext& context, const Vec3& position = Vec3::zero())
        : AIEnemyShip(id, defaultStats(), Personality::Cautious, context, position)
    {
        initializeBehavior();
    }

    [[nodiscard]] ShipType shipType() const noexcept override { return ShipType::Scout; }
    [[nodiscard]] float preferredEngagementRange() const noexcept override { return attackRange() * 0.8f; }

    [[nodiscard]] bool canAttack() const override { return timeSinceLastAttack() >= kCooldown; }

    void attack() override
    {
        if (!hasTarget() || !canAttack())
        {
            return;
        }
        emitAttack(AttackKind::Light, target()->position);
        resetAttackTimer();
    }

    void update(float dt) override
    {
        AIEnemyShip::update(dt);

        mReportTimer += dt;
        if (mReportTimer >= kReportInterval)
        {
            (void)reportIntelligence();
            mReportTimer = 0.0f;
        }
    }

    /**
     * @brief Broadcasts TargetSighted and IntelReport for the current target.
     *
     * @return false without a target.
     */
    bool reportIntelligence()
    {
        if (!hasTarget())
        {
            return false;
        }
        const Contact& t = *target();

        ContactReport report;
        report.velocity = t.velocity;
        report.health = t.health;
        report.confidence = kReportConfidence;
        (void)communication().broadcastMessage(
            makeMessage(MessageType::TargetSighted, id(), t.position, report));

        IntelData intel;
        intel.position = t.position;
        intel.shipType = t.shipType;
        intel.threatLevel = context().threats.threatLevelAt(t.position);
        intel.velocity = t.velocity;
        intel.confidence = kReportConfidence;
        (void)communication().broadcastMessage(
            makeMessage(MessageType::IntelReport, id(), t.position, intel));
        return true;
    }

    void executeSignatureManeuver() override
    {
        if (hasTarget())
        {
            executeHitAndRun(target()->position);
        }
    }

    /// @brief Jinks sideways with a random wobble at boosted speed.
    void executeEvasion() override
    {
        if (!hasTarget())
        {
            return;
        }
        FleetContext& ctx = context();
        const Vec3 toTarget = normalize(target()->position - position());
        Vec3 jink = cross(toTarget, up());
        jink += Vec3(ctx.randomRange(-0.5f, 0.5f) * kEvasionJitter,
                     ctx.randomRange(-0.5f, 0.5f) * kEvasionJitter,
                     ctx.randomRange(-0.5f, 0.5f) * kEvasionJitter);
        jink = normalize(jink);

        navigator().setDestination(position() + jink * kEvasionDistance);
    }

    /// @brief Jinks run hot while fleeing.
    [[nodiscard]] float cruiseMultiplier() const noexcept override
    {
        return isInState(StateId::Flee) ? kEvasionBoost : 1.0f;
    }

private:
    float mReportTimer = 0.0f;
};

} // namespace fatp_fleet
