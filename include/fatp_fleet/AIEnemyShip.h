#pragma once

/**
 * @file AIEnemyShip.h
 * @brief Base class for every AI-controlled enemy ship.
 */

// FAT-P components used:
// - Signal: Destroyed, damaged, target acquired, attack intent notifications
// - SmallVector: Neighbor id list and resolved neighbor pointers
//
// An agent bundles kinematics, combat stats, behavior dials, and four owned
// parts: the state machine, the navigator, the formation member, and the
// communication endpoint. Everything shared (hub, knowledge stores,
// formation registry, clock, random engine) is reached through the
// FleetContext passed at construction.
//
// Stats are split into a baseline and an effective copy. Subtypes fill the
// baseline; applyModifiers() recomputes the effective copy as
// baseline * multiplier, so repeated application never compounds. Behavior
// dial nudges from gameplay (enraging, retaliation) are applied to the
// baseline and carried through every later reapplication. Swarm mood and
// tactical posture add a BehaviorBias on top of the scaled dials; each source
// replaces its previous bias rather than adding to it.
//
// Ship-specific tactics are virtual hooks (executeSignatureManeuver,
// executeCoordinatedManeuver, executeEvasion, executeHitAndRun,
// executeInterceptManeuver, onCoordinatedAttack). States call the hooks;
// they never downcast.
//
// Lifetime: the FleetManager (or a test) owns agents, registers them with the
// hub, and unregisters them before freeing them. onDestroyed listeners must
// not free the agent from inside the callback.

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>

#include <fat_p/Signal.h>
#include <fat_p/SmallVector.h>

#include "AIState.h"
#include "CommunicationSystem.h"
#include "FleetServices.h"
#include "FormationMember.h"
#include "Message.h"
#include "Navigator.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

class AIEnemyShip;
class FormationController;

// =============================================================================
// Stats
// =============================================================================

/// @brief Per-subtype stat block. Behavior dials are in [0, 1].
struct ShipStats
{
    float maxHealth = 100.0f;
    float speed = 80.0f;
    float rotationSpeed = 2.5f;
    float detectionRange = 150.0f;
    float attackRange = 100.0f;
    float size = 10.0f;
    float aggressiveness = 0.5f;
    float caution = 0.5f;
    float teamwork = 0.7f;
};

/// @brief Multipliers applied on top of ShipStats. 1 everywhere is identity.
struct StatModifiers
{
    float speed = 1.0f;
    float health = 1.0f;
    float accuracy = 1.0f;
    float detection = 1.0f;
    float aggression = 1.0f;
    float teamwork = 1.0f;
    float reaction = 1.0f;
};

enum class AttackKind : uint8_t
{
    Light,
    Medium,
    Heavy,
    Fast
};

/// @brief Request to the weapons layer to fire one shot.
struct AttackIntent
{
    AgentId shooter = NullAgent;
    Vec3 origin;
    Vec3 aimPoint;
    AttackKind kind = AttackKind::Medium;
};

/// @brief Additive offsets to the behavior dials from one source.
struct BehaviorBias
{
    float aggressiveness = 0.0f;
    float caution = 0.0f;
    float teamwork = 0.0f;

    [[nodiscard]] bool operator==(const BehaviorBias& o) const noexcept
    {
        return aggressiveness == o.aggressiveness && caution == o.caution && teamwork == o.teamwork;
    }
    [[nodiscard]] bool operator!=(const BehaviorBias& o) const noexcept { return !(*this == o); }
};

using NeighborList = fat_p::SmallVector<AgentId, 16>;
using ShipList = fat_p::SmallVector<AIEnemyShip*, 16>;

// =============================================================================
// AIEnemyShip
// =============================================================================

/**
 * @brief One enemy agent.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class AIEnemyShip
{
public:
    static constexpr float kFieldOfViewDot = 0.3f;
    static constexpr float kTurnStep = 0.016f;

    static constexpr float kFleeHealthRatio = 0.3f;
    static constexpr float kFleeCaution = 0.5f;
    static constexpr float kEnrageThreshold = 0.7f;
    static constexpr float kEnrageStep = 0.2f;

    static constexpr float kLossThreatIncrease = 0.3f;
    static constexpr float kRetaliationRadius = 100.0f;
    static constexpr float kRetaliationStep = 0.2f;

    static constexpr float kSupportProximityRange = 200.0f;
    static constexpr float kSupportPriorityThreshold = 0.5f;
    static constexpr float kEscortHealthRatio = 0.5f;

    static constexpr float kDefaultSpreadFactor = 1.25f;

    static constexpr float kDefensiveAggressionBias = -0.2f;
    static constexpr float kDefensiveCautionBias = 0.3f;
    static constexpr float kBombardmentStandoff = 0.9f;

    AIEnemyShip(AgentId id,
                const ShipStats& baseline,
                Personality personality,
                FleetContext& context,
                const Vec3& position = Vec3::zero())
        : mId(id)
        , mContext(&context)
        , mPersonality(personality)
        , mBaseline(baseline)
        , mStats(baseline)
        , mHealth(baseline.maxHealth)
        , mPosition(position)
        , mNavigator(*this)
        , mCommunication(id, context.hub, context.clock)
        , mFormationMember(*this)
    {
        mCommunication.setHandler([this](const AIMessage& msg) { handleMessage(msg); });
    }

    virtual ~AIEnemyShip() = default;

    AIEnemyShip(const AIEnemyShip&) = delete;
    AIEnemyShip& operator=(const AIEnemyShip&) = delete;
    AIEnemyShip(AIEnemyShip&&) = delete;
    AIEnemyShip& operator=(AIEnemyShip&&) = delete;

    // =========================================================================
    // Signals
    // =========================================================================

    fat_p::Signal<void(AIEnemyShip&)> onDestroyed;

    /// @brief (ship, damage source position)
    fat_p::Signal<void(AIEnemyShip&, const Vec3&)> onDamaged;

    /// @brief Fired when the ship goes from no target to a target.
    fat_p::Signal<void(AIEnemyShip&, const Contact&)> onTargetAcquired;

    fat_p::Signal<void(const AttackIntent&)> onAttackIntent;

    // =========================================================================
    // Subtype interface
    // =========================================================================

    [[nodiscard]] virtual ShipType shipType() const noexcept = 0;
    [[nodiscard]] virtual float preferredEngagementRange() const noexcept = 0;
    [[nodiscard]] virtual bool canAttack() const = 0;

    /// @brief Fires at the current target. No-op without a target or when
    ///        canAttack() is false.
    virtual void attack() = 0;

    /// @brief State machine, navigator, formation following, endpoint, timers,
    ///        then kinematics.
    virtual void update(float dt);

    /// @brief In-range maneuver while attacking.
    virtual void executeSignatureManeuver() {}

    /// @brief Group maneuver when at least two allies are nearby.
    virtual void executeCoordinatedManeuver() {}

    /// @brief Evasion while fleeing. Default: run straight away from the target.
    virtual void executeEvasion();

    /// @brief Strike at point and pull back.
    virtual void executeHitAndRun(const Vec3& point);

    /// @brief Close on the target. Default: head for its current position.
    virtual void executeInterceptManeuver();

    virtual void onCoordinatedAttack(CoordinatedAttack signal);

    /// @brief Multiplier the navigator applies to cruise speed. 0 holds still.
    [[nodiscard]] virtual float cruiseMultiplier() const noexcept { return 1.0f; }

    // =========================================================================
    // Damage and lifecycle
    // =========================================================================

    /**
     * @brief Applies damage. May destroy the ship, send it fleeing, or enrage
     *        it.
     */
    void takeDamage(float amount, const Vec3& source);

    /**
     * @brief Marks the ship destroyed, leaves its formation, and broadcasts
     *        AllyDestroyed from the current position. Idempotent.
     */
    void destroy();

    [[nodiscard]] bool isDestroyed() const noexcept { return mDestroyed; }

    /// @brief Sets health directly, clamped to [0, maxHealth]. Does not destroy.
    void setHealth(float health) noexcept { mHealth = std::clamp(health, 0.0f, mStats.maxHealth); }

    // =========================================================================
    // Targeting
    // =========================================================================

    /// @brief Tracks contact and marks it as seen now.
    void setTarget(const Contact& contact)
    {
        const bool acquired = !mTarget.has_value();
        mTarget = contact;
        mLastKnownPlayerPosition = contact.position;
        mLastPlayerSightingTime = 0.0f;
        if (acquired && onTargetAcquired.slotCount() > 0)
        {
            onTargetAcquired.emit(*this, contact);
        }
    }

    void clearTarget() noexcept { mTarget.reset(); }

    [[nodiscard]] bool hasTarget() const noexcept { return mTarget.has_value(); }
    [[nodiscard]] const std::optional<Contact>& target() const noexcept { return mTarget; }

    [[nodiscard]] const Vec3& lastKnownPlayerPosition() const noexcept { return mLastKnownPlayerPosition; }
    void setLastKnownPlayerPosition(const Vec3& p) noexcept { mLastKnownPlayerPosition = p; }

    /// @brief Seconds since the target was last seen.
    [[nodiscard]] float lastPlayerSightingTime() const noexcept { return mLastPlayerSightingTime; }
    void setLastPlayerSightingTime(float t) noexcept { mLastPlayerSightingTime = t; }

    [[nodiscard]] float timeSinceLastAttack() const noexcept { return mTimeSinceLastAttack; }

    // =========================================================================
    // Movement intents
    // =========================================================================

    void moveToward(const Vec3& point, float speedMultiplier = 1.0f)
    {
        mVelocity = normalize(point - mPosition) * (mStats.speed * speedMultiplier);
    }

    /// @brief Turns toward point at rotationSpeed per tick.
    void lookAt(const Vec3& point);

    void stop() noexcept { mVelocity = Vec3::zero(); }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] float distanceTo(const Vec3& point) const noexcept { return distance(mPosition, point); }

    [[nodiscard]] bool isInRange(const Vec3& point, float range) const noexcept
    {
        return distanceTo(point) <= range;
    }

    /**
     * @brief Range and field-of-view test.
     *
     * @param maxDistance Overrides detectionRange when positive.
     */
    [[nodiscard]] bool canSee(const Vec3& point, float maxDistance = -1.0f) const noexcept
    {
        const float range = maxDistance > 0.0f ? maxDistance : mStats.detectionRange;
        if (distanceTo(point) > range)
        {
            return false;
        }
        return dot(mForward, normalize(point - mPosition)) > kFieldOfViewDot;
    }

    // =========================================================================
    // Neighbors
    // =========================================================================

    /// @brief Rebuilds the neighbor list from the hub.
    void updateNearbyAllies(float radius);

    [[nodiscard]] const NeighborList& nearbyAllies() const noexcept { return mNearbyAllies; }
    [[nodiscard]] std::size_t nearbyAllyCount() const noexcept { return mNearbyAllies.size(); }

    /// @brief Neighbors still registered with the hub.
    [[nodiscard]] ShipList nearbyAllyShips() const;

    /// @brief Own position when there are no neighbors.
    [[nodiscard]] Vec3 averageAllyPosition() const;
    [[nodiscard]] Vec3 averageAllyVelocity() const;

    // =========================================================================
    // Formation
    // =========================================================================

    [[nodiscard]] FormationController* formation() const;

    /// @brief Slot index in the current formation, or -1.
    [[nodiscard]] int formationIndex() const;

    [[nodiscard]] bool isFormationLeader() const { return formationIndex() == 0; }

    /// @brief Patrolling follower whose slot outranks its own route.
    [[nodiscard]] bool isFollowingFormation() const;

    // =========================================================================
    // Stats
    // =========================================================================

    [[nodiscard]] const ShipStats& baseline() const noexcept { return mBaseline; }
    [[nodiscard]] const ShipStats& stats() const noexcept { return mStats; }
    [[nodiscard]] const StatModifiers& modifiers() const noexcept { return mModifiers; }

    /// @brief effective = clamp(baseline * m + biases). Keeps the current
    ///        health ratio.
    void applyModifiers(const StatModifiers& m);

    /// @brief Replaces the swarm mood bias. Reapplies only on change.
    void setSwarmBias(const BehaviorBias& bias)
    {
        if (bias != mSwarmBias)
        {
            mSwarmBias = bias;
            applyModifiers(mModifiers);
        }
    }

    /// @brief Replaces the tactical posture bias. Reapplies only on change.
    void setTacticalBias(const BehaviorBias& bias)
    {
        if (bias != mTacticalBias)
        {
            mTacticalBias = bias;
            applyModifiers(mModifiers);
        }
    }

    [[nodiscard]] const BehaviorBias& swarmBias() const noexcept { return mSwarmBias; }
    [[nodiscard]] const BehaviorBias& tacticalBias() const noexcept { return mTacticalBias; }

    /// @brief Nudges the baseline aggressiveness (clamped) and reapplies.
    void adjustBaselineAggressiveness(float delta)
    {
        mBaseline.aggressiveness = std::clamp(mBaseline.aggressiveness + delta, 0.0f, 1.0f);
        applyModifiers(mModifiers);
    }

    [[nodiscard]] float health() const noexcept { return mHealth; }
    [[nodiscard]] float maxHealth() const noexcept { return mStats.maxHealth; }
    [[nodiscard]] float healthRatio() const noexcept
    {
        return mStats.maxHealth > 0.0f ? mHealth / mStats.maxHealth : 0.0f;
    }
    [[nodiscard]] float speed() const noexcept { return mStats.speed; }
    [[nodiscard]] float rotationSpeed() const noexcept { return mStats.rotationSpeed; }
    [[nodiscard]] float detectionRange() const noexcept { return mStats.detectionRange; }
    [[nodiscard]] float attackRange() const noexcept { return mStats.attackRange; }
    [[nodiscard]] float size() const noexcept { return mStats.size; }
    [[nodiscard]] float aggressiveness() const noexcept { return mStats.aggressiveness; }
    [[nodiscard]] float caution() const noexcept { return mStats.caution; }
    [[nodiscard]] float teamwork() const noexcept { return mStats.teamwork; }

    /// @brief Decision-interval multiplier; above 1 is slower.
    [[nodiscard]] float reactionTime() const noexcept { return mModifiers.reaction; }

    [[nodiscard]] Personality personality() const noexcept { return mPersonality; }

    // =========================================================================
    // Kinematics
    // =========================================================================

    [[nodiscard]] AgentId id() const noexcept { return mId; }

    [[nodiscard]] const Vec3& position() const noexcept { return mPosition; }
    [[nodiscard]] const Vec3& velocity() const noexcept { return mVelocity; }
    [[nodiscard]] const Vec3& forward() const noexcept { return mForward; }
    [[nodiscard]] const Vec3& up() const noexcept { return mUp; }
    [[nodiscard]] Vec3 right() const noexcept { return cross(mForward, mUp); }

    void setPosition(const Vec3& p) noexcept { mPosition = p; }
    void setVelocity(const Vec3& v) noexcept { mVelocity = v; }

    /// @brief Ignores the zero vector.
    void setForward(const Vec3& f) noexcept
    {
        const Vec3 n = normalize(f);
        if (n.lengthSquared() > 0.0f)
        {
            mForward = n;
        }
    }

    // =========================================================================
    // Parts
    // =========================================================================

    [[nodiscard]] AIStateMachine& stateMachine() noexcept { return mStateMachine; }
    [[nodiscard]] const AIStateMachine& stateMachine() const noexcept { return mStateMachine; }
    [[nodiscard]] bool isInState(StateId id) const noexcept { return mStateMachine.isInState(id); }

    [[nodiscard]] Navigator& navigator() noexcept { return mNavigator; }
    [[nodiscard]] const Navigator& navigator() const noexcept { return mNavigator; }

    [[nodiscard]] CommunicationSystem& communication() noexcept { return mCommunication; }
    [[nodiscard]] const CommunicationSystem& communication() const noexcept { return mCommunication; }

    [[nodiscard]] FormationMember& formationMember() noexcept { return mFormationMember; }
    [[nodiscard]] const FormationMember& formationMember() const noexcept { return mFormationMember; }

    [[nodiscard]] FleetContext& context() const noexcept { return *mContext; }

    // =========================================================================
    // Messaging
    // =========================================================================

    /// @brief Applies one inbound message. Installed as the endpoint handler.
    void handleMessage(const AIMessage& msg);

    [[nodiscard]] StatusData statusSnapshot() const
    {
        StatusData status;
        status.healthRatio = healthRatio();
        status.position = mPosition;
        status.velocity = mVelocity;
        status.inCombat = mTarget.has_value();
        return status;
    }

    /**
     * @brief Carries out one tactic toward objective.
     *
     * Called for inbound TacticalOrder messages and by the group commander
     * that issued them.
     */
    void executeTacticalOrder(const TacticalOrderData& order, const Vec3& objective);

    /// @brief Queues a StatusUpdate broadcast.
    bool broadcastStatus()
    {
        return mCommunication.broadcastMessage(
            makeMessage(MessageType::StatusUpdate, mId, mPosition, statusSnapshot()));
    }

protected:
    /// @brief Installs the starting behavior. Subtype constructors call this last.
    void initializeBehavior();

    /// @brief Publishes an attack intent aimed at aimPoint.
    void emitAttack(AttackKind kind, const Vec3& aimPoint)
    {
        if (onAttackIntent.slotCount() > 0)
        {
            onAttackIntent.emit(AttackIntent{mId, mPosition, aimPoint, kind});
        }
    }

    void resetAttackTimer() noexcept { mTimeSinceLastAttack = 0.0f; }

    /// @brief Neighbors within radius of point.
    [[nodiscard]] std::size_t countAlliesNear(const Vec3& point, float radius) const;

private:
    void handleTargetSighted(const AIMessage& msg);
    void handleRequestSupport(const AIMessage& msg);
    void handleEngagingTarget(const AIMessage& msg);
    void handleAllyDestroyed(const AIMessage& msg);
    void handleFormationOrder(const AIMessage& msg);
    void handleTacticalOrder(const AIMessage& msg);
    void handleRequestEscort(const AIMessage& msg);

    /// @brief True when sender and this ship are in the same formation, or
    ///        both are unassigned.
    [[nodiscard]] bool sharesCommandWith(AgentId sender) const;

    /// @brief Wing point for a two-pronged order.
    [[nodiscard]] Vec3 chooseWing(const TacticalOrderData& order) const;

    void reply(const AIMessage& request, MessageType type, Acknowledgement ack);

    AgentId mId;
    FleetContext* mContext;
    Personality mPersonality;

    ShipStats mBaseline;
    ShipStats mStats;
    StatModifiers mModifiers;
    BehaviorBias mSwarmBias;
    BehaviorBias mTacticalBias;
    float mHealth;

    Vec3 mPosition;
    Vec3 mVelocity;
    Vec3 mForward = Vec3::unitZ();
    Vec3 mUp = Vec3::unitY();

    std::optional<Contact> mTarget;
    Vec3 mLastKnownPlayerPosition;
    float mLastPlayerSightingTime = 0.0f;
    float mTimeSinceLastAttack = 0.0f;

    NeighborList mNearbyAllies;
    bool mDestroyed = false;

    AIStateMachine mStateMachine;
    Navigator mNavigator;
    CommunicationSystem mCommunication;
    FormationMember mFormationMember;
};

} // namespace fatp_fleet
