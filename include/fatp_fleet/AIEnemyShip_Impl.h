#pragma once

/**
 * @file AIEnemyShip_Impl.h
 * @brief Out-of-line implementations for AIEnemyShip.
 *
 * Do not include directly. Requires AIStates, CommunicationHub, and
 * FormationRegistry to be fully defined, ensured by FatpFleet.h include order.
 */

#include <algorithm>
#include <memory>
#include <variant>

#include "AIEnemyShip.h"
#include "AIStates.h"
#include "CommunicationHub.h"
#include "FormationController.h"
#include "FormationRegistry.h"
#include "Log.h"

namespace fatp_fleet
{

namespace detail
{

/// @brief How much a requester of this type is worth protecting.
[[nodiscard]] constexpr float supportValue(ShipType type) noexcept
{
    switch (type)
    {
    case ShipType::Bomber:      return 1.0f;
    case ShipType::Fighter:     return 0.8f;
    case ShipType::Scout:       return 0.6f;
    case ShipType::Interceptor: return 0.4f;
    }
    return 0.5f;
}

} // namespace detail

// =============================================================================
// Tick
// =============================================================================

inline void AIEnemyShip::initializeBehavior()
{
    mStateMachine.initialize(std::make_unique<PatrolState>(), *this);
}

inline void AIEnemyShip::update(float dt)
{
    if (mDestroyed)
    {
        return;
    }

    mStateMachine.update(*this, dt);
    mNavigator.update(dt);

    if (isFollowingFormation())
    {
        mFormationMember.update(dt);
    }

    (void)mCommunication.update(dt, mPosition);

    mTimeSinceLastAttack += dt;
    if (mTarget)
    {
        mLastPlayerSightingTime += dt;
    }

    mPosition += mVelocity * dt;
}

// =============================================================================
// Damage and lifecycle
// =============================================================================

inline void AIEnemyShip::takeDamage(float amount, const Vec3& source)
{
    if (mDestroyed || amount <= 0.0f)
    {
        return;
    }

    mHealth = std::max(0.0f, mHealth - amount);
    if (onDamaged.slotCount() > 0)
    {
        onDamaged.emit(*this, source);
    }

    if (mHealth <= 0.0f)
    {
        destroy();
        return;
    }

    if (mStateMachine.isInState(StateId::Flee))
    {
        return;
    }

    if (healthRatio() < kFleeHealthRatio && mStats.caution > kFleeCaution)
    {
        (void)mStateMachine.changeState(std::make_unique<FleeState>(), *this);
    }
    else if (mStats.aggressiveness > kEnrageThreshold)
    {
        adjustBaselineAggressiveness(kEnrageStep);
    }
}

inline void AIEnemyShip::destroy()
{
    if (mDestroyed)
    {
        return;
    }
    mDestroyed = true;
    mHealth = 0.0f;
    mVelocity = Vec3::zero();
    mNavigator.cancel();

    if (onDestroyed.slotCount() > 0)
    {
        onDestroyed.emit(*this);
    }

    (void)mContext->formations.leave(mId);
    mFormationMember.reset();

    // Sent straight through the hub: the endpoint of a dead ship is never
    // drained again.
    AIMessage msg = makeMessage(MessageType::AllyDestroyed, mId, mPosition, AllyLoss{shipType()});
    msg.isBroadcast = true;
    msg.timestamp = mContext->clock.now();
    msg.priority = 1.0f;
    const std::size_t notified = mContext->hub.broadcast(msg, mPosition);

    FATP_FLEET_LOG_DEBUG("agent %u (%.*s) destroyed, %zu allies notified",
                         mId.get(),
                         static_cast<int>(toString(shipType()).size()),
                         toString(shipType()).data(),
                         notified);
}

// =============================================================================
// Movement
// =============================================================================

inline void AIEnemyShip::lookAt(const Vec3& point)
{
    const Vec3 desired = normalize(point - mPosition);
    if (desired.lengthSquared() == 0.0f)
    {
        return;
    }

    const float t = std::clamp(mStats.rotationSpeed * kTurnStep, 0.0f, 1.0f);
    Vec3 turned = normalize(lerp(mForward, desired, t));
    if (turned.lengthSquared() == 0.0f)
    {
        // Desired is exactly behind us.
        turned = normalize(lerp(mForward, right(), t));
    }
    if (turned.lengthSquared() == 0.0f)
    {
        return;
    }
    mForward = turned;

    Vec3 side = cross(mForward, mUp);
    if (side.lengthSquared() < 1e-8f)
    {
        side = cross(mForward, Vec3::unitX());
    }
    mUp = normalize(cross(normalize(side), mForward));
}

inline void AIEnemyShip::executeEvasion()
{
    if (!mTarget)
    {
        return;
    }
    const Vec3 away = normalize(mPosition - mTarget->position);
    mNavigator.setDestination(mPosition + away * 50.0f);
}

inline void AIEnemyShip::executeHitAndRun(const Vec3& point)
{
    if (distanceTo(point) < mStats.attackRange * 1.2f)
    {
        if (mTarget && canAttack())
        {
            attack();
        }
        mNavigator.setDestination(mPosition + normalize(mPosition - point) * 50.0f);
        return;
    }
    mNavigator.setDestination(point);
}

inline void AIEnemyShip::executeInterceptManeuver()
{
    if (mTarget)
    {
        mNavigator.setDestination(mTarget->position);
    }
}

inline void AIEnemyShip::onCoordinatedAttack(CoordinatedAttack signal)
{
    switch (signal)
    {
    case CoordinatedAttack::BombardmentReady:
        if (mTarget && canAttack())
        {
            attack();
        }
        break;
    case CoordinatedAttack::InterceptorStrike:
        executeInterceptManeuver();
        break;
    case CoordinatedAttack::FlankingComplete:
        if (mTarget && canAttack() && isInRange(mTarget->position, mStats.attackRange))
        {
            attack();
        }
        break;
    }
}

// =============================================================================
// Neighbors
// =============================================================================

inline void AIEnemyShip::updateNearbyAllies(float radius)
{
    mNearbyAllies.clear();
    for (AIEnemyShip* other : mContext->hub.agentsWithin(mPosition, radius, mId))
    {
        if (!other->isDestroyed())
        {
            mNearbyAllies.push_back(other->id());
        }
    }
}

inline ShipList AIEnemyShip::nearbyAllyShips() const
{
    ShipList ships;
    for (AgentId id : mNearbyAllies)
    {
        AIEnemyShip* ship = mContext->hub.find(id);
        if (ship != nullptr && !ship->isDestroyed())
        {
            ships.push_back(ship);
        }
    }
    return ships;
}

inline Vec3 AIEnemyShip::averageAllyPosition() const
{
    const ShipList ships = nearbyAllyShips();
    if (ships.empty())
    {
        return mPosition;
    }
    Vec3 sum;
    for (const AIEnemyShip* ship : ships)
    {
        sum += ship->position();
    }
    return sum / static_cast<float>(ships.size());
}

inline Vec3 AIEnemyShip::averageAllyVelocity() const
{
    const ShipList ships = nearbyAllyShips();
    if (ships.empty())
    {
        return Vec3::zero();
    }
    Vec3 sum;
    for (const AIEnemyShip* ship : ships)
    {
        sum += ship->velocity();
    }
    return sum / static_cast<float>(ships.size());
}

inline std::size_t AIEnemyShip::countAlliesNear(const Vec3& point, float radius) const
{
    std::size_t count = 0;
    for (const AIEnemyShip* ship : nearbyAllyShips())
    {
        if (distance(ship->position(), point) <= radius)
        {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Formation
// =============================================================================

inline FormationController* AIEnemyShip::formation() const
{
    return mContext->formations.formationOf(mId);
}

inline int AIEnemyShip::formationIndex() const
{
    const FormationController* f = formation();
    return f != nullptr ? f->indexOf(mId) : -1;
}

inline bool AIEnemyShip::isFollowingFormation() const
{
    if (!mStateMachine.isInState(StateId::Patrol))
    {
        return false;
    }
    return formationIndex() > 0 && mFormationMember.formationPriority() >= 0.5f;
}

// =============================================================================
// Stats
// =============================================================================

inline void AIEnemyShip::applyModifiers(const StatModifiers& m)
{
    const float ratio = healthRatio();

    mModifiers = m;
    mStats.maxHealth = mBaseline.maxHealth * m.health;
    mStats.speed = mBaseline.speed * m.speed;
    mStats.rotationSpeed = mBaseline.rotationSpeed * m.accuracy;
    mStats.detectionRange = mBaseline.detectionRange * m.detection;
    mStats.attackRange = mBaseline.attackRange;
    mStats.size = mBaseline.size;
    mStats.aggressiveness = std::clamp(mBaseline.aggressiveness * m.aggression
                                           + mSwarmBias.aggressiveness + mTacticalBias.aggressiveness,
                                       0.0f, 1.0f);
    mStats.caution = std::clamp(mBaseline.caution + mSwarmBias.caution + mTacticalBias.caution, 0.0f, 1.0f);
    mStats.teamwork = std::clamp(mBaseline.teamwork * m.teamwork + mSwarmBias.teamwork + mTacticalBias.teamwork,
                                 0.0f, 1.0f);

    if (!mDestroyed)
    {
        mHealth = mStats.maxHealth * ratio;
    }
}

// =============================================================================
// Messaging
// =============================================================================

inline void AIEnemyShip::handleMessage(const AIMessage& msg)
{
    if (mDestroyed)
    {
        return;
    }

    switch (msg.type)
    {
    case MessageType::TargetSighted:
        handleTargetSighted(msg);
        break;
    case MessageType::RequestSupport:
        handleRequestSupport(msg);
        break;
    case MessageType::EngagingTarget:
        handleEngagingTarget(msg);
        break;
    case MessageType::AllyDestroyed:
        handleAllyDestroyed(msg);
        break;
    case MessageType::FormationOrder:
        handleFormationOrder(msg);
        break;
    case MessageType::TacticalOrder:
        handleTacticalOrder(msg);
        break;
    case MessageType::StatusUpdate:
        if (const auto* status = std::get_if<StatusData>(&msg.payload))
        {
            mContext->allies.updateAllyStatus(msg.sender, *status, msg.timestamp);
        }
        break;
    case MessageType::CoordinatedAttack:
        if (const auto* signal = std::get_if<CoordinatedAttack>(&msg.payload))
        {
            onCoordinatedAttack(*signal);
        }
        break;
    case MessageType::RequestEscort:
        handleRequestEscort(msg);
        break;
    case MessageType::IntelReport:
        if (const auto* intel = std::get_if<IntelData>(&msg.payload))
        {
            mContext->intel.processIntel(*intel, mContext->clock.now());
        }
        break;
    case MessageType::SupportConfirmed:
    case MessageType::EscortConfirmed:
        // History only.
        break;
    }
}

inline void AIEnemyShip::handleTargetSighted(const AIMessage& msg)
{
    const auto* report = std::get_if<ContactReport>(&msg.payload);
    if (report == nullptr)
    {
        return;
    }
    mContext->threats.updateThreat(msg.position, *report, mContext->clock.now());

    if (FormationController* f = mContext->formations.formationOf(msg.sender))
    {
        f->setDestination(msg.position);
    }
}

inline void AIEnemyShip::handleRequestSupport(const AIMessage& msg)
{
    const auto* request = std::get_if<SupportRequest>(&msg.payload);
    if (request == nullptr)
    {
        return;
    }

    const float deficit = 1.0f - std::clamp(request->healthRatio, 0.0f, 1.0f);
    const float proximity = 1.0f - std::min(1.0f, distanceTo(msg.position) / kSupportProximityRange);
    const float priority = deficit * 0.4f + proximity * 0.3f + detail::supportValue(request->shipType) * 0.3f;

    if (priority > kSupportPriorityThreshold)
    {
        reply(msg, MessageType::SupportConfirmed, Acknowledgement::EnRoute);
    }
}

inline void AIEnemyShip::handleEngagingTarget(const AIMessage& msg)
{
    FormationController* f = mContext->formations.formationOf(msg.sender);
    if (f == nullptr)
    {
        return;
    }
    f->setDestination(msg.position);

    if (!f->contains(mId))
    {
        return;
    }

    if (const auto* report = std::get_if<ContactReport>(&msg.payload))
    {
        Contact contact;
        contact.position = msg.position;
        contact.velocity = report->velocity;
        contact.health = report->health;
        setTarget(contact);
        return;
    }

    const AIEnemyShip* sender = mContext->hub.find(msg.sender);
    if (sender != nullptr && sender->hasTarget())
    {
        setTarget(*sender->target());
    }
}

inline void AIEnemyShip::handleAllyDestroyed(const AIMessage& msg)
{
    if (std::get_if<AllyLoss>(&msg.payload) == nullptr)
    {
        return;
    }
    mContext->threats.increaseThreatLevel(msg.position, kLossThreatIncrease, mContext->clock.now());
    (void)mContext->allies.remove(msg.sender);

    if (distanceTo(msg.position) <= kRetaliationRadius)
    {
        adjustBaselineAggressiveness(kRetaliationStep);
    }
}

inline bool AIEnemyShip::sharesCommandWith(AgentId sender) const
{
    return mContext->formations.formationOf(sender) == formation();
}

inline void AIEnemyShip::handleFormationOrder(const AIMessage& msg)
{
    const auto* order = std::get_if<FormationOrderData>(&msg.payload);
    FormationController* f = formation();
    if (order == nullptr || f == nullptr || !f->contains(msg.sender))
    {
        return;
    }

    const float factor = order->spacingMultiplier > 1.0f ? order->spacingMultiplier : kDefaultSpreadFactor;

    switch (order->order)
    {
    case FormationOrderType::ChangeFormation:
        f->changeFormation(order->formationType);
        break;
    case FormationOrderType::SpreadOut:
        (void)f->applySpreadOrder(msg.sender, msg.sequence, factor);
        break;
    case FormationOrderType::CloseRanks:
        (void)f->applySpreadOrder(msg.sender, msg.sequence, 1.0f / factor);
        break;
    case FormationOrderType::BreakFormation:
        (void)mContext->formations.leave(mId);
        mFormationMember.reset();
        break;
    }
}

inline void AIEnemyShip::handleTacticalOrder(const AIMessage& msg)
{
    const auto* order = std::get_if<TacticalOrderData>(&msg.payload);
    if (order == nullptr || !sharesCommandWith(msg.sender))
    {
        return;
    }
    executeTacticalOrder(*order, msg.position);
}

inline Vec3 AIEnemyShip::chooseWing(const TacticalOrderData& order) const
{
    const int index = formationIndex();
    if (index >= 0)
    {
        return (index % 2 == 0) ? order.wingA : order.wingB;
    }
    return distanceTo(order.wingA) <= distanceTo(order.wingB) ? order.wingA : order.wingB;
}

inline void AIEnemyShip::executeTacticalOrder(const TacticalOrderData& order, const Vec3& objective)
{
    if (mDestroyed)
    {
        return;
    }

    if (order.order != TacticalOrder::DefensiveFormation)
    {
        setTacticalBias(BehaviorBias{});
    }

    switch (order.order)
    {
    case TacticalOrder::DirectAssault:
        mNavigator.setDestination(objective);
        if (mTarget.has_value() && !mStateMachine.isInState(StateId::Attack))
        {
            (void)mStateMachine.changeState(std::make_unique<AttackState>(), *this);
        }
        break;
    case TacticalOrder::FlankingManeuver:
        if (order.hasWings && (shipType() == ShipType::Scout || shipType() == ShipType::Interceptor))
        {
            mNavigator.setDestination(chooseWing(order));
        }
        else
        {
            mNavigator.setDestination(objective);
        }
        break;
    case TacticalOrder::PincerMovement:
        mNavigator.setDestination(order.hasWings ? chooseWing(order) : objective);
        break;
    case TacticalOrder::DefensiveFormation:
        setTacticalBias(BehaviorBias{kDefensiveAggressionBias, kDefensiveCautionBias, 0.0f});
        if (!mNearbyAllies.empty())
        {
            mNavigator.setDestination(averageAllyPosition());
        }
        break;
    case TacticalOrder::HitAndRun:
        executeHitAndRun(objective);
        break;
    case TacticalOrder::SuppressionBombardment:
        if (shipType() == ShipType::Bomber)
        {
            if (mTarget.has_value())
            {
                executeSignatureManeuver();
            }
            else
            {
                const Vec3 away = normalize(mPosition - objective);
                mNavigator.setDestination(objective + away * (attackRange() * kBombardmentStandoff));
            }
            break;
        }
        {
            const AIEnemyShip* escorted = nullptr;
            float nearest = 0.0f;
            for (AIEnemyShip* ally : nearbyAllyShips())
            {
                if (ally->shipType() != ShipType::Bomber || ally->isDestroyed())
                {
                    continue;
                }
                const float d = distanceTo(ally->position());
                if (escorted == nullptr || d < nearest)
                {
                    escorted = ally;
                    nearest = d;
                }
            }
            mNavigator.setDestination(escorted != nullptr ? SupportState::coverPosition(*escorted) : objective);
        }
        break;
    }
}

inline void AIEnemyShip::handleRequestEscort(const AIMessage& msg)
{
    if (std::get_if<EscortRequest>(&msg.payload) == nullptr)
    {
        return;
    }
    if (mStateMachine.isInState(StateId::Flee) || healthRatio() < kEscortHealthRatio)
    {
        return;
    }
    reply(msg, MessageType::EscortConfirmed, Acknowledgement::ProvidingEscort);
}

inline void AIEnemyShip::reply(const AIMessage& request, MessageType type, Acknowledgement ack)
{
    AIMessage msg = makeMessage(type, mId, mPosition, ack);
    msg.target = request.sender;
    (void)mCommunication.sendMessage(msg);
}

} // namespace fatp_fleet
