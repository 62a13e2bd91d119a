#pragma once

/**
 * @file FormationMember.h
 * @brief Per-agent slot following inside a formation.
 */

// The member steers its ship toward the slot the FormationController assigned
// it, matching the slot's own motion once inside the tolerance band and
// speeding up (to at most kMaxCatchUpSpeed times cruise) when it falls far
// behind. Velocity changes are low-pass filtered by the smoothing factor.
//
// Membership itself lives in the FormationRegistry; the member resolves its
// formation and slot index through the ship on every call. The leader never
// follows its own slot: it is the reference the slots are built from.

#include <algorithm>

#include "Vec3.h"

namespace fatp_fleet
{

class AIEnemyShip;
class FormationController;

/**
 * @brief Slot follower owned by an AIEnemyShip.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class FormationMember
{
public:
    static constexpr float kDefaultPositionTolerance = 15.0f;
    static constexpr float kDefaultMaxCatchUpSpeed = 1.5f;
    static constexpr float kDefaultSmoothing = 0.1f;
    static constexpr float kVelocityBlend = 0.3f;

    explicit FormationMember(AIEnemyShip& ship)
        : mShip(&ship)
    {
    }

    FormationMember(const FormationMember&) = delete;
    FormationMember& operator=(const FormationMember&) = delete;

    /// @brief Steers toward the assigned slot. No-op for leaders and loners.
    void update(float dt);

    /// @brief Teleports the ship onto its slot.
    void snap();

    /// @brief Forgets slot history; called when the ship leaves a formation.
    void reset() noexcept
    {
        mHasLastTarget = false;
        mSlotVelocity = Vec3::zero();
    }

    /// @brief Not the leader, and the formation keeps more than three ships.
    [[nodiscard]] bool canBreakFormation() const;

    /// @brief How strongly this ship should hold its slot, in [0, 1].
    [[nodiscard]] float formationPriority() const;

    [[nodiscard]] bool isInPosition() const;
    [[nodiscard]] float distanceFromPosition() const;

    [[nodiscard]] const Vec3& targetPosition() const noexcept { return mTarget; }
    [[nodiscard]] const Vec3& slotVelocity() const noexcept { return mSlotVelocity; }

    void setPositionTolerance(float tolerance) noexcept { mTolerance = std::max(0.0f, tolerance); }
    [[nodiscard]] float positionTolerance() const noexcept { return mTolerance; }

    void setCatchUpSpeed(float multiplier) noexcept { mMaxCatchUp = std::max(1.0f, multiplier); }
    [[nodiscard]] float catchUpSpeed() const noexcept { return mMaxCatchUp; }

    void setSmoothingFactor(float smoothing) noexcept { mSmoothing = std::clamp(smoothing, 0.01f, 1.0f); }
    [[nodiscard]] float smoothingFactor() const noexcept { return mSmoothing; }

private:
    void steer(const FormationController& formation);

    AIEnemyShip* mShip;
    Vec3 mTarget;
    Vec3 mLastTarget;
    Vec3 mSlotVelocity;
    bool mHasLastTarget = false;

    float mTolerance = kDefaultPositionTolerance;
    float mMaxCatchUp = kDefaultMaxCatchUpSpeed;
    float mSmoothing = kDefaultSmoothing;
};

} // namespace fatp_fleet
