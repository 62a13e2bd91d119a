#pragma once

/**
 * @file FormationController.h
 * @brief Group geometry, membership order, and leader succession for one
 *        formation.
 */

// FAT-P components used:
// - Signal: Leader change, member added, member removed notifications
// - SmallVector: World-space slot cache
//
// Membership is an ordered list of AgentIds; index 0 is the leader and owns
// slot 0. The controller never holds agent pointers. Whenever it needs ship
// data (leader pose, health for succession, combat state for the dynamic
// spread) it resolves ids through the CommunicationHub, which is the
// authoritative directory of live agents. Ids the hub no longer knows are
// skipped.
//
// Effective scale = difficultyScale * tacticalSpread. The difficulty
// controller owns the first factor, the dynamic combat adjustment and spread
// orders the second, so neither overwrites the other.
//
// A spread order is broadcast, so every member in range receives its own
// copy. applySpreadOrder remembers the last kOrderMemory (sender, sequence)
// pairs it applied and ignores further copies of the same send.
//
// The one-formation-per-agent invariant is enforced one level up by
// FormationRegistry, which is the only code that should call addMember /
// removeMember.

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include <fat_p/Signal.h>

#include "FormationGeometry.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

class AIEnemyShip;
class CommunicationHub;

/**
 * @brief One formation's geometry and membership.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class FormationController
{
public:
    static constexpr float kCombatSpread = 1.5f;
    static constexpr float kMinSpread = 0.8f;
    static constexpr float kSpreadRecoveryPerSecond = 0.1f;
    static constexpr float kCasualtyRateForSphere = 0.5f;
    static constexpr float kLeaderHealthFloor = 0.3f;
    static constexpr float kMinTacticalSpread = 0.5f;
    static constexpr float kMaxTacticalSpread = 3.0f;
    static constexpr std::size_t kOrderMemory = 16;

    FormationController(FormationId id,
                        FormationType type,
                        const Vec3& center,
                        const CommunicationHub& directory)
        : mId(id)
        , mType(type)
        , mCenter(center)
        , mDirectory(&directory)
    {
    }

    FormationController(const FormationController&) = delete;
    FormationController& operator=(const FormationController&) = delete;

    // =========================================================================
    // Signals
    // =========================================================================

    /// @brief Fired after a new leader moves to slot 0.
    fat_p::Signal<void(FormationId, AgentId)> onLeaderChanged;

    fat_p::Signal<void(FormationId, AgentId)> onMemberAdded;
    fat_p::Signal<void(FormationId, AgentId)> onMemberRemoved;

    // =========================================================================
    // Membership
    // =========================================================================

    /**
     * @brief Appends ship. The first member becomes leader.
     *
     * @return false if ship is already a member.
     */
    bool addMember(const AIEnemyShip& ship);

    /**
     * @brief Removes agent and re-indexes the rest. Losing the leader runs
     *        succession.
     *
     * @return false if agent was not a member.
     */
    bool removeMember(AgentId agent);

    /// @brief Moves agent to slot 0. No-op if agent is not a member.
    void setLeader(AgentId agent);

    [[nodiscard]] bool contains(AgentId agent) const noexcept
    {
        return indexOf(agent) >= 0;
    }

    /// @brief Slot index of agent, or -1.
    [[nodiscard]] int indexOf(AgentId agent) const noexcept
    {
        const auto it = std::find(mMembers.begin(), mMembers.end(), agent);
        return it == mMembers.end() ? -1 : static_cast<int>(it - mMembers.begin());
    }

    [[nodiscard]] AgentId leader() const noexcept
    {
        return mMembers.empty() ? NullAgent : mMembers.front();
    }

    [[nodiscard]] const std::vector<AgentId>& members() const noexcept { return mMembers; }
    [[nodiscard]] std::size_t memberCount() const noexcept { return mMembers.size(); }
    [[nodiscard]] std::size_t peakMemberCount() const noexcept { return mPeakMembers; }
    [[nodiscard]] bool empty() const noexcept { return mMembers.empty(); }

    // =========================================================================
    // Geometry
    // =========================================================================

    void changeFormation(FormationType type)
    {
        mType = type;
        recomputeSlots();
    }

    /// @brief Points the formation at destination and routes the leader there.
    void setDestination(const Vec3& destination);

    /**
     * @brief Follows the leader's pose, refreshes slots, and applies the
     *        dynamic combat adjustment.
     */
    void update(float dt);

    /// @brief World-space slot position, or the center for an invalid index.
    [[nodiscard]] Vec3 slotPosition(int index) const noexcept
    {
        if (index < 0 || static_cast<std::size_t>(index) >= mSlots.size())
        {
            return mCenter;
        }
        return mSlots[static_cast<std::size_t>(index)];
    }

    void recomputeSlots()
    {
        const SlotList local = localSlots(mType, mMembers.size(), scale());
        mSlots.clear();
        for (const Vec3& slot : local)
        {
            mSlots.push_back(toWorld(slot, mCenter, mDirection));
        }
    }

    [[nodiscard]] FormationId id() const noexcept { return mId; }
    [[nodiscard]] FormationType type() const noexcept { return mType; }
    [[nodiscard]] const Vec3& center() const noexcept { return mCenter; }
    [[nodiscard]] const Vec3& direction() const noexcept { return mDirection; }
    [[nodiscard]] const Vec3& destination() const noexcept { return mDestination; }
    [[nodiscard]] bool hasDestination() const noexcept { return mHasDestination; }

    void setCenter(const Vec3& center)
    {
        mCenter = center;
        recomputeSlots();
    }

    void setDirection(const Vec3& direction)
    {
        const Vec3 n = normalize(direction);
        if (n.lengthSquared() > 0.0f)
        {
            mDirection = n;
            recomputeSlots();
        }
    }

    // =========================================================================
    // Scale
    // =========================================================================

    [[nodiscard]] float scale() const noexcept { return mDifficultyScale * mTacticalSpread; }

    [[nodiscard]] float difficultyScale() const noexcept { return mDifficultyScale; }
    void setDifficultyScale(float s)
    {
        mDifficultyScale = s;
        recomputeSlots();
    }

    [[nodiscard]] float tacticalSpread() const noexcept { return mTacticalSpread; }
    void setTacticalSpread(float s)
    {
        mTacticalSpread = s;
        recomputeSlots();
    }

    /**
     * @brief Multiplies tacticalSpread by factor, clamped to
     *        [kMinTacticalSpread, kMaxTacticalSpread], once per send.
     *
     * @param sequence The order message's sequence; 0 (unsequenced) is
     *        always applied.
     * @return false if this send was already applied.
     */
    bool applySpreadOrder(AgentId sender, uint64_t sequence, float factor)
    {
        if (sequence != 0)
        {
            for (const OrderKey& key : mRecentOrders)
            {
                if (key.sequence == sequence && key.sender == sender)
                {
                    return false;
                }
            }
            mRecentOrders[mOrderCursor] = OrderKey{sender, sequence};
            mOrderCursor = (mOrderCursor + 1) % kOrderMemory;
        }
        setTacticalSpread(std::clamp(mTacticalSpread * factor, kMinTacticalSpread, kMaxTacticalSpread));
        return true;
    }

    /// @brief Cruise speed cap for members catching up. 0 means uncapped.
    void setFormationSpeed(float speed) noexcept { mFormationSpeed = std::max(0.0f, speed); }
    [[nodiscard]] float formationSpeed() const noexcept { return mFormationSpeed; }

    void setDynamic(bool dynamic) noexcept { mDynamic = dynamic; }
    [[nodiscard]] bool isDynamic() const noexcept { return mDynamic; }

    /// @brief True if any member currently has a target.
    [[nodiscard]] bool inCombat() const;

    /// @brief health*30 + type bonus + teamwork*10.
    [[nodiscard]] static float leadershipScore(const AIEnemyShip& ship);

private:
    struct OrderKey
    {
        AgentId sender = NullAgent;
        uint64_t sequence = 0;
    };

    void selectNewLeader();
    void adjustDynamically(float dt);

    FormationId mId;
    FormationType mType;
    Vec3 mCenter;
    Vec3 mDirection = Vec3::unitZ();
    Vec3 mDestination;
    bool mHasDestination = false;

    const CommunicationHub* mDirectory;

    std::vector<AgentId> mMembers;
    std::size_t mPeakMembers = 0;
    SlotList mSlots;

    float mDifficultyScale = 1.0f;
    float mTacticalSpread = 1.0f;
    float mFormationSpeed = 0.0f;
    bool mDynamic = true;

    std::array<OrderKey, kOrderMemory> mRecentOrders{};
    std::size_t mOrderCursor = 0;
};

} // namespace fatp_fleet
