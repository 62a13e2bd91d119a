#pragma once

/**
 * @file AllyTracker.h
 * @brief Shared blackboard of each agent's last reported status.
 */

// FAT-P components used:
// - FastHashMap: AgentId -> last StatusData
//
// Last write wins. Entries are removed when the FleetManager retires an agent.

#include <cstdint>

#include <fat_p/FastHashMap.h>

#include "Message.h"
#include "Types.h"

namespace fatp_fleet
{

/// @brief StatusData plus the simulation time it arrived.
struct AllyRecord
{
    StatusData status;
    double reportedAt = 0.0;
};

/**
 * @brief Per-agent status store.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class AllyTracker
{
public:
    AllyTracker() = default;
    AllyTracker(const AllyTracker&) = delete;
    AllyTracker& operator=(const AllyTracker&) = delete;

    void updateAllyStatus(AgentId ally, const StatusData& status, double now)
    {
        mAllies.insert_or_assign(ally, AllyRecord{status, now});
    }

    [[nodiscard]] const AllyRecord* find(AgentId ally) const
    {
        return mAllies.find(ally);
    }

    bool remove(AgentId ally)
    {
        if (mAllies.find(ally) == nullptr)
        {
            return false;
        }
        mAllies.erase(ally);
        return true;
    }

    /// @brief Number of tracked allies whose last report flagged combat.
    [[nodiscard]] std::size_t countInCombat() const
    {
        std::size_t count = 0;
        for (auto it = mAllies.begin(); it != mAllies.end(); ++it)
        {
            if (it.value().status.inCombat)
            {
                ++count;
            }
        }
        return count;
    }

    /// @brief Mean reported health ratio, 1 when nothing is tracked.
    [[nodiscard]] float averageHealthRatio() const
    {
        if (mAllies.size() == 0)
        {
            return 1.0f;
        }
        float sum = 0.0f;
        for (auto it = mAllies.begin(); it != mAllies.end(); ++it)
        {
            sum += it.value().status.healthRatio;
        }
        return sum / static_cast<float>(mAllies.size());
    }

    [[nodiscard]] std::size_t size() const noexcept { return mAllies.size(); }
    void clear() { mAllies.clear(); }

private:
    fat_p::FastHashMap<AgentId, AllyRecord> mAllies;
};

} // namespace fatp_fleet
