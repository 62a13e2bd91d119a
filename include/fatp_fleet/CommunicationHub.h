#pragma once

/**
 * @file CommunicationHub.h
 * @brief Directory of live agents and router for directed and range-filtered
 *        broadcast messages.
 */

// FAT-P components used:
// - FastHashMap: AgentId -> agent lookup for directed sends
//
// The hub does not own agents. FleetManager (or a test) registers an agent
// when it is created and unregisters it before it is freed; from that moment
// messages addressed to it are dropped without error.
//
// Broadcast fan-out visits agents in registration order. Recipients only
// enqueue, so delivery order across recipients carries no meaning; it is
// fixed only to keep runs reproducible.

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fat_p/FastHashMap.h>

#include "Message.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

class AIEnemyShip;

/**
 * @brief Agent registry and message router.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class CommunicationHub
{
public:
    static constexpr float kDefaultRange = 150.0f;

    CommunicationHub() = default;
    CommunicationHub(const CommunicationHub&) = delete;
    CommunicationHub& operator=(const CommunicationHub&) = delete;

    // =========================================================================
    // Registry
    // =========================================================================

    /// @brief Registers ship. Idempotent.
    void registerAgent(AIEnemyShip& ship);

    /// @brief Forgets agent. Returns false if it was not registered.
    bool unregisterAgent(AgentId agent)
    {
        if (mAgents.find(agent) == nullptr)
        {
            return false;
        }
        mAgents.erase(agent);
        mOrder.erase(std::remove(mOrder.begin(), mOrder.end(), agent), mOrder.end());
        return true;
    }

    [[nodiscard]] AIEnemyShip* find(AgentId agent) const
    {
        AIEnemyShip* const* slot = mAgents.find(agent);
        return slot != nullptr ? *slot : nullptr;
    }

    [[nodiscard]] bool isRegistered(AgentId agent) const
    {
        return mAgents.find(agent) != nullptr;
    }

    [[nodiscard]] std::size_t agentCount() const noexcept { return mOrder.size(); }

    /// @brief Registered agent ids in registration order.
    [[nodiscard]] const std::vector<AgentId>& agentIds() const noexcept { return mOrder; }

    /// @brief Live agents within radius of center, excluding one id.
    [[nodiscard]] std::vector<AIEnemyShip*> agentsWithin(const Vec3& center,
                                                         float radius,
                                                         AgentId exclude = NullAgent) const;

    // =========================================================================
    // Routing
    // =========================================================================

    /**
     * @brief Delivers msg to every other registered agent within range of
     *        origin.
     *
     * @return Number of recipients.
     */
    std::size_t broadcast(const AIMessage& msg, const Vec3& origin);

    /**
     * @brief Delivers msg to msg.target.
     *
     * @return false if there is no target or it is not registered.
     */
    bool send(const AIMessage& msg);

    /// @throws std::invalid_argument if range is negative.
    void setCommunicationRange(float range)
    {
        if (range < 0.0f)
        {
            throw std::invalid_argument("CommunicationHub: communication range must be >= 0");
        }
        mRange = range;
    }

    [[nodiscard]] float communicationRange() const noexcept { return mRange; }

    /// @brief Total deliveries (broadcast recipients + directed sends).
    [[nodiscard]] uint64_t deliveredCount() const noexcept { return mDelivered; }

private:
    fat_p::FastHashMap<AgentId, AIEnemyShip*> mAgents;
    std::vector<AgentId> mOrder;
    float mRange = kDefaultRange;
    uint64_t mDelivered = 0;
};

} // namespace fatp_fleet
