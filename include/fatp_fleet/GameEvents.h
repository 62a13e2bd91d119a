#pragma once

/**
 * @file GameEvents.h
 * @brief Bounded feed of gameplay events the AI core reacts to.
 */

// FAT-P components used:
// - CircularBuffer: Bounded FIFO of pending events
//
// The game (collision, weapons, player bookkeeping) publishes events; the
// FleetManager drains the feed once per tick and turns each event into
// agent or tracker calls. The feed never blocks a producer: when full it
// drops the oldest pending event and logs a warning.

#include <cstdint>

#include <fat_p/CircularBuffer.h>

#include "Log.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

enum class GameEventKind : uint8_t
{
    DamageTaken,
    AllyDestroyed,
    PlayerDeath,
    PlayerKill,
    PlayerShot
};

/// @brief One event. Fields not used by a kind stay at their defaults.
struct GameEvent
{
    GameEventKind kind = GameEventKind::PlayerKill;
    AgentId agent = NullAgent;
    float amount = 0.0f;
    Vec3 source;
    bool hit = false;

    [[nodiscard]] static GameEvent damageTaken(AgentId agent, float amount, const Vec3& source) noexcept
    {
        GameEvent e;
        e.kind = GameEventKind::DamageTaken;
        e.agent = agent;
        e.amount = amount;
        e.source = source;
        return e;
    }

    [[nodiscard]] static GameEvent allyDestroyed(AgentId agent) noexcept
    {
        GameEvent e;
        e.kind = GameEventKind::AllyDestroyed;
        e.agent = agent;
        return e;
    }

    /// @param survivalTime Seconds the player lived.
    [[nodiscard]] static GameEvent playerDeath(float survivalTime) noexcept
    {
        GameEvent e;
        e.kind = GameEventKind::PlayerDeath;
        e.amount = survivalTime;
        return e;
    }

    [[nodiscard]] static GameEvent playerKill() noexcept
    {
        GameEvent e;
        e.kind = GameEventKind::PlayerKill;
        return e;
    }

    [[nodiscard]] static GameEvent playerShot(bool hit) noexcept
    {
        GameEvent e;
        e.kind = GameEventKind::PlayerShot;
        e.hit = hit;
        return e;
    }
};

/**
 * @brief Drop-oldest event queue.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class GameEventFeed
{
public:
    static constexpr std::size_t kCapacity = 128;

    GameEventFeed() = default;
    GameEventFeed(const GameEventFeed&) = delete;
    GameEventFeed& operator=(const GameEventFeed&) = delete;

    void publish(const GameEvent& event)
    {
        if (mEvents.push(event))
        {
            return;
        }

        GameEvent oldest;
        (void)mEvents.pop(oldest);
        ++mDropped;
        FATP_FLEET_LOG_WARN("game event feed full, dropped oldest event (kind %u)",
                            static_cast<unsigned>(oldest.kind));
        (void)mEvents.push(event);
    }

    /**
     * @brief Hands every event pending at call time to fn, oldest first.
     *
     * @return Number of events handled.
     */
    template <typename Fn>
    std::size_t drain(Fn&& fn)
    {
        std::size_t remaining = mEvents.size();
        std::size_t handled = 0;
        GameEvent event;
        while (remaining > 0 && mEvents.pop(event))
        {
            --remaining;
            ++handled;
            fn(event);
        }
        return handled;
    }

    [[nodiscard]] std::size_t pending() const { return mEvents.size(); }
    [[nodiscard]] uint64_t droppedCount() const noexcept { return mDropped; }

private:
    fat_p::CircularBuffer<GameEvent, kCapacity> mEvents;
    uint64_t mDropped = 0;
};

} // namespace fatp_fleet
