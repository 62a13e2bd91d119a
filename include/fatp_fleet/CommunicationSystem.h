#pragma once

/**
 * @file CommunicationSystem.h
 * @brief Per-agent message endpoint with batched, rate-limited delivery.
 */

// FAT-P components used:
// - CircularBuffer: Bounded inbound/outbound FIFO queues and message history
// - Signal: onMessageReceived / onMessageSent
//
// Traffic is decoupled from decisions: sendMessage() only enqueues, and
// update() drains both queues once every processing interval (0.2 s by
// default). A drain pass handles the inbound messages that were queued when
// the pass began, in FIFO order, then flushes the outbound queue the same way.
//
// Full queues drop the newest message and log a warning; the drop counter is
// exposed for tests and diagnostics. The history ring keeps the newest
// kMaxHistory processed messages, dropping the oldest.
//
// sendMessage stamps each message with the clock and a per-endpoint sequence
// number, so (sender, sequence) identifies one send across every copy a
// broadcast fans out to.
//
// The endpoint knows nothing about agents. Message semantics live in the
// handler its owner installs (AIEnemyShip::handleMessage). A handler that
// throws std::exception costs only that message: the exception is logged and
// the pass continues.

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fat_p/CircularBuffer.h>
#include <fat_p/Signal.h>

#include "Log.h"
#include "Message.h"
#include "Types.h"

namespace fatp_fleet
{

class CommunicationHub;

/**
 * @brief Inbound/outbound message queues for one agent.
 *
 * @note Thread-safety: NOT thread-safe. CircularBuffer is SPSC, and both ends
 *       of each queue are driven from the simulation thread.
 */
class CommunicationSystem
{
public:
    static constexpr std::size_t kQueueCapacity = 64;
    static constexpr std::size_t kMaxHistory = 64;
    static constexpr float kDefaultProcessingInterval = 0.2f;

    using Handler = std::function<void(const AIMessage&)>;

    CommunicationSystem(AgentId owner, CommunicationHub& hub, const SimClock& clock)
        : mOwner(owner)
        , mHub(&hub)
        , mClock(&clock)
    {
    }

    CommunicationSystem(const CommunicationSystem&) = delete;
    CommunicationSystem& operator=(const CommunicationSystem&) = delete;

    fat_p::Signal<void(const AIMessage&)> onMessageReceived;
    fat_p::Signal<void(const AIMessage&)> onMessageSent;

    void setHandler(Handler handler) { mHandler = std::move(handler); }

    /**
     * @brief Advances the accumulator; runs a drain pass when it crosses the
     *        processing interval.
     *
     * @param origin Owner position, used as the broadcast origin.
     * @return true if a drain pass ran.
     */
    bool update(float dt, const Vec3& origin)
    {
        mAccumulator += dt;
        if (mAccumulator < mInterval)
        {
            return false;
        }
        processIncoming();
        processOutgoing(origin);
        mAccumulator = 0.0f;
        return true;
    }

    /// @brief Stamps msg with the current time and the next sequence number,
    ///        then queues it for delivery.
    bool sendMessage(AIMessage msg)
    {
        msg.timestamp = mClock->now();
        msg.sequence = ++mSequence;
        if (msg.sender == NullAgent)
        {
            msg.sender = mOwner;
        }
        if (!mOutbound.push(msg))
        {
            ++mDropped;
            FATP_FLEET_LOG_WARN("agent %u: outbound queue full, dropped %.*s",
                                mOwner.get(),
                                static_cast<int>(toString(msg.type).size()),
                                toString(msg.type).data());
            return false;
        }
        return true;
    }

    /// @brief Sequence number stamped on the most recent send. 0 before any.
    [[nodiscard]] uint64_t lastSequence() const noexcept { return mSequence; }

    /// @brief sendMessage with the broadcast flag set.
    bool broadcastMessage(AIMessage msg)
    {
        msg.isBroadcast = true;
        return sendMessage(std::move(msg));
    }

    /// @brief Called by the hub. Queues msg for the next drain pass.
    bool receiveMessage(const AIMessage& msg)
    {
        if (!mInbound.push(msg))
        {
            ++mDropped;
            FATP_FLEET_LOG_WARN("agent %u: inbound queue full, dropped %.*s",
                                mOwner.get(),
                                static_cast<int>(toString(msg.type).size()),
                                toString(msg.type).data());
            return false;
        }
        return true;
    }

    /**
     * @brief Processed inbound messages, oldest first, optionally filtered.
     *
     * Walks the ring by popping every entry and pushing it back, so the
     * history is left exactly as it was.
     */
    [[nodiscard]] std::vector<AIMessage> messageHistory(std::optional<MessageType> filter = std::nullopt)
    {
        std::vector<AIMessage> result;
        std::size_t remaining = mHistory.size();
        AIMessage msg;
        while (remaining > 0 && mHistory.pop(msg))
        {
            --remaining;
            if (!filter || msg.type == *filter)
            {
                result.push_back(msg);
            }
            (void)mHistory.push(msg);
        }
        return result;
    }

    [[nodiscard]] std::size_t historySize() const { return mHistory.size(); }

    void clearMessageHistory()
    {
        AIMessage discarded;
        while (mHistory.pop(discarded))
        {
        }
    }

    [[nodiscard]] std::size_t pendingIncoming() const { return mInbound.size(); }
    [[nodiscard]] std::size_t pendingOutgoing() const { return mOutbound.size(); }
    [[nodiscard]] uint64_t droppedCount() const noexcept { return mDropped; }

    /// @throws std::invalid_argument if interval is not positive.
    void setProcessingInterval(float interval)
    {
        if (!(interval > 0.0f))
        {
            throw std::invalid_argument("CommunicationSystem: processing interval must be > 0");
        }
        mInterval = interval;
    }

    [[nodiscard]] float processingInterval() const noexcept { return mInterval; }
    [[nodiscard]] AgentId owner() const noexcept { return mOwner; }

private:
    void processIncoming()
    {
        // Only what was queued when the pass began; anything a handler causes
        // to arrive here waits for the next pass.
        std::size_t remaining = mInbound.size();
        AIMessage msg;
        while (remaining > 0 && mInbound.pop(msg))
        {
            --remaining;
            dispatch(msg);

            recordHistory(msg);

            if (onMessageReceived.slotCount() > 0)
            {
                onMessageReceived.emit(msg);
            }
        }
    }

    void processOutgoing(const Vec3& origin);

    void recordHistory(const AIMessage& msg)
    {
        if (mHistory.push(msg))
        {
            return;
        }
        AIMessage oldest;
        (void)mHistory.pop(oldest);
        (void)mHistory.push(msg);
    }

    void dispatch(const AIMessage& msg)
    {
        if (!mHandler)
        {
            return;
        }
        try
        {
            mHandler(msg);
        }
        catch (const std::exception& e)
        {
            FATP_FLEET_LOG_WARN("agent %u: handler for %.*s failed: %s",
                                mOwner.get(),
                                static_cast<int>(toString(msg.type).size()),
                                toString(msg.type).data(),
                                e.what());
        }
    }

    AgentId mOwner;
    CommunicationHub* mHub;
    const SimClock* mClock;
    Handler mHandler;

    fat_p::CircularBuffer<AIMessage, kQueueCapacity> mInbound;
    fat_p::CircularBuffer<AIMessage, kQueueCapacity> mOutbound;
    fat_p::CircularBuffer<AIMessage, kMaxHistory> mHistory;

    float mInterval = kDefaultProcessingInterval;
    float mAccumulator = 0.0f;
    uint64_t mDropped = 0;
    uint64_t mSequence = 0;
};

} // namespace fatp_fleet
