#pragma once

/**
 * @file AIState.h
 * @brief Behavior state interface and the per-agent state machine.
 */

// Each agent owns one AIStateMachine holding exactly one active AIState.
// Transitions are evaluated at the top of every tick, before the active
// state's update runs, so a single tick may both switch state and act in the
// new one. States are identified by StateId: a candidate whose id equals the
// current id is not a transition and fires no hooks.
//
// States are heap-allocated and owned by the machine. A state may hold
// per-activation data (timers, patrol points); entering a state always
// constructs a fresh instance. A changeState() issued while the active state's
// update() is running (e.g. the ship takes damage from inside its own attack
// logic) is deferred until that update returns, so a state never destroys
// itself mid-call.

#include <cstdint>
#include <memory>
#include <string_view>

#include "Types.h"

namespace fatp_fleet
{

class AIEnemyShip;

// =============================================================================
// AIState
// =============================================================================

/// @brief One behavior unit. Hooks must not throw.
class AIState
{
public:
    virtual ~AIState() = default;
    AIState() = default;
    AIState(const AIState&) = delete;
    AIState& operator=(const AIState&) = delete;
    AIState(AIState&&) = delete;
    AIState& operator=(AIState&&) = delete;

    [[nodiscard]] virtual StateId id() const noexcept = 0;
    [[nodiscard]] std::string_view name() const noexcept { return toString(id()); }

    virtual void onEnter(AIEnemyShip& /*ship*/) {}
    virtual void update(AIEnemyShip& ship, float dt) = 0;
    virtual void onExit(AIEnemyShip& /*ship*/) {}

    /**
     * @brief Proposes the next state.
     *
     * @return A new state to switch to, or nullptr to stay.
     */
    [[nodiscard]] virtual std::unique_ptr<AIState> checkTransitions(AIEnemyShip& ship) = 0;
};

// =============================================================================
// AIStateMachine
// =============================================================================

/**
 * @brief Single-active-state behavior selector.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class AIStateMachine
{
public:
    AIStateMachine() = default;
    AIStateMachine(const AIStateMachine&) = delete;
    AIStateMachine& operator=(const AIStateMachine&) = delete;

    /// @brief Installs the start state and runs its enter hook.
    void initialize(std::unique_ptr<AIState> state, AIEnemyShip& ship)
    {
        if (!state)
        {
            return;
        }
        if (mCurrent)
        {
            mCurrent->onExit(ship);
        }
        mCurrent = std::move(state);
        mCurrent->onEnter(ship);
    }

    /// @brief Evaluates transitions, then updates whichever state is current.
    void update(AIEnemyShip& ship, float dt)
    {
        if (!mCurrent)
        {
            return;
        }

        auto next = mCurrent->checkTransitions(ship);
        if (next)
        {
            changeState(std::move(next), ship);
        }

        mInUpdate = true;
        mCurrent->update(ship, dt);
        mInUpdate = false;

        if (mPending)
        {
            changeState(std::move(mPending), ship);
        }
    }

    /**
     * @brief Switches to state unless it has the same id as the current one.
     *
     * @return true if a transition happened (or was deferred).
     */
    bool changeState(std::unique_ptr<AIState> state, AIEnemyShip& ship)
    {
        if (!state)
        {
            return false;
        }
        if (mCurrent && mCurrent->id() == state->id())
        {
            return false;
        }
        if (mInUpdate)
        {
            mPending = std::move(state);
            return true;
        }

        if (mCurrent)
        {
            mPrevious = mCurrent->id();
            mHasPrevious = true;
            mCurrent->onExit(ship);
        }

        mCurrent = std::move(state);
        ++mTransitions;
        mCurrent->onEnter(ship);
        return true;
    }

    [[nodiscard]] bool isInState(StateId id) const noexcept
    {
        return mCurrent && mCurrent->id() == id;
    }

    [[nodiscard]] AIState* currentState() const noexcept { return mCurrent.get(); }

    [[nodiscard]] bool hasPreviousState() const noexcept { return mHasPrevious; }
    [[nodiscard]] StateId previousStateId() const noexcept { return mPrevious; }

    /// @brief Number of real transitions since construction.
    [[nodiscard]] uint32_t transitionCount() const noexcept { return mTransitions; }

private:
    std::unique_ptr<AIState> mCurrent;
    std::unique_ptr<AIState> mPending;
    StateId mPrevious = StateId::Patrol;
    bool mHasPrevious = false;
    uint32_t mTransitions = 0;
    bool mInUpdate = false;
};

} // namespace fatp_fleet
