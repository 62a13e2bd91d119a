#pragma once

/**
 * @file FormationRegistry.h
 * @brief Owns every FormationController and the agent -> formation table.
 */

// FAT-P components used:
// - FastHashMap: FormationId -> controller, AgentId -> FormationId
// - Signal: Formation created / destroyed notifications
//
// This is the explicit membership table that replaces agent <-> formation
// back-pointers. An agent is in at most one formation: join() on an agent
// that already belongs somewhere is a programmer error. It is refused and
// logged at Error, leaving both tables untouched.
//
// Formation ids are handed out sequentially starting at 1 and never reused.
// mOrder keeps creation order so iteration is deterministic.

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

#include <fat_p/FastHashMap.h>
#include <fat_p/Signal.h>

#include "FormationController.h"
#include "Log.h"
#include "Types.h"

namespace fatp_fleet
{

class AIEnemyShip;
class CommunicationHub;

/**
 * @brief Formation ownership and membership.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class FormationRegistry
{
public:
    explicit FormationRegistry(const CommunicationHub& directory)
        : mDirectory(&directory)
    {
    }

    FormationRegistry(const FormationRegistry&) = delete;
    FormationRegistry& operator=(const FormationRegistry&) = delete;

    fat_p::Signal<void(FormationController&)> onFormationCreated;

    /// @brief Fired before the controller is freed.
    fat_p::Signal<void(FormationController&)> onFormationDestroyed;

    /// @brief Creates an empty formation.
    FormationController& create(FormationType type, const Vec3& center)
    {
        const FormationId id(mNextId++);
        auto controller = std::make_unique<FormationController>(id, type, center, *mDirectory);
        FormationController* raw = controller.get();
        mFormations.insert(id, std::move(controller));
        mOrder.push_back(id);

        FATP_FLEET_LOG_DEBUG("formation %u created (%.*s)",
                             id.get(),
                             static_cast<int>(toString(type).size()),
                             toString(type).data());

        onFormationCreated.emit(*raw);
        return *raw;
    }

    /**
     * @brief Adds ship to formation.
     *
     * @return false if the formation does not exist or ship already belongs
     *         to a formation.
     */
    bool join(FormationId formation, const AIEnemyShip& ship);

    /// @brief Removes agent from whatever formation it is in.
    bool leave(AgentId agent)
    {
        const FormationId* fid = mMembership.find(agent);
        if (fid == nullptr)
        {
            return false;
        }
        const FormationId formation = *fid;
        mMembership.erase(agent);

        FormationController* controller = find(formation);
        if (controller != nullptr)
        {
            (void)controller->removeMember(agent);
        }
        return true;
    }

    /// @brief Destroys a formation, releasing all its members.
    bool destroy(FormationId formation)
    {
        FormationController* controller = find(formation);
        if (controller == nullptr)
        {
            return false;
        }

        onFormationDestroyed.emit(*controller);

        for (AgentId member : controller->members())
        {
            mMembership.erase(member);
        }
        mFormations.erase(formation);
        mOrder.erase(std::remove(mOrder.begin(), mOrder.end(), formation), mOrder.end());
        return true;
    }

    /// @brief Destroys every formation with no members.
    std::size_t removeEmpty()
    {
        std::vector<FormationId> empty;
        for (FormationId id : mOrder)
        {
            const FormationController* controller = find(id);
            if (controller != nullptr && controller->empty())
            {
                empty.push_back(id);
            }
        }
        for (FormationId id : empty)
        {
            (void)destroy(id);
        }
        return empty.size();
    }

    [[nodiscard]] FormationController* find(FormationId formation) const
    {
        const auto* slot = mFormations.find(formation);
        return slot != nullptr ? slot->get() : nullptr;
    }

    /// @brief The formation agent belongs to, or nullptr.
    [[nodiscard]] FormationController* formationOf(AgentId agent) const
    {
        const FormationId* fid = mMembership.find(agent);
        return fid != nullptr ? find(*fid) : nullptr;
    }

    [[nodiscard]] bool isMember(AgentId agent) const
    {
        return mMembership.find(agent) != nullptr;
    }

    /// @brief The formation with the most members, or nullptr.
    [[nodiscard]] FormationController* largest() const
    {
        FormationController* best = nullptr;
        for (FormationId id : mOrder)
        {
            FormationController* controller = find(id);
            if (controller != nullptr &&
                (best == nullptr || controller->memberCount() > best->memberCount()))
            {
                best = controller;
            }
        }
        return best;
    }

    /// @brief Formation ids in creation order.
    [[nodiscard]] const std::vector<FormationId>& ids() const noexcept { return mOrder; }

    [[nodiscard]] std::size_t size() const noexcept { return mOrder.size(); }

    void clear()
    {
        while (!mOrder.empty())
        {
            (void)destroy(mOrder.back());
        }
    }

private:
    const CommunicationHub* mDirectory;
    fat_p::FastHashMap<FormationId, std::unique_ptr<FormationController>> mFormations;
    fat_p::FastHashMap<AgentId, FormationId> mMembership;
    std::vector<FormationId> mOrder;
    uint32_t mNextId = 1;
};

} // namespace fatp_fleet
