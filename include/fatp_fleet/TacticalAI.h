#pragma once

/**
 * @file TacticalAI.h
 * @brief Group-level tactic selection and command.
 */

// FAT-P components used:
// - Signal: Decision notifications for telemetry and tests
// - FastHashMap: Per-group pending outcomes and last tactic per formation
// - SmallVector: Candidate option list
//
// Each evaluation splits the live agents into command groups: one per
// formation (leader first) plus one group of unassigned ships. A group with
// no targeted member sits the pass out. For the rest:
//
//   1. assess the situation (health, spacing, threat) against the group's
//      freshest target
//   2. score the six tactics and drop those whose requirements (group size,
//      average health, hull classes) the group does not meet
//   3. weight each score by the tactic's remembered success rate and pick
//      the best
//   4. the commander (group front) carries the order out locally and
//      broadcasts it as a TacticalOrder; members of the same command apply it
//      on receipt
//   5. when a formation's tactic changes, the commander also issues the
//      matching FormationOrder (spread for the two-pronged tactics, a sphere
//      for defense)
//
// Outcomes are judged at the group's next evaluation: the tactic succeeded if
// the group lost no ships and its average health fell by at most
// kSuccessHealthDrop.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include <fat_p/FastHashMap.h>
#include <fat_p/Signal.h>
#include <fat_p/SmallVector.h>

#include "AIEnemyShip.h"
#include "FormationController.h"
#include "FormationRegistry.h"
#include "Log.h"
#include "Message.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

// =============================================================================
// Situation and options
// =============================================================================

struct TacticalSituation
{
    std::size_t allyCount = 0;
    float allyHealthAverage = 1.0f;
    float targetDistance = 0.0f;
    float formationIntegrity = 1.0f;
    float threatLevel = 0.0f;
    float terrainAdvantage = 0.5f;
};

[[nodiscard]] constexpr uint8_t shipTypeBit(ShipType type) noexcept
{
    return static_cast<uint8_t>(1u << static_cast<unsigned>(type));
}

struct TacticalRequirements
{
    std::size_t minAllies = 1;
    float minHealthRatio = 0.0f;

    /// @brief shipTypeBit of every hull class that must be present.
    uint8_t requiredTypes = 0;
};

struct TacticalOption
{
    TacticalOrder type = TacticalOrder::DirectAssault;
    float effectiveness = 0.0f;
    TacticalRequirements requirements;
};

/// @brief One group's choice on one evaluation.
struct TacticalDecision
{
    TacticalOrder tactic = TacticalOrder::DirectAssault;
    FormationId formation = NullFormation;
    AgentId commander = NullAgent;
    std::size_t groupSize = 0;
    float effectiveness = 0.0f;
    TacticalSituation situation;
    std::vector<AgentId> members;
};

// =============================================================================
// TacticalMemory
// =============================================================================

/**
 * @brief Bounded log of executed tactics and their outcomes.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class TacticalMemory
{
public:
    static constexpr std::size_t kMaxEntries = 100;
    static constexpr float kDefaultSuccessRate = 0.5f;

    struct Entry
    {
        uint64_t serial = 0;
        TacticalOrder tactic = TacticalOrder::DirectAssault;
        TacticalSituation situation;
        std::optional<bool> success;
    };

    /// @return Serial for resolve().
    uint64_t record(TacticalOrder tactic, const TacticalSituation& situation)
    {
        Entry entry;
        entry.serial = ++mSerial;
        entry.tactic = tactic;
        entry.situation = situation;
        mEntries.push_back(entry);
        if (mEntries.size() > kMaxEntries)
        {
            mEntries.pop_front();
        }
        return entry.serial;
    }

    /// @return false if the entry has already been evicted.
    bool resolve(uint64_t serial, bool success)
    {
        for (Entry& entry : mEntries)
        {
            if (entry.serial == serial)
            {
                entry.success = success;
                return true;
            }
        }
        return false;
    }

    /// @brief Share of resolved entries for tactic that succeeded.
    [[nodiscard]] float successRate(TacticalOrder tactic) const
    {
        std::size_t resolved = 0;
        std::size_t succeeded = 0;
        for (const Entry& entry : mEntries)
        {
            if (entry.tactic == tactic && entry.success.has_value())
            {
                ++resolved;
                if (*entry.success)
                {
                    ++succeeded;
                }
            }
        }
        return resolved == 0 ? kDefaultSuccessRate : static_cast<float>(succeeded) / static_cast<float>(resolved);
    }

    [[nodiscard]] const std::deque<Entry>& entries() const noexcept { return mEntries; }
    [[nodiscard]] std::size_t size() const noexcept { return mEntries.size(); }
    void clear() { mEntries.clear(); }

private:
    std::deque<Entry> mEntries;
    uint64_t mSerial = 0;
};

// =============================================================================
// TacticalAI
// =============================================================================

/**
 * @brief Picks and commands one tactic per group on each evaluation.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class TacticalAI
{
public:
    using Group = std::vector<AIEnemyShip*>;
    using OptionList = fat_p::SmallVector<TacticalOption, 8>;

    static constexpr float kFlankRadius = 80.0f;
    static constexpr float kPincerDistance = 100.0f;
    static constexpr float kPincerLeadTime = 3.0f;
    static constexpr float kOptimalSpacing = 40.0f;
    static constexpr float kIntegrityRange = 100.0f;
    static constexpr float kProximityRange = 200.0f;
    static constexpr float kBombardmentRange = 80.0f;
    static constexpr float kSpeedNormalizer = 100.0f;
    static constexpr float kSuccessHealthDrop = 0.1f;
    static constexpr float kFlankSpread = 1.25f;

    fat_p::Signal<void(const TacticalDecision&)> onDecision;

    /**
     * @brief Runs one evaluation over agents.
     *
     * @return The decisions made, one per group that acted.
     */
    std::vector<TacticalDecision> update(const std::vector<AIEnemyShip*>& agents, FormationRegistry& formations)
    {
        std::vector<TacticalDecision> decisions;

        for (const auto& [key, group] : buildGroups(agents, formations))
        {
            const std::optional<Contact> target = groupTarget(group);
            if (!target)
            {
                continue;
            }

            const TacticalSituation situation = assessSituation(group, *target);
            resolvePending(key, situation);

            const OptionList options = generateOptions(group, *target, formations);
            const TacticalOption* best = selectBest(options);
            if (best == nullptr)
            {
                continue;
            }

            TacticalDecision decision;
            decision.tactic = best->type;
            decision.formation = key;
            decision.commander = group.front()->id();
            decision.groupSize = group.size();
            decision.effectiveness = best->effectiveness;
            decision.situation = situation;
            for (const AIEnemyShip* ship : group)
            {
                decision.members.push_back(ship->id());
            }

            command(*group.front(), key, decision.tactic, *target, formations);

            Pending pending;
            pending.serial = mMemory.record(decision.tactic, situation);
            pending.groupSize = group.size();
            pending.healthAverage = situation.allyHealthAverage;
            mPending.insert_or_assign(key, pending);

            FATP_FLEET_LOG_DEBUG("group of %zu under %u: %.*s (%.2f)",
                                 group.size(),
                                 decision.commander.get(),
                                 static_cast<int>(toString(decision.tactic).size()),
                                 toString(decision.tactic).data(),
                                 static_cast<double>(decision.effectiveness));
            if (onDecision.slotCount() > 0)
            {
                onDecision.emit(decision);
            }
            decisions.push_back(std::move(decision));
        }
        return decisions;
    }

    /// @brief Drops per-formation state for a dissolved formation.
    void forgetFormation(FormationId formation)
    {
        mPending.erase(formation);
        mFormationTactics.erase(formation);
    }

    [[nodiscard]] TacticalMemory& memory() noexcept { return mMemory; }
    [[nodiscard]] const TacticalMemory& memory() const noexcept { return mMemory; }

    /// @brief Tactic last commanded for formation, if any.
    [[nodiscard]] std::optional<TacticalOrder> lastTactic(FormationId formation) const
    {
        const TacticalOrder* last = mFormationTactics.find(formation);
        return last != nullptr ? std::optional<TacticalOrder>(*last) : std::nullopt;
    }

    // =========================================================================
    // Assessment
    // =========================================================================

    [[nodiscard]] static TacticalSituation assessSituation(const Group& group, const Contact& target)
    {
        TacticalSituation s;
        s.allyCount = group.size();
        s.allyHealthAverage = averageHealth(group);
        s.targetDistance = averageDistance(group, target.position);
        s.formationIntegrity = formationIntegrity(group);
        s.threatLevel = (1.0f - s.allyHealthAverage
                         + std::max(0.0f, 1.0f - s.targetDistance / kProximityRange)) / 2.0f;
        return s;
    }

    /// @brief Every tactic the group qualifies for, with its raw score.
    [[nodiscard]] static OptionList generateOptions(const Group& group,
                                                    const Contact& target,
                                                    const FormationRegistry& formations)
    {
        const float health = averageHealth(group);
        const float coordination = coordinationLevel(group, formations);
        const float fast = static_cast<float>(countIf(group, [](ShipType t)
                                              { return t == ShipType::Interceptor || t == ShipType::Scout; }));
        const float n = static_cast<float>(group.size());

        OptionList candidates;

        {
            float dps = 0.0f;
            for (const AIEnemyShip* ship : group)
            {
                dps += estimateDps(ship->shipType());
            }
            candidates.push_back(TacticalOption{TacticalOrder::DirectAssault,
                                                dps * health * (group.size() > 1 ? 1.2f : 0.8f) * 0.1f,
                                                TacticalRequirements{2, 0.6f, 0}});
        }

        candidates.push_back(TacticalOption{
            TacticalOrder::FlankingManeuver,
            (fast * 0.3f + coordination * 0.4f + formationSpacing(group) * 0.3f) * 0.8f,
            TacticalRequirements{3, 0.0f,
                                 static_cast<uint8_t>(shipTypeBit(ShipType::Interceptor)
                                                      | shipTypeBit(ShipType::Fighter))}});

        candidates.push_back(TacticalOption{
            TacticalOrder::PincerMovement,
            group.size() < 4 ? 0.0f : coordination * encirclementPotential(group, target.position) * health * 0.9f,
            TacticalRequirements{4, 0.5f, 0}});

        {
            const float damaged = static_cast<float>(std::count_if(group.begin(), group.end(),
                [](const AIEnemyShip* s) { return s->healthRatio() < 0.5f; }));
            const float defenders = static_cast<float>(countIf(group, [](ShipType t)
                                                       { return t == ShipType::Bomber || t == ShipType::Fighter; }));
            candidates.push_back(TacticalOption{
                TacticalOrder::DefensiveFormation,
                (damaged * 0.4f + formationIntegrity(group) * 0.3f + defenders * 0.3f) * 0.6f,
                TacticalRequirements{1, 0.3f, 0}});
        }

        {
            float mobility = 0.0f;
            for (const AIEnemyShip* ship : group)
            {
                mobility += ship->speed() / kSpeedNormalizer;
            }
            mobility /= n;
            candidates.push_back(TacticalOption{
                TacticalOrder::HitAndRun,
                (fast * 0.5f + mobility * 0.3f + health * 0.2f) * 0.7f,
                TacticalRequirements{1, 0.0f,
                                     static_cast<uint8_t>(shipTypeBit(ShipType::Scout)
                                                          | shipTypeBit(ShipType::Interceptor))}});
        }

        {
            const float bombers = static_cast<float>(countIf(group, [](ShipType t) { return t == ShipType::Bomber; }));
            const float range = averageDistance(group, target.position);
            const float rangeEffectiveness = range > kBombardmentRange ? 1.0f : range / kBombardmentRange;
            candidates.push_back(TacticalOption{
                TacticalOrder::SuppressionBombardment,
                bombers * 0.5f + (n - bombers) * 0.2f + rangeEffectiveness * 0.3f,
                TacticalRequirements{1, 0.0f, shipTypeBit(ShipType::Bomber)}});
        }

        OptionList options;
        for (const TacticalOption& option : candidates)
        {
            if (meetsRequirements(option.requirements, group))
            {
                options.push_back(option);
            }
        }
        return options;
    }

    [[nodiscard]] static bool meetsRequirements(const TacticalRequirements& r, const Group& group)
    {
        if (group.size() < r.minAllies || group.empty())
        {
            return false;
        }
        if (averageHealth(group) < r.minHealthRatio)
        {
            return false;
        }
        uint8_t present = 0;
        for (const AIEnemyShip* ship : group)
        {
            present = static_cast<uint8_t>(present | shipTypeBit(ship->shipType()));
        }
        return (present & r.requiredTypes) == r.requiredTypes;
    }

    /// @brief Highest effectiveness weighted by remembered success; first wins ties.
    [[nodiscard]] const TacticalOption* selectBest(const OptionList& options) const
    {
        const TacticalOption* best = nullptr;
        float bestScore = 0.0f;
        for (const TacticalOption& option : options)
        {
            const float score = weightedScore(option);
            if (best == nullptr || score > bestScore)
            {
                best = &option;
                bestScore = score;
            }
        }
        return best;
    }

    [[nodiscard]] float weightedScore(const TacticalOption& option) const
    {
        return option.effectiveness * (0.75f + 0.5f * mMemory.successRate(option.type));
    }

    // =========================================================================
    // Geometry
    // =========================================================================

    /// @brief Two points beside target at 90 and 270 degrees on the XZ plane.
    [[nodiscard]] static TacticalOrderData flankPositions(const Vec3& target)
    {
        TacticalOrderData data;
        data.order = TacticalOrder::FlankingManeuver;
        data.wingA = target + Vec3(0.0f, 0.0f, kFlankRadius);
        data.wingB = target + Vec3(0.0f, 0.0f, -kFlankRadius);
        data.hasWings = true;
        return data;
    }

    /// @brief Two points either side of where target will be in kPincerLeadTime.
    [[nodiscard]] static TacticalOrderData pincerPositions(const Vec3& target, const Vec3& velocity)
    {
        const Vec3 predicted = target + velocity * kPincerLeadTime;
        Vec3 perpendicular = cross(normalize(velocity), Vec3::unitY());
        if (perpendicular.lengthSquared() < 0.1f)
        {
            perpendicular = Vec3::unitX();
        }

        TacticalOrderData data;
        data.order = TacticalOrder::PincerMovement;
        data.wingA = predicted + perpendicular * kPincerDistance;
        data.wingB = predicted - perpendicular * kPincerDistance;
        data.hasWings = true;
        return data;
    }

    [[nodiscard]] static float estimateDps(ShipType type) noexcept
    {
        switch (type)
        {
        case ShipType::Scout:       return 15.0f;
        case ShipType::Fighter:     return 25.0f;
        case ShipType::Bomber:      return 40.0f;
        case ShipType::Interceptor: return 20.0f;
        }
        return 20.0f;
    }

    [[nodiscard]] static float averageHealth(const Group& group)
    {
        if (group.empty())
        {
            return 0.0f;
        }
        float sum = 0.0f;
        for (const AIEnemyShip* ship : group)
        {
            sum += ship->healthRatio();
        }
        return sum / static_cast<float>(group.size());
    }

    /// @brief 1 at zero spread, falling to 0 at kIntegrityRange mean distance
    ///        from the centroid.
    [[nodiscard]] static float formationIntegrity(const Group& group)
    {
        if (group.size() < 2)
        {
            return 1.0f;
        }
        Vec3 centroid;
        for (const AIEnemyShip* ship : group)
        {
            centroid += ship->position();
        }
        centroid = centroid / static_cast<float>(group.size());
        return std::max(0.0f, 1.0f - averageDistance(group, centroid) / kIntegrityRange);
    }

    [[nodiscard]] static float coordinationLevel(const Group& group, const FormationRegistry& formations)
    {
        float teamwork = 0.0f;
        bool anyInFormation = false;
        for (const AIEnemyShip* ship : group)
        {
            teamwork += ship->teamwork();
            anyInFormation = anyInFormation || formations.isMember(ship->id());
        }
        teamwork /= static_cast<float>(std::max<std::size_t>(1, group.size()));
        return std::min(1.0f, teamwork + (anyInFormation ? 0.2f : 0.0f));
    }

    /// @brief 1 at kOptimalSpacing mean pair distance; never negative.
    [[nodiscard]] static float formationSpacing(const Group& group)
    {
        if (group.size() < 2)
        {
            return 1.0f;
        }
        float total = 0.0f;
        int pairs = 0;
        for (std::size_t i = 0; i < group.size(); ++i)
        {
            for (std::size_t j = i + 1; j < group.size(); ++j)
            {
                total += group[i]->distanceTo(group[j]->position());
                ++pairs;
            }
        }
        const float mean = total / static_cast<float>(pairs);
        return std::max(0.0f, 1.0f - std::fabs(mean - kOptimalSpacing) / kOptimalSpacing);
    }

    /// @brief 1 - (widest bearing gap around target) / 2pi, on the XZ plane.
    [[nodiscard]] static float encirclementPotential(const Group& group, const Vec3& target)
    {
        constexpr float kTwoPi = 2.0f * 3.14159265358979323846f;
        if (group.size() < 3)
        {
            return 0.0f;
        }
        std::vector<float> angles;
        angles.reserve(group.size());
        for (const AIEnemyShip* ship : group)
        {
            const Vec3 d = ship->position() - target;
            angles.push_back(std::atan2(d.z, d.x));
        }
        std::sort(angles.begin(), angles.end());

        float maxGap = 0.0f;
        for (std::size_t i = 0; i < angles.size(); ++i)
        {
            float gap = angles[(i + 1) % angles.size()] - angles[i];
            if (gap <= 0.0f)
            {
                gap += kTwoPi;
            }
            maxGap = std::max(maxGap, gap);
        }
        return 1.0f - maxGap / kTwoPi;
    }

    /// @brief Formation groups (leader first) in registry order, then the
    ///        unassigned ships keyed by NullFormation.
    [[nodiscard]] static std::vector<std::pair<FormationId, Group>> buildGroups(
        const std::vector<AIEnemyShip*>& agents, const FormationRegistry& formations)
    {
        std::vector<std::pair<FormationId, Group>> groups;
        for (FormationId id : formations.ids())
        {
            const FormationController* f = formations.find(id);
            if (f == nullptr)
            {
                continue;
            }
            Group group;
            for (AgentId member : f->members())
            {
                for (AIEnemyShip* ship : agents)
                {
                    if (ship->id() == member && !ship->isDestroyed())
                    {
                        group.push_back(ship);
                        break;
                    }
                }
            }
            if (!group.empty())
            {
                groups.emplace_back(id, std::move(group));
            }
        }

        Group unassigned;
        for (AIEnemyShip* ship : agents)
        {
            if (!ship->isDestroyed() && !formations.isMember(ship->id()))
            {
                unassigned.push_back(ship);
            }
        }
        if (!unassigned.empty())
        {
            groups.emplace_back(NullFormation, std::move(unassigned));
        }
        return groups;
    }

    /// @brief The most recently sighted target among the group's members.
    [[nodiscard]] static std::optional<Contact> groupTarget(const Group& group)
    {
        const AIEnemyShip* freshest = nullptr;
        for (const AIEnemyShip* ship : group)
        {
            if (ship->hasTarget()
                && (freshest == nullptr || ship->lastPlayerSightingTime() < freshest->lastPlayerSightingTime()))
            {
                freshest = ship;
            }
        }
        return freshest != nullptr ? freshest->target() : std::nullopt;
    }

private:
    struct Pending
    {
        uint64_t serial = 0;
        std::size_t groupSize = 0;
        float healthAverage = 1.0f;
    };

    template <typename Pred>
    [[nodiscard]] static std::size_t countIf(const Group& group, Pred pred)
    {
        return static_cast<std::size_t>(std::count_if(group.begin(), group.end(),
            [&pred](const AIEnemyShip* s) { return pred(s->shipType()); }));
    }

    [[nodiscard]] static float averageDistance(const Group& group, const Vec3& point)
    {
        if (group.empty())
        {
            return 0.0f;
        }
        float sum = 0.0f;
        for (const AIEnemyShip* ship : group)
        {
            sum += ship->distanceTo(point);
        }
        return sum / static_cast<float>(group.size());
    }

    void resolvePending(FormationId key, const TacticalSituation& now)
    {
        const Pending* pending = mPending.find(key);
        if (pending == nullptr)
        {
            return;
        }
        const bool success = now.allyCount >= pending->groupSize
                          && now.allyHealthAverage >= pending->healthAverage - kSuccessHealthDrop;
        (void)mMemory.resolve(pending->serial, success);
        mPending.erase(key);
    }

    /// @brief Carries the tactic out on the commander and broadcasts it.
    void command(AIEnemyShip& commander,
                 FormationId formation,
                 TacticalOrder tactic,
                 const Contact& target,
                 FormationRegistry& formations)
    {
        TacticalOrderData order;
        if (tactic == TacticalOrder::FlankingManeuver)
        {
            order = flankPositions(target.position);
        }
        else if (tactic == TacticalOrder::PincerMovement)
        {
            order = pincerPositions(target.position, target.velocity);
        }
        order.order = tactic;

        commander.executeTacticalOrder(order, target.position);
        (void)commander.communication().broadcastMessage(
            makeMessage(MessageType::TacticalOrder, commander.id(), target.position, order));

        if (formation == NullFormation || formations.find(formation) == nullptr)
        {
            return;
        }
        const std::optional<TacticalOrder> previous = lastTactic(formation);
        if (previous == tactic)
        {
            return;
        }
        mFormationTactics.insert_or_assign(formation, tactic);

        FormationOrderData formationOrder;
        switch (tactic)
        {
        case TacticalOrder::FlankingManeuver:
        case TacticalOrder::PincerMovement:
            formationOrder.order = FormationOrderType::SpreadOut;
            formationOrder.spacingMultiplier = kFlankSpread;
            break;
        case TacticalOrder::DefensiveFormation:
            formationOrder.order = FormationOrderType::ChangeFormation;
            formationOrder.formationType = FormationType::Sphere;
            break;
        default:
            return;
        }

        AIMessage msg = makeMessage(MessageType::FormationOrder, commander.id(), commander.position(), formationOrder);
        if (commander.communication().broadcastMessage(msg))
        {
            msg.sequence = commander.communication().lastSequence();
            commander.handleMessage(msg);
        }
    }

    TacticalMemory mMemory;
    fat_p::FastHashMap<FormationId, Pending> mPending;
    fat_p::FastHashMap<FormationId, TacticalOrder> mFormationTactics;
};

} // namespace fatp_fleet
