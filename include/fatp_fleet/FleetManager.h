#pragma once

/**
 * @file FleetManager.h
 * @brief Top-level coordinator: owns the agents and drives one fleet tick.
 */

// FAT-P components used:
// - Signal: Agent spawned / removed, forwarded attack intents
// - ScopedConnection: Per-agent attack intent forwarding, formation teardown
//
// Tick order:
//   1. clock, difficulty controller
//   2. each agent: update, neighbor refresh, targeting, world bounds
//   3. swarm steering, on the swarm cadence
//   4. tactical evaluation, on the tactical cadence while a player is known
//   5. formations: geometry every tick; on the formation cadence, empty
//      formation removal, clustering of unassigned ships, emergent swarm
//      behaviors, status broadcasts
//   6. gameplay event feed
//   7. wave spawning
//   8. removal of destroyed agents
//
// Agents are owned here and registered with the hub for their whole life.
// Removal order is fixed: leave formation, unregister from the hub, then free,
// so no message or formation ever resolves a dangling agent.
//
// Every random choice (spawn ring, wave mix, patrol routes) draws from the
// services' seeded engine, so a run with a fixed rngSeed replays exactly.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fat_p/Signal.h>

#include "AIEnemyShip.h"
#include "DifficultyScaling.h"
#include "FleetConfig.h"
#include "FleetServices.h"
#include "FormationController.h"
#include "GameEvents.h"
#include "Log.h"
#include "Message.h"
#include "Ships.h"
#include "SwarmBehavior.h"
#include "TacticalAI.h"
#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

/**
 * @brief Owns every agent and runs the fleet update.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class FleetManager
{
public:
    static constexpr float kSpawnRingMin = 200.0f;
    static constexpr float kSpawnRingWidth = 100.0f;
    static constexpr float kSpawnVerticalSpread = 100.0f;
    static constexpr float kSpawnGridSpacing = 20.0f;
    static constexpr int kSpawnGridColumns = 3;
    static constexpr std::size_t kWaveFormationMin = 3;
    static constexpr float kClusterRadius = 80.0f;
    static constexpr std::size_t kClusterFormationMin = 3;
    static constexpr float kBoundsPushFactor = 0.1f;
    static constexpr float kBoundsTeleportFactor = 1.5f;
    static constexpr float kBoundsReentryFactor = 0.8f;
    static constexpr float kSightingReportInterval = 1.0f;

    explicit FleetManager(const FleetConfig& config = FleetConfig{})
        : mConfig(config)
        , mServices(config.rngSeed)
        , mSpawnInterval(config.spawnInterval)
    {
        mConfig.validate();
        defaultLogger().setLevel(mConfig.logLevel);

        mServices.hub().setCommunicationRange(mConfig.communicationRange);
        mServices.world().radius = mConfig.worldRadius;
        mFormationDestroyedConnection = mServices.formations().onFormationDestroyed.connect(
            [this](FormationController& formation) { mTactical.forgetFormation(formation.id()); });
        mDifficulty.setEvaluationInterval(mConfig.evaluationInterval);
        mDifficulty.setAdaptationRate(mConfig.adaptationRate);
        if (mConfig.initialDifficulty != DifficultyLevel::Medium)
        {
            mDifficulty.setDifficulty(mConfig.initialDifficulty);
        }
    }

    FleetManager(const FleetManager&) = delete;
    FleetManager& operator=(const FleetManager&) = delete;

    ~FleetManager() { clearAll(); }

    // =========================================================================
    // Signals
    // =========================================================================

    fat_p::Signal<void(AIEnemyShip&)> onAgentSpawned;

    /// @brief Fired after the agent has left the hub, before it is freed.
    fat_p::Signal<void(AgentId)> onAgentRemoved;

    /// @brief Every agent's attack intents, for the weapons layer.
    fat_p::Signal<void(const AttackIntent&)> onAttackIntent;

    // =========================================================================
    // World input
    // =========================================================================

    /// @brief Updates the player contact agents target. Called once per tick.
    void setPlayer(const Contact& player) { mPlayer = player; }
    void clearPlayer() noexcept { mPlayer.reset(); }
    [[nodiscard]] const std::optional<Contact>& player() const noexcept { return mPlayer; }

    void setWorld(const Vec3& center, float radius)
    {
        if (!(radius > 0.0f))
        {
            throw std::invalid_argument("FleetManager: world radius must be > 0");
        }
        mServices.world().center = center;
        mServices.world().radius = radius;
        mConfig.worldRadius = radius;
    }

    [[nodiscard]] GameEventFeed& events() noexcept { return mEvents; }

    // =========================================================================
    // Tick
    // =========================================================================

    void update(float dt)
    {
        mServices.clock().advance(dt);

        (void)mDifficulty.update(dt, agents(), mServices.formations());

        for (Entry& entry : mAgents)
        {
            AIEnemyShip& ship = *entry.ship;
            if (ship.isDestroyed())
            {
                continue;
            }
            ship.update(dt);
            ship.updateNearbyAllies(mConfig.neighborRadius);
            updateTargeting(entry, dt);
            constrainToWorld(ship);
        }

        updateSwarm(dt);
        updateTactics(dt);
        updateFormations(dt);
        processEvents();
        updateSpawning(dt);
        removeDestroyed();
    }

    // =========================================================================
    // Spawning
    // =========================================================================

    /// @brief Creates, registers, and scales one agent.
    AIEnemyShip& spawnAgent(ShipType type, const Vec3& position)
    {
        const AgentId id(mNextAgentId++);
        std::unique_ptr<AIEnemyShip> ship = makeShip(type, id, mServices.context(), position);
        AIEnemyShip& ref = *ship;

        ref.communication().setProcessingInterval(mConfig.messageProcessingInterval);
        mDifficulty.applyTo(ref);
        mServices.hub().registerAgent(ref);

        Entry entry;
        entry.ship = std::move(ship);
        entry.attackConnection = ref.onAttackIntent.connect(
            [this](const AttackIntent& intent)
            {
                if (onAttackIntent.slotCount() > 0)
                {
                    onAttackIntent.emit(intent);
                }
            });
        mAgents.push_back(std::move(entry));

        FATP_FLEET_LOG_DEBUG("spawned %.*s %u",
                             static_cast<int>(toString(type).size()),
                             toString(type).data(),
                             id.get());
        onAgentSpawned.emit(ref);
        return ref;
    }

    /**
     * @brief Spawns one wave on the spawn ring, sized and mixed for the
     *        current tier. Waves of three or more get a formation.
     *
     * @return Number of agents spawned.
     */
    std::size_t spawnWave()
    {
        const int room = static_cast<int>(maxEnemies()) - static_cast<int>(agentCount());
        const int size = std::min(waveSize(mDifficulty.level()), room);
        if (size <= 0)
        {
            return 0;
        }

        const Vec3 center = spawnPosition();
        std::vector<AIEnemyShip*> wave;
        for (int i = 0; i < size; ++i)
        {
            wave.push_back(&spawnAgent(chooseShipType(), center + spawnOffset(i)));
        }

        if (wave.size() >= kWaveFormationMin)
        {
            (void)createFormation(wave, chooseFormationType(wave.size(), mDifficulty.level()));
        }

        FATP_FLEET_LOG_INFO("wave of %d spawned at (%.0f, %.0f, %.0f)",
                            size,
                            static_cast<double>(center.x),
                            static_cast<double>(center.y),
                            static_cast<double>(center.z));
        return wave.size();
    }

    /// @brief min(tier cap, the tier bundle's enemy limit).
    [[nodiscard]] std::size_t maxEnemies() const noexcept
    {
        const int bundle = mDifficulty.settings().maxSimultaneousEnemies;
        return static_cast<std::size_t>(std::max(0, std::min(tierCap(mDifficulty.level()), bundle)));
    }

    [[nodiscard]] static int tierCap(DifficultyLevel level) noexcept
    {
        switch (level)
        {
        case DifficultyLevel::VeryEasy: return 3;
        case DifficultyLevel::Easy:     return 4;
        case DifficultyLevel::Medium:   return 6;
        case DifficultyLevel::Hard:     return 8;
        case DifficultyLevel::VeryHard: return 10;
        }
        return 6;
    }

    [[nodiscard]] static int waveSize(DifficultyLevel level) noexcept
    {
        return static_cast<int>(level) + 1;
    }

    [[nodiscard]] static float spawnIntervalMultiplier(DifficultyLevel level) noexcept
    {
        switch (level)
        {
        case DifficultyLevel::VeryEasy: return 1.5f;
        case DifficultyLevel::Easy:     return 1.2f;
        case DifficultyLevel::Medium:   return 1.0f;
        case DifficultyLevel::Hard:     return 0.8f;
        case DifficultyLevel::VeryHard: return 0.6f;
        }
        return 1.0f;
    }

    [[nodiscard]] static FormationType chooseFormationType(std::size_t count, DifficultyLevel level) noexcept
    {
        if (count == 2)
        {
            return FormationType::Line;
        }
        if (count == 3)
        {
            return FormationType::VFormation;
        }
        if (count == 4)
        {
            return FormationType::Diamond;
        }
        if (count >= 5)
        {
            switch (level)
            {
            case DifficultyLevel::VeryEasy: return FormationType::Line;
            case DifficultyLevel::Easy:     return FormationType::Box;
            case DifficultyLevel::Medium:   return FormationType::Diamond;
            case DifficultyLevel::Hard:     return FormationType::Sphere;
            case DifficultyLevel::VeryHard: return FormationType::Helix;
            }
        }
        return FormationType::VFormation;
    }

    [[nodiscard]] float spawnInterval() const noexcept { return mSpawnInterval; }

    /// @throws std::invalid_argument if seconds is not positive.
    void setSpawnInterval(float seconds)
    {
        if (!(seconds > 0.0f))
        {
            throw std::invalid_argument("FleetManager: spawn interval must be > 0");
        }
        mSpawnInterval = seconds;
    }

    void setSpawningEnabled(bool enabled) noexcept { mSpawning = enabled; }
    [[nodiscard]] bool spawningEnabled() const noexcept { return mSpawning; }

    // =========================================================================
    // Formations
    // =========================================================================

    /**
     * @brief Pulls ships out of their formations into a new one.
     *
     * @return The new formation, or nullptr with fewer than two live ships.
     */
    FormationController* forceFormation(const std::vector<AgentId>& ids, FormationType type)
    {
        std::vector<AIEnemyShip*> ships;
        for (AgentId id : ids)
        {
            AIEnemyShip* ship = find(id);
            if (ship != nullptr && !ship->isDestroyed())
            {
                ships.push_back(ship);
            }
        }
        if (ships.size() < 2)
        {
            return nullptr;
        }
        for (AIEnemyShip* ship : ships)
        {
            (void)mServices.formations().leave(ship->id());
            ship->formationMember().reset();
        }
        return &createFormation(ships, type);
    }

    [[nodiscard]] FormationController* largestFormation() const
    {
        return mServices.formations().largest();
    }

    // =========================================================================
    // Difficulty
    // =========================================================================

    void setDifficulty(DifficultyLevel level)
    {
        mDifficulty.setDifficulty(level, agents(), mServices.formations());
    }

    [[nodiscard]] DifficultyScaling& difficulty() noexcept { return mDifficulty; }
    [[nodiscard]] const DifficultyScaling& difficulty() const noexcept { return mDifficulty; }

    // =========================================================================
    // Group behavior
    // =========================================================================

    [[nodiscard]] SwarmBehavior& swarm() noexcept { return mSwarm; }
    [[nodiscard]] TacticalAI& tactical() noexcept { return mTactical; }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] AIEnemyShip* find(AgentId id) const { return mServices.hub().find(id); }

    /// @throws std::out_of_range if id is not a live agent.
    [[nodiscard]] AIEnemyShip& agent(AgentId id) const
    {
        AIEnemyShip* ship = find(id);
        if (ship == nullptr)
        {
            throw std::out_of_range("FleetManager: no agent with id " + std::to_string(id.get()));
        }
        return *ship;
    }

    /// @brief Owned agents in spawn order.
    [[nodiscard]] std::vector<AIEnemyShip*> agents() const
    {
        std::vector<AIEnemyShip*> result;
        result.reserve(mAgents.size());
        for (const Entry& entry : mAgents)
        {
            result.push_back(entry.ship.get());
        }
        return result;
    }

    [[nodiscard]] std::size_t agentCount() const noexcept { return mAgents.size(); }

    [[nodiscard]] std::vector<AIEnemyShip*> agentsInRadius(const Vec3& center, float radius) const
    {
        std::vector<AIEnemyShip*> result;
        for (const Entry& entry : mAgents)
        {
            if (distance(entry.ship->position(), center) <= radius)
            {
                result.push_back(entry.ship.get());
            }
        }
        return result;
    }

    /// @brief Removes every agent and formation.
    void clearAll()
    {
        while (!mAgents.empty())
        {
            removeAgentAt(mAgents.size() - 1);
        }
        mServices.formations().clear();
    }

    [[nodiscard]] FleetServices& services() noexcept { return mServices; }
    [[nodiscard]] const FleetConfig& config() const noexcept { return mConfig; }

private:
    struct Entry
    {
        std::unique_ptr<AIEnemyShip> ship;
        fat_p::ScopedConnection attackConnection;
        float sinceSightingReport = kSightingReportInterval;
    };

    [[nodiscard]] static std::unique_ptr<AIEnemyShip> makeShip(ShipType type,
                                                               AgentId id,
                                                               FleetContext& context,
                                                               const Vec3& position)
    {
        switch (type)
        {
        case ShipType::Scout:       return std::make_unique<ScoutShip>(id, context, position);
        case ShipType::Fighter:     return std::make_unique<FighterShip>(id, context, position);
        case ShipType::Bomber:      return std::make_unique<BomberShip>(id, context, position);
        case ShipType::Interceptor: return std::make_unique<InterceptorShip>(id, context, position);
        }
        return std::make_unique<FighterShip>(id, context, position);
    }

    // =========================================================================
    // Per-agent steps
    // =========================================================================

    void updateTargeting(Entry& entry, float dt)
    {
        AIEnemyShip& ship = *entry.ship;
        entry.sinceSightingReport += dt;

        if (mPlayer && ship.canSee(mPlayer->position))
        {
            ship.setTarget(*mPlayer);

            if (entry.sinceSightingReport >= kSightingReportInterval)
            {
                ContactReport report;
                report.velocity = mPlayer->velocity;
                report.health = mPlayer->health;
                (void)ship.communication().broadcastMessage(
                    makeMessage(MessageType::TargetSighted, ship.id(), mPlayer->position, report));
                entry.sinceSightingReport = 0.0f;
            }
        }
        else if (ship.hasTarget() && ship.lastPlayerSightingTime() > mConfig.targetLossTimeout)
        {
            ship.clearTarget();
        }
    }

    void constrainToWorld(AIEnemyShip& ship)
    {
        const Vec3 center = mServices.world().center;
        const float radius = mServices.world().radius;
        const float d = distance(ship.position(), center);
        if (d <= radius)
        {
            return;
        }

        const Vec3 inward = normalize(center - ship.position());
        ship.setVelocity(ship.velocity() + inward * ((d - radius) * kBoundsPushFactor));

        if (d > radius * kBoundsTeleportFactor)
        {
            ship.setPosition(center - inward * (radius * kBoundsReentryFactor));
        }
    }

    // =========================================================================
    // Fleet steps
    // =========================================================================

    void updateSwarm(float dt)
    {
        mSinceSwarm += dt;
        if (mSinceSwarm < mConfig.swarmUpdateInterval)
        {
            return;
        }
        mSwarm.update(agents(), mSinceSwarm);
        mSinceSwarm = 0.0f;
    }

    void updateTactics(float dt)
    {
        mSinceTactical += dt;
        if (mSinceTactical < mConfig.tacticalUpdateInterval || !mPlayer)
        {
            return;
        }
        mSinceTactical = 0.0f;

        for (const TacticalDecision& decision : mTactical.update(agents(), mServices.formations()))
        {
            // Unassigned ships holding together need a formation to hold.
            if (decision.formation == NullFormation
                && decision.tactic == TacticalOrder::DefensiveFormation
                && decision.members.size() >= 2)
            {
                (void)forceFormation(decision.members, FormationType::Sphere);
            }
        }
    }

    void updateFormations(float dt)
    {
        FormationRegistry& registry = mServices.formations();
        for (FormationId id : registry.ids())
        {
            if (FormationController* formation = registry.find(id))
            {
                formation->update(dt);
            }
        }

        mSinceFormationPass += dt;
        if (mSinceFormationPass < mConfig.formationUpdateInterval)
        {
            return;
        }
        mSinceFormationPass = 0.0f;

        (void)registry.removeEmpty();
        clusterUnassigned();
        mSwarm.updateEmergent(agents(), registry);

        for (Entry& entry : mAgents)
        {
            if (!entry.ship->isDestroyed())
            {
                (void)entry.ship->broadcastStatus();
            }
        }
    }

    void clusterUnassigned()
    {
        std::vector<AIEnemyShip*> unassigned;
        for (Entry& entry : mAgents)
        {
            AIEnemyShip* ship = entry.ship.get();
            if (!ship->isDestroyed() && !mServices.formations().isMember(ship->id()))
            {
                unassigned.push_back(ship);
            }
        }
        if (unassigned.size() < kClusterFormationMin)
        {
            return;
        }

        std::vector<bool> taken(unassigned.size(), false);
        for (std::size_t i = 0; i < unassigned.size(); ++i)
        {
            if (taken[i])
            {
                continue;
            }
            taken[i] = true;
            std::vector<AIEnemyShip*> cluster{unassigned[i]};
            for (std::size_t j = i + 1; j < unassigned.size(); ++j)
            {
                if (!taken[j] && unassigned[i]->distanceTo(unassigned[j]->position()) <= kClusterRadius)
                {
                    taken[j] = true;
                    cluster.push_back(unassigned[j]);
                }
            }
            if (cluster.size() >= kClusterFormationMin)
            {
                (void)createFormation(cluster, chooseFormationType(cluster.size(), mDifficulty.level()));
            }
        }
    }

    FormationController& createFormation(const std::vector<AIEnemyShip*>& ships, FormationType type)
    {
        Vec3 center;
        for (const AIEnemyShip* ship : ships)
        {
            center += ship->position();
        }
        center = center / static_cast<float>(ships.size());

        FormationRegistry& registry = mServices.formations();
        FormationController& formation = registry.create(type, center);
        for (const AIEnemyShip* ship : ships)
        {
            (void)registry.join(formation.id(), *ship);
        }
        mDifficulty.applyToFormation(formation);
        return formation;
    }

    void processEvents()
    {
        (void)mEvents.drain(
            [this](const GameEvent& event)
            {
                switch (event.kind)
                {
                case GameEventKind::DamageTaken:
                    if (AIEnemyShip* ship = find(event.agent))
                    {
                        ship->takeDamage(event.amount, event.source);
                    }
                    break;
                case GameEventKind::AllyDestroyed:
                    if (AIEnemyShip* ship = find(event.agent))
                    {
                        ship->destroy();
                    }
                    break;
                case GameEventKind::PlayerDeath:
                    mDifficulty.tracker().recordDeath(event.amount);
                    break;
                case GameEventKind::PlayerKill:
                    mDifficulty.tracker().recordKill();
                    break;
                case GameEventKind::PlayerShot:
                    mDifficulty.tracker().recordShot(event.hit);
                    break;
                }
            });
    }

    void updateSpawning(float dt)
    {
        if (!mSpawning)
        {
            return;
        }
        mSinceSpawn += dt;
        if (mSinceSpawn < mSpawnInterval || agentCount() >= maxEnemies())
        {
            return;
        }
        (void)spawnWave();
        mSinceSpawn = 0.0f;
        mSpawnInterval = mConfig.spawnInterval * spawnIntervalMultiplier(mDifficulty.level());
    }

    void removeDestroyed()
    {
        for (std::size_t i = mAgents.size(); i-- > 0;)
        {
            if (mAgents[i].ship->isDestroyed())
            {
                removeAgentAt(i);
            }
        }
    }

    void removeAgentAt(std::size_t index)
    {
        const AgentId id = mAgents[index].ship->id();
        (void)mServices.formations().leave(id);
        (void)mServices.hub().unregisterAgent(id);
        (void)mServices.allies().remove(id);
        onAgentRemoved.emit(id);
        mAgents.erase(mAgents.begin() + static_cast<std::ptrdiff_t>(index));
    }

    // =========================================================================
    // Spawn helpers
    // =========================================================================

    [[nodiscard]] Vec3 spawnPosition()
    {
        constexpr float kTwoPi = 2.0f * 3.14159265358979323846f;
        FleetContext& ctx = mServices.context();
        const float angle = ctx.randomRange(0.0f, kTwoPi);
        const float range = kSpawnRingMin + ctx.randomRange(0.0f, kSpawnRingWidth);
        return mServices.world().center + Vec3(std::cos(angle) * range,
                                   ctx.randomRange(-0.5f, 0.5f) * kSpawnVerticalSpread,
                                   std::sin(angle) * range);
    }

    [[nodiscard]] static Vec3 spawnOffset(int index) noexcept
    {
        const int row = index / kSpawnGridColumns;
        const int col = index % kSpawnGridColumns;
        return Vec3(static_cast<float>(col - 1) * kSpawnGridSpacing,
                    0.0f,
                    static_cast<float>(row) * kSpawnGridSpacing);
    }

    [[nodiscard]] ShipType chooseShipType()
    {
        struct Weight
        {
            ShipType type;
            float weight;
        };

        std::vector<Weight> mix;
        switch (mDifficulty.level())
        {
        case DifficultyLevel::VeryEasy:
            mix = {{ShipType::Scout, 0.6f}, {ShipType::Fighter, 0.4f}};
            break;
        case DifficultyLevel::Easy:
            mix = {{ShipType::Scout, 0.4f}, {ShipType::Fighter, 0.6f}};
            break;
        case DifficultyLevel::Medium:
            mix = {{ShipType::Scout, 0.3f}, {ShipType::Fighter, 0.5f}, {ShipType::Interceptor, 0.2f}};
            break;
        case DifficultyLevel::Hard:
            mix = {{ShipType::Scout, 0.2f},
                   {ShipType::Fighter, 0.4f},
                   {ShipType::Interceptor, 0.2f},
                   {ShipType::Bomber, 0.2f}};
            break;
        case DifficultyLevel::VeryHard:
            mix = {{ShipType::Scout, 0.1f},
                   {ShipType::Fighter, 0.3f},
                   {ShipType::Interceptor, 0.3f},
                   {ShipType::Bomber, 0.3f}};
            break;
        }

        float total = 0.0f;
        for (const Weight& w : mix)
        {
            total += w.weight;
        }
        const float roll = mServices.context().randomRange(0.0f, total);
        float running = 0.0f;
        for (const Weight& w : mix)
        {
            running += w.weight;
            if (roll <= running)
            {
                return w.type;
            }
        }
        return mix.front().type;
    }

    FleetConfig mConfig;
    FleetServices mServices;
    DifficultyScaling mDifficulty;
    GameEventFeed mEvents;
    SwarmBehavior mSwarm;
    TacticalAI mTactical;
    fat_p::ScopedConnection mFormationDestroyedConnection;

    std::vector<Entry> mAgents;
    uint32_t mNextAgentId = 1;

    std::optional<Contact> mPlayer;

    float mSpawnInterval;
    float mSinceSpawn = 0.0f;
    float mSinceFormationPass = 0.0f;
    float mSinceSwarm = 0.0f;
    float mSinceTactical = 0.0f;
    bool mSpawning = true;
};

} // namespace fatp_fleet
