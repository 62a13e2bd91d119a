/**
 * @file main.cpp
 * @brief FAT-P Fleet Demo: adaptive enemy squadron versus a scripted player
 *
 * A fixed-length run (configurable frame count) that drives one FleetManager
 * against a simulated player. The player orbits the arena and fires at the
 * nearest ship; ships hunt it, talk over the hub, fly formations, and the
 * difficulty controller reacts to how well the player is doing.
 *
 * FAT-P components used directly here:
 *   - CircularBuffer     Rolling frame-time history
 *   - ScopedConnection   Attack-intent, removal, and tactic subscriptions
 *
 * Usage:
 *   fleet_demo [--frames N] [--report N] [--seed N] [--config file.json]
 */

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <fat_p/CircularBuffer.h>
#include <fat_p/Signal.h>

#include "fatp_fleet/FatpFleet.h"

using namespace fatp_fleet;

// =============================================================================
// Demo Configuration
// =============================================================================

struct DemoConfig
{
    int totalFrames = 3600;
    int reportInterval = 300;
    float dt = 1.0f / 60.0f;

    float orbitRadius = 150.0f;
    float orbitSpeed = 0.3f;      // rad/s
    float playerMaxHealth = 100.0f;
    float playerFireInterval = 0.25f;
    float playerRange = 140.0f;
    float playerHitChance = 0.6f;
    float playerDamage = 25.0f;
    float intentHitRadius = 15.0f;

    FleetConfig fleet;
};

struct DemoStats
{
    int frame = 0;
    int shotsFired = 0;
    int hits = 0;
    int kills = 0;
    int playerDeaths = 0;
    int intentsReceived = 0;
    std::array<int, kTacticalOrderCount> tactics{};
    std::size_t peakAgents = 0;
    double avgFrameTimeMs = 0.0;
    double peakFrameTimeMs = 0.0;
};

[[nodiscard]] static float intentDamage(AttackKind kind) noexcept
{
    switch (kind)
    {
    case AttackKind::Light:  return 5.0f;
    case AttackKind::Medium: return 8.0f;
    case AttackKind::Heavy:  return 20.0f;
    case AttackKind::Fast:   return 4.0f;
    }
    return 8.0f;
}

// =============================================================================
// FleetBattleDemo
// =============================================================================

class FleetBattleDemo
{
public:
    explicit FleetBattleDemo(const DemoConfig& config)
        : mConfig(config)
        , mFleet(config.fleet)
        , mRng(config.fleet.rngSeed ^ 0xA5A5u)
        , mPlayerHealth(config.playerMaxHealth)
    {
        mIntentConn = mFleet.onAttackIntent.connect(
            [this](const AttackIntent& intent) { onIntent(intent); });
        mRemovedConn = mFleet.onAgentRemoved.connect(
            [this](AgentId id) { onRemoved(id); });
        mDecisionConn = mFleet.tactical().onDecision.connect(
            [this](const TacticalDecision& d) { ++mStats.tactics[static_cast<std::size_t>(d.tactic)]; });
    }

    void run()
    {
        printHeader();

        for (mStats.frame = 1; mStats.frame <= mConfig.totalFrames; ++mStats.frame)
        {
            const auto start = std::chrono::steady_clock::now();

            stepPlayer();
            mFleet.update(mConfig.dt);

            const auto end = std::chrono::steady_clock::now();
            const double ms = std::chrono::duration<double, std::milli>(end - start).count();
            if (!mFrameTimes.push(ms))
            {
                double oldest = 0.0;
                (void)mFrameTimes.pop(oldest);
                (void)mFrameTimes.push(ms);
            }
            mStats.peakFrameTimeMs = std::max(mStats.peakFrameTimeMs, ms);
            mStats.peakAgents = std::max(mStats.peakAgents, mFleet.agentCount());

            if (mConfig.reportInterval > 0 && mStats.frame % mConfig.reportInterval == 0)
            {
                updateAvgFrameTime();
                printFrameReport();
            }
        }

        updateAvgFrameTime();
        printFinalReport();
    }

private:
    // =========================================================================
    // Player
    // =========================================================================

    void stepPlayer()
    {
        const float dt = mConfig.dt;
        mElapsed += dt;
        mAlive += dt;

        const float angle = mElapsed * mConfig.orbitSpeed;
        const Vec3 previous = mPlayerPosition;
        mPlayerPosition = Vec3(std::cos(angle) * mConfig.orbitRadius,
                               std::sin(angle * 0.5f) * 20.0f,
                               std::sin(angle) * mConfig.orbitRadius);

        Contact player;
        player.position = mPlayerPosition;
        player.velocity = (mPlayerPosition - previous) / dt;
        player.health = mPlayerHealth;
        mFleet.setPlayer(player);

        mSinceShot += dt;
        if (mSinceShot >= mConfig.playerFireInterval)
        {
            mSinceShot = 0.0f;
            fireAtNearest();
        }
    }

    void fireAtNearest()
    {
        AIEnemyShip* best = nullptr;
        float bestDistance = mConfig.playerRange;
        for (AIEnemyShip* ship : mFleet.agentsInRadius(mPlayerPosition, mConfig.playerRange))
        {
            const float d = ship->distanceTo(mPlayerPosition);
            if (!ship->isDestroyed() && d <= bestDistance)
            {
                best = ship;
                bestDistance = d;
            }
        }
        if (best == nullptr)
        {
            return;
        }

        std::uniform_real_distribution<float> roll(0.0f, 1.0f);
        const bool hit = roll(mRng) < mConfig.playerHitChance;
        ++mStats.shotsFired;
        mFleet.events().publish(GameEvent::playerShot(hit));
        if (hit)
        {
            ++mStats.hits;
            mFleet.events().publish(GameEvent::damageTaken(best->id(), mConfig.playerDamage, mPlayerPosition));
        }
    }

    void onIntent(const AttackIntent& intent)
    {
        ++mStats.intentsReceived;
        if (distance(intent.aimPoint, mPlayerPosition) > mConfig.intentHitRadius)
        {
            return;
        }

        mPlayerHealth -= intentDamage(intent.kind);
        if (mPlayerHealth <= 0.0f)
        {
            ++mStats.playerDeaths;
            mFleet.events().publish(GameEvent::playerDeath(mAlive));
            mPlayerHealth = mConfig.playerMaxHealth;
            mAlive = 0.0f;
        }
    }

    void onRemoved(AgentId /*id*/)
    {
        ++mStats.kills;
        mFleet.events().publish(GameEvent::playerKill());
    }

    // =========================================================================
    // Stats & Reporting
    // =========================================================================

    void updateAvgFrameTime()
    {
        std::vector<double> times;
        times.reserve(mFrameTimes.size());
        double val = 0.0;
        while (mFrameTimes.pop(val))
        {
            times.push_back(val);
        }

        double sum = 0.0;
        for (double t : times)
        {
            sum += t;
            (void)mFrameTimes.push(t);
        }
        if (!times.empty())
        {
            mStats.avgFrameTimeMs = sum / static_cast<double>(times.size());
        }
    }

    [[nodiscard]] std::size_t countInState(StateId id) const
    {
        std::size_t n = 0;
        for (const AIEnemyShip* ship : mFleet.agents())
        {
            if (ship->isInState(id))
            {
                ++n;
            }
        }
        return n;
    }

    void printHeader() const
    {
        const FleetConfig& fc = mConfig.fleet;
        std::printf("=== FAT-P Fleet Demo: Adaptive Squadron ===\n");
        std::printf("Frames: %d | dt: %.4f | Seed: %u | Start tier: %.*s | World radius: %.0f\n\n",
                    mConfig.totalFrames,
                    static_cast<double>(mConfig.dt),
                    fc.rngSeed,
                    static_cast<int>(toString(fc.initialDifficulty).size()),
                    toString(fc.initialDifficulty).data(),
                    static_cast<double>(fc.worldRadius));
    }

    void printFrameReport()
    {
        const DifficultyScaling& difficulty = mFleet.difficulty();
        const std::string_view tier = toString(difficulty.level());

        std::printf("[Frame %5d] ships: %-3zu formations: %-2zu patrol/attack/pursue/flee/support: "
                    "%zu/%zu/%zu/%zu/%zu tier: %-8.*s score: %.2f kills: %-4d deaths: %-3d hp: %5.1f "
                    "avg_ms: %.3f\n",
                    mStats.frame,
                    mFleet.agentCount(),
                    mFleet.services().formations().size(),
                    countInState(StateId::Patrol),
                    countInState(StateId::Attack),
                    countInState(StateId::Pursue),
                    countInState(StateId::Flee),
                    countInState(StateId::Support),
                    static_cast<int>(tier.size()),
                    tier.data(),
                    static_cast<double>(difficulty.score()),
                    mStats.kills,
                    mStats.playerDeaths,
                    static_cast<double>(mPlayerHealth),
                    mStats.avgFrameTimeMs);
    }

    void printFinalReport()
    {
        FleetServices& services = mFleet.services();
        const std::string_view tier = toString(mFleet.difficulty().level());
        const double accuracy = mStats.shotsFired > 0
                                    ? static_cast<double>(mStats.hits) / static_cast<double>(mStats.shotsFired)
                                    : 0.0;

        std::printf("\n=== Final Report ===\n");
        std::printf("Total frames:         %d\n", mConfig.totalFrames);
        std::printf("Simulated time:       %.1f s\n", services.clock().now());
        std::printf("Surviving ships:      %zu\n", mFleet.agentCount());
        std::printf("Peak ships:           %zu\n", mStats.peakAgents);
        std::printf("Formations:           %zu\n", services.formations().size());
        std::printf("Final tier:           %.*s (score %.2f)\n",
                    static_cast<int>(tier.size()),
                    tier.data(),
                    static_cast<double>(mFleet.difficulty().score()));
        std::printf("Player shots / hits:  %d / %d (%.0f%%)\n",
                    mStats.shotsFired, mStats.hits, accuracy * 100.0);
        std::printf("Player kills:         %d\n", mStats.kills);
        std::printf("Player deaths:        %d\n", mStats.playerDeaths);
        std::printf("Attack intents:       %d\n", mStats.intentsReceived);
        for (std::size_t i = 0; i < kTacticalOrderCount; ++i)
        {
            const std::string_view name = toString(static_cast<TacticalOrder>(i));
            std::printf("Tactic %-22.*s %d\n",
                        static_cast<int>(name.size()), name.data(), mStats.tactics[i]);
        }
        std::printf("Messages delivered:   %llu\n",
                    static_cast<unsigned long long>(services.hub().deliveredCount()));
        std::printf("Threat cells:         %zu\n", services.threats().size());
        std::printf("Intel clusters:       %zu\n", services.intel().clusters().size());
        std::printf("Events dropped:       %llu\n",
                    static_cast<unsigned long long>(mFleet.events().droppedCount()));
        std::printf("Avg frame time:       %.3f ms\n", mStats.avgFrameTimeMs);
        std::printf("Peak frame time:      %.3f ms\n", mStats.peakFrameTimeMs);
    }

    // =========================================================================
    // Data Members
    // =========================================================================

    DemoConfig mConfig;
    FleetManager mFleet;
    DemoStats mStats;
    std::mt19937 mRng;

    Vec3 mPlayerPosition;
    float mPlayerHealth;
    float mElapsed = 0.0f;
    float mAlive = 0.0f;
    float mSinceShot = 0.0f;

    // 512 entries = ~8.5 seconds at 60fps
    fat_p::CircularBuffer<double, 512> mFrameTimes;

    // Declared after mFleet so they disconnect before it is destroyed
    fat_p::ScopedConnection mIntentConn;
    fat_p::ScopedConnection mRemovedConn;
    fat_p::ScopedConnection mDecisionConn;
};

// =============================================================================
// Main
// =============================================================================

static bool readFile(const char* path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char* argv[])
{
    DemoConfig config;
    config.fleet.logLevel = LogLevel::Warn;
    bool seedOverride = false;
    uint32_t seed = 0;

    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc)
        {
            config.totalFrames = std::atoi(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--report") == 0 && i + 1 < argc)
        {
            config.reportInterval = std::atoi(argv[++i]);
        }
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc)
        {
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            seedOverride = true;
        }
        else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
        {
            const char* path = argv[++i];
            std::string json;
            if (!readFile(path, json))
            {
                std::fprintf(stderr, "cannot read config file '%s'\n", path);
                return 1;
            }
            try
            {
                config.fleet = loadFleetConfig(json);
            }
            catch (const std::exception& e)
            {
                std::fprintf(stderr, "%s\n", e.what());
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--help") == 0)
        {
            std::printf("Usage: fleet_demo [options]\n");
            std::printf("  --frames N       Total simulation frames (default: 3600)\n");
            std::printf("  --report N       Report every N frames (default: 300)\n");
            std::printf("  --seed N         Random seed (overrides the config file)\n");
            std::printf("  --config FILE    FleetConfig JSON file\n");
            return 0;
        }
    }

    if (seedOverride)
    {
        config.fleet.rngSeed = seed;
    }

    try
    {
        FleetBattleDemo demo(config);
        demo.run();
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    return 0;
}
