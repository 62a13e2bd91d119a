#pragma once

/**
 * @file DifficultyScaling.h
 * @brief Closed-loop difficulty controller driven by player telemetry.
 */

// FAT-P components used:
// - Signal: onDifficultyChanged(old, new)
//
// Every evaluation interval the controller samples the tracker, derives a
// target score from fixed telemetry thresholds, and moves the score a
// fraction (the adaptation rate) toward it. The score maps onto five tiers;
// each tier carries an AIEnhancementSettings bundle.
//
// Agents see the bundle as StatModifiers. Effective stats are always
// recomputed from each agent's baseline, so applying the same tier twice is
// a no-op and tiers never compound. The controller reapplies on a tier change
// and FleetManager applies it once when an agent is spawned.

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fat_p/Signal.h>

#include "AIEnemyShip.h"
#include "FormationController.h"
#include "FormationRegistry.h"
#include "Log.h"
#include "PlayerPerformanceTracker.h"
#include "Types.h"

namespace fatp_fleet
{

enum class FormationComplexity : uint8_t
{
    Simple,
    Medium,
    Complex,
    VeryComplex
};

/// @brief Per-tier multipliers and caps.
struct AIEnhancementSettings
{
    float speedMultiplier = 1.0f;
    float healthMultiplier = 1.0f;
    float accuracyMultiplier = 1.0f;
    float detectionRangeMultiplier = 1.0f;
    float aggressionMultiplier = 1.0f;
    float teamworkMultiplier = 1.0f;
    float reactionTimeMultiplier = 1.0f;
    FormationComplexity formationComplexity = FormationComplexity::Medium;
    int maxSimultaneousEnemies = 4;

    [[nodiscard]] StatModifiers modifiers() const noexcept
    {
        StatModifiers m;
        m.speed = speedMultiplier;
        m.health = healthMultiplier;
        m.accuracy = accuracyMultiplier;
        m.detection = detectionRangeMultiplier;
        m.aggression = aggressionMultiplier;
        m.teamwork = teamworkMultiplier;
        m.reaction = reactionTimeMultiplier;
        return m;
    }

    /// @brief The fixed bundle for a tier.
    [[nodiscard]] static AIEnhancementSettings forLevel(DifficultyLevel level) noexcept
    {
        switch (level)
        {
        case DifficultyLevel::VeryEasy:
            return {0.7f, 0.6f, 0.5f, 0.8f, 0.6f, 0.5f, 1.5f, FormationComplexity::Simple, 2};
        case DifficultyLevel::Easy:
            return {0.8f, 0.8f, 0.7f, 0.9f, 0.8f, 0.7f, 1.3f, FormationComplexity::Simple, 3};
        case DifficultyLevel::Medium:
            return {};
        case DifficultyLevel::Hard:
            return {1.2f, 1.3f, 1.3f, 1.2f, 1.2f, 1.3f, 0.8f, FormationComplexity::Complex, 6};
        case DifficultyLevel::VeryHard:
            return {1.4f, 1.5f, 1.5f, 1.4f, 1.4f, 1.5f, 0.6f, FormationComplexity::VeryComplex, 8};
        }
        return {};
    }
};

/**
 * @brief Adaptive difficulty controller.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class DifficultyScaling
{
public:
    static constexpr float kDefaultAdaptationRate = 0.1f;
    static constexpr float kDefaultEvaluationInterval = 10.0f;

    DifficultyScaling() = default;
    DifficultyScaling(const DifficultyScaling&) = delete;
    DifficultyScaling& operator=(const DifficultyScaling&) = delete;

    /// @brief (old tier, new tier)
    fat_p::Signal<void(DifficultyLevel, DifficultyLevel)> onDifficultyChanged;

    // =========================================================================
    // Control loop
    // =========================================================================

    /**
     * @brief Advances telemetry; evaluates once per interval. A tier change
     *        reapplies the new bundle to ships and formations.
     *
     * @return true if the tier changed this call.
     */
    bool update(float dt, const std::vector<AIEnemyShip*>& ships, FormationRegistry& formations)
    {
        mTracker.update(dt);
        mSinceEvaluation += dt;
        if (mSinceEvaluation < mEvaluationInterval)
        {
            return false;
        }
        mSinceEvaluation = 0.0f;

        if (!evaluate())
        {
            return false;
        }
        applyToAll(ships, formations);
        return true;
    }

    /**
     * @brief One controller step from the tracker's current snapshot.
     *
     * @return true if the tier changed.
     */
    bool evaluate()
    {
        const float target = computeTargetDifficulty(mTracker.currentPerformance());
        mScore = std::clamp(mScore + (target - mScore) * mAdaptationRate, 0.0f, 1.0f);

        const DifficultyLevel next = levelForScore(mScore);
        if (next == mLevel)
        {
            return false;
        }
        const DifficultyLevel old = mLevel;
        mLevel = next;
        mSettings = AIEnhancementSettings::forLevel(next);

        FATP_FLEET_LOG_INFO("difficulty %.*s -> %.*s (score %.3f)",
                            static_cast<int>(toString(old).size()), toString(old).data(),
                            static_cast<int>(toString(next).size()), toString(next).data(),
                            static_cast<double>(mScore));
        onDifficultyChanged.emit(old, next);
        return true;
    }

    /// @brief Target score for a snapshot, in [0, 1].
    [[nodiscard]] static float computeTargetDifficulty(const PlayerPerformance& p) noexcept
    {
        float target = 0.5f;

        if (p.averageSurvivalTime > 120.0f)
        {
            target += 0.2f;
        }
        else if (p.averageSurvivalTime < 30.0f)
        {
            target -= 0.3f;
        }

        if (p.killDeathRatio > 2.0f)
        {
            target += 0.3f;
        }
        else if (p.killDeathRatio < 0.5f)
        {
            target -= 0.2f;
        }

        if (p.accuracy > 0.8f)
        {
            target += 0.1f;
        }
        else if (p.accuracy < 0.3f)
        {
            target -= 0.1f;
        }

        if (p.recentDeathStreak >= 3)
        {
            target -= 0.4f;
        }

        if (p.timeSinceLastDeath > 180.0f)
        {
            target += 0.2f;
        }

        return std::clamp(target, 0.0f, 1.0f);
    }

    [[nodiscard]] static DifficultyLevel levelForScore(float score) noexcept
    {
        if (score <= 0.2f)
        {
            return DifficultyLevel::VeryEasy;
        }
        if (score <= 0.4f)
        {
            return DifficultyLevel::Easy;
        }
        if (score <= 0.6f)
        {
            return DifficultyLevel::Medium;
        }
        if (score <= 0.8f)
        {
            return DifficultyLevel::Hard;
        }
        return DifficultyLevel::VeryHard;
    }

    [[nodiscard]] static float midpoint(DifficultyLevel level) noexcept
    {
        switch (level)
        {
        case DifficultyLevel::VeryEasy: return 0.1f;
        case DifficultyLevel::Easy:     return 0.3f;
        case DifficultyLevel::Medium:   return 0.5f;
        case DifficultyLevel::Hard:     return 0.7f;
        case DifficultyLevel::VeryHard: return 0.9f;
        }
        return 0.5f;
    }

    /// @brief Formation scale for a tier: loose when easy, tight when hard.
    [[nodiscard]] static float formationScale(DifficultyLevel level) noexcept
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

    // =========================================================================
    // Manual control
    // =========================================================================

    /// @brief Jumps to level's midpoint score and reapplies everywhere.
    void setDifficulty(DifficultyLevel level,
                       const std::vector<AIEnemyShip*>& ships,
                       FormationRegistry& formations)
    {
        setDifficulty(level);
        applyToAll(ships, formations);
    }

    /// @brief Jumps to level's midpoint score. Always notifies.
    void setDifficulty(DifficultyLevel level)
    {
        const DifficultyLevel old = mLevel;
        mLevel = level;
        mScore = midpoint(level);
        mSettings = AIEnhancementSettings::forLevel(level);
        onDifficultyChanged.emit(old, level);
    }

    void setAdaptationRate(float rate) noexcept { mAdaptationRate = std::clamp(rate, 0.01f, 1.0f); }
    [[nodiscard]] float adaptationRate() const noexcept { return mAdaptationRate; }

    /// @throws std::invalid_argument if seconds is not positive.
    void setEvaluationInterval(float seconds)
    {
        if (!(seconds > 0.0f))
        {
            throw std::invalid_argument("DifficultyScaling: evaluation interval must be > 0");
        }
        mEvaluationInterval = seconds;
    }

    [[nodiscard]] float evaluationInterval() const noexcept { return mEvaluationInterval; }

    // =========================================================================
    // Application
    // =========================================================================

    /// @brief Effective stats = baseline * current bundle.
    void applyTo(AIEnemyShip& ship) const { ship.applyModifiers(mSettings.modifiers()); }

    /// @brief Tier scale, plus the shape upgrade on the two hardest tiers.
    void applyToFormation(FormationController& formation) const
    {
        formation.setDifficultyScale(formationScale(mLevel));

        if (mLevel == DifficultyLevel::Hard && formation.type() == FormationType::VFormation)
        {
            formation.changeFormation(FormationType::Diamond);
        }
        else if (mLevel == DifficultyLevel::VeryHard &&
                 formation.type() != FormationType::Sphere &&
                 formation.type() != FormationType::Helix)
        {
            formation.changeFormation(FormationType::Sphere);
        }
    }

    void applyToAll(const std::vector<AIEnemyShip*>& ships, FormationRegistry& formations) const
    {
        for (AIEnemyShip* ship : ships)
        {
            if (ship != nullptr && !ship->isDestroyed())
            {
                applyTo(*ship);
            }
        }
        for (FormationId id : formations.ids())
        {
            if (FormationController* formation = formations.find(id))
            {
                applyToFormation(*formation);
            }
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] float score() const noexcept { return mScore; }
    [[nodiscard]] DifficultyLevel level() const noexcept { return mLevel; }
    [[nodiscard]] const AIEnhancementSettings& settings() const noexcept { return mSettings; }

    [[nodiscard]] PlayerPerformanceTracker& tracker() noexcept { return mTracker; }
    [[nodiscard]] const PlayerPerformanceTracker& tracker() const noexcept { return mTracker; }

    [[nodiscard]] PlayerPerformance playerPerformance() const { return mTracker.currentPerformance(); }

private:
    PlayerPerformanceTracker mTracker;
    AIEnhancementSettings mSettings;
    DifficultyLevel mLevel = DifficultyLevel::Medium;
    float mScore = 0.5f;
    float mAdaptationRate = kDefaultAdaptationRate;
    float mEvaluationInterval = kDefaultEvaluationInterval;
    float mSinceEvaluation = 0.0f;
};

} // namespace fatp_fleet
