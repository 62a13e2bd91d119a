#pragma once

/**
 * @file PlayerPerformanceTracker.h
 * @brief Rolling player telemetry feeding the difficulty controller.
 */

// Survival times and death timestamps are kept in windows of the last ten
// deaths. All times are simulation seconds advanced by update(dt); the tracker never
// reads a wall clock, so tests drive it exactly.

#include <cfloat>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace fatp_fleet
{

/// @brief Telemetry snapshot consumed by DifficultyScaling.
struct PlayerPerformance
{
    float currentSurvivalTime = 0.0f;
    float averageSurvivalTime = 0.0f;
    float killDeathRatio = 1.0f;
    float accuracy = 0.5f;
    int recentDeathStreak = 0;
    float timeSinceLastDeath = FLT_MAX;
};

/**
 * @brief Kill, death, and shot counters with bounded history windows.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class PlayerPerformanceTracker
{
public:
    static constexpr std::size_t kWindow = 10;
    static constexpr double kStreakWindow = 60.0;

    /// @brief Advances simulation time and the current life's survival time.
    void update(float dt) noexcept
    {
        mNow += static_cast<double>(dt);
        mCurrentSurvival += dt;
    }

    void recordDeath(float survivalTime)
    {
        pushBounded(mSurvivalTimes, survivalTime);
        pushBounded(mDeathTimes, mNow);
        ++mDeaths;
        mCurrentSurvival = 0.0f;

        int streak = 0;
        for (double t : mDeathTimes)
        {
            if (mNow - t < kStreakWindow)
            {
                ++streak;
            }
        }
        mStreak = streak;
    }

    void recordKill() noexcept
    {
        ++mKills;
        mStreak = 0;
    }

    void recordShot(bool hit) noexcept
    {
        ++mShots;
        if (hit)
        {
            ++mHits;
        }
    }

    [[nodiscard]] PlayerPerformance currentPerformance() const
    {
        PlayerPerformance p;
        p.currentSurvivalTime = mCurrentSurvival;

        if (!mSurvivalTimes.empty())
        {
            float sum = 0.0f;
            for (float t : mSurvivalTimes)
            {
                sum += t;
            }
            p.averageSurvivalTime = sum / static_cast<float>(mSurvivalTimes.size());
        }
        else
        {
            p.averageSurvivalTime = mCurrentSurvival;
        }

        if (mDeaths > 0)
        {
            p.killDeathRatio = static_cast<float>(mKills) / static_cast<float>(mDeaths);
        }
        else
        {
            p.killDeathRatio = mKills > 0 ? 10.0f : 1.0f;
        }

        if (mShots > 0)
        {
            p.accuracy = static_cast<float>(mHits) / static_cast<float>(mShots);
        }

        p.recentDeathStreak = mStreak;

        if (!mDeathTimes.empty())
        {
            p.timeSinceLastDeath = static_cast<float>(mNow - mDeathTimes.back());
        }
        return p;
    }

    void reset()
    {
        mSurvivalTimes.clear();
        mDeathTimes.clear();
        mKills = 0;
        mDeaths = 0;
        mShots = 0;
        mHits = 0;
        mStreak = 0;
        mCurrentSurvival = 0.0f;
    }

    [[nodiscard]] uint32_t kills() const noexcept { return mKills; }
    [[nodiscard]] uint32_t deaths() const noexcept { return mDeaths; }
    [[nodiscard]] uint32_t shots() const noexcept { return mShots; }
    [[nodiscard]] uint32_t hits() const noexcept { return mHits; }
    [[nodiscard]] std::size_t survivalWindowSize() const noexcept { return mSurvivalTimes.size(); }
    [[nodiscard]] double now() const noexcept { return mNow; }

private:
    template <typename T>
    static void pushBounded(std::deque<T>& window, T value)
    {
        window.push_back(value);
        if (window.size() > kWindow)
        {
            window.pop_front();
        }
    }

    std::deque<float> mSurvivalTimes;
    std::deque<double> mDeathTimes;
    uint32_t mKills = 0;
    uint32_t mDeaths = 0;
    uint32_t mShots = 0;
    uint32_t mHits = 0;
    int mStreak = 0;
    float mCurrentSurvival = 0.0f;
    double mNow = 0.0;
};

} // namespace fatp_fleet
