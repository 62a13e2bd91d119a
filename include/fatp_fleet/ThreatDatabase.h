#pragma once

/**
 * @file ThreatDatabase.h
 * @brief Shared blackboard of observed threat levels keyed by spatial cell.
 */

// FAT-P components used:
// - FastHashMap: Cell key -> ThreatInfo
//
// Positions are quantized to a cubic grid (kCellSize units) before lookup so
// that two sightings of the same hostile a few units apart land on the same
// entry. The cell key packs three signed 21-bit cell coordinates into 64 bits,
// which covers +/-1M cells per axis, far beyond any playable arena.
//
// Writes are last-write-wins for position/velocity and monotone-max for the
// level, except increaseThreatLevel which is additive. Nothing expires on its
// own; the owner calls expireOlderThan() on whatever cadence suits it.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <fat_p/FastHashMap.h>

#include "Message.h"
#include "Vec3.h"

namespace fatp_fleet
{

/// @brief What the fleet currently believes about one cell.
struct ThreatInfo
{
    float threatLevel = 0.0f;
    double lastSeen = 0.0;
    Vec3 position;
    Vec3 velocity;
    float confidence = 0.0f;
    uint32_t sightings = 0;
};

/**
 * @brief Spatially keyed threat store.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class ThreatDatabase
{
public:
    static constexpr float kCellSize = 25.0f;

    /// @brief Level a single fully confident sighting establishes.
    static constexpr float kSightingLevel = 0.5f;

    ThreatDatabase() = default;
    ThreatDatabase(const ThreatDatabase&) = delete;
    ThreatDatabase& operator=(const ThreatDatabase&) = delete;

    /**
     * @brief Records a sighting at position.
     *
     * The level becomes max(current, kSightingLevel * confidence); position,
     * velocity, and confidence are overwritten.
     */
    void updateThreat(const Vec3& position, const ContactReport& report, double now)
    {
        ThreatInfo& info = ensure(position);
        const float confidence = std::clamp(report.confidence, 0.0f, 1.0f);
        info.threatLevel = std::max(info.threatLevel, kSightingLevel * confidence);
        info.position = position;
        info.velocity = report.velocity;
        info.confidence = confidence;
        info.lastSeen = now;
        ++info.sightings;
    }

    /// @brief Adds amount to the level at position, saturating at 1.
    void increaseThreatLevel(const Vec3& position, float amount, double now)
    {
        ThreatInfo& info = ensure(position);
        info.threatLevel = std::clamp(info.threatLevel + amount, 0.0f, 1.0f);
        info.lastSeen = now;
    }

    [[nodiscard]] const ThreatInfo* find(const Vec3& position) const
    {
        return mThreats.find(cellKey(position));
    }

    /// @brief Level at position's cell, 0 when nothing is known.
    [[nodiscard]] float threatLevelAt(const Vec3& position) const
    {
        const ThreatInfo* info = find(position);
        return info != nullptr ? info->threatLevel : 0.0f;
    }

    /// @brief All entries whose recorded position is within radius of center.
    [[nodiscard]] std::vector<ThreatInfo> threatsWithin(const Vec3& center, float radius) const
    {
        std::vector<ThreatInfo> result;
        for (auto it = mThreats.begin(); it != mThreats.end(); ++it)
        {
            if (distance(it.value().position, center) <= radius)
            {
                result.push_back(it.value());
            }
        }
        return result;
    }

    /// @brief The single highest-level entry, or nullptr when empty.
    [[nodiscard]] const ThreatInfo* highestThreat() const
    {
        const ThreatInfo* best = nullptr;
        for (auto it = mThreats.begin(); it != mThreats.end(); ++it)
        {
            if (best == nullptr || it.value().threatLevel > best->threatLevel)
            {
                best = &it.value();
            }
        }
        return best;
    }

    /**
     * @brief Drops entries not refreshed since now - maxAge.
     *
     * @return Number of entries removed.
     */
    std::size_t expireOlderThan(double now, double maxAge)
    {
        std::vector<uint64_t> stale;
        for (auto it = mThreats.begin(); it != mThreats.end(); ++it)
        {
            if (now - it.value().lastSeen > maxAge)
            {
                stale.push_back(it.key());
            }
        }
        for (uint64_t key : stale)
        {
            mThreats.erase(key);
        }
        return stale.size();
    }

    [[nodiscard]] std::size_t size() const noexcept { return mThreats.size(); }
    void clear() { mThreats.clear(); }

    [[nodiscard]] static uint64_t cellKey(const Vec3& position) noexcept
    {
        auto cell = [](float v) -> uint64_t
        {
            const auto c = static_cast<int64_t>(std::floor(v / kCellSize));
            return static_cast<uint64_t>(c) & 0x1FFFFFull;
        };
        return cell(position.x) | (cell(position.y) << 21) | (cell(position.z) << 42);
    }

private:
    ThreatInfo& ensure(const Vec3& position)
    {
        const uint64_t key = cellKey(position);
        ThreatInfo* existing = mThreats.find(key);
        if (existing != nullptr)
        {
            return *existing;
        }

        ThreatInfo info;
        info.position = position;
        mThreats.insert(key, info);
        return *mThreats.find(key);
    }

    fat_p::FastHashMap<uint64_t, ThreatInfo> mThreats;
};

} // namespace fatp_fleet
