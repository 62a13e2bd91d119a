#pragma once

/**
 * @file IntelligenceDatabase.h
 * @brief Accumulates intel reports and correlates them into contact clusters.
 */

// Every report is appended to a bounded log (oldest dropped past kMaxReports).
// Correlation: a report within kCorrelationRadius of an existing cluster's
// centroid merges into it, otherwise it opens a new cluster. Merging moves
// the centroid to the count-weighted mean, keeps the maximum threat level, and
// combines confidences as independent observations: 1 - (1-a)(1-b). A
// report that identifies its contact's hull class overwrites the cluster's;
// an unidentified one leaves it alone.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

#include "Message.h"
#include "Vec3.h"

namespace fatp_fleet
{

struct IntelCluster
{
    Vec3 centroid;
    Vec3 velocity;
    float threatLevel = 0.0f;
    float confidence = 0.0f;
    std::optional<ShipType> lastShipType;
    uint32_t reportCount = 0;
    double lastUpdated = 0.0;
};

/**
 * @brief Intel report log with proximity correlation.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class IntelligenceDatabase
{
public:
    static constexpr std::size_t kMaxReports = 256;
    static constexpr float kCorrelationRadius = 50.0f;

    IntelligenceDatabase() = default;
    IntelligenceDatabase(const IntelligenceDatabase&) = delete;
    IntelligenceDatabase& operator=(const IntelligenceDatabase&) = delete;

    /// @brief Appends intel and folds it into the matching cluster.
    void processIntel(const IntelData& intel, double now)
    {
        if (mReports.size() >= kMaxReports)
        {
            mReports.erase(mReports.begin());
        }
        mReports.push_back(intel);

        IntelCluster* match = nearestCluster(intel.position);
        if (match == nullptr)
        {
            IntelCluster cluster;
            cluster.centroid = intel.position;
            cluster.velocity = intel.velocity;
            cluster.threatLevel = intel.threatLevel;
            cluster.confidence = std::clamp(intel.confidence, 0.0f, 1.0f);
            cluster.lastShipType = intel.shipType;
            cluster.reportCount = 1;
            cluster.lastUpdated = now;
            mClusters.push_back(cluster);
            return;
        }

        const float n = static_cast<float>(match->reportCount);
        match->centroid = (match->centroid * n + intel.position) / (n + 1.0f);
        match->velocity = intel.velocity;
        match->threatLevel = std::max(match->threatLevel, intel.threatLevel);
        const float c = std::clamp(intel.confidence, 0.0f, 1.0f);
        match->confidence = 1.0f - (1.0f - match->confidence) * (1.0f - c);
        if (intel.shipType)
        {
            match->lastShipType = intel.shipType;
        }
        ++match->reportCount;
        match->lastUpdated = now;
    }

    [[nodiscard]] const std::vector<IntelData>& reports() const noexcept { return mReports; }
    [[nodiscard]] const std::vector<IntelCluster>& clusters() const noexcept { return mClusters; }

    /// @brief Cluster with the highest threat * confidence, or nullptr.
    [[nodiscard]] const IntelCluster* strongestCluster() const noexcept
    {
        const IntelCluster* best = nullptr;
        for (const auto& cluster : mClusters)
        {
            if (best == nullptr ||
                cluster.threatLevel * cluster.confidence > best->threatLevel * best->confidence)
            {
                best = &cluster;
            }
        }
        return best;
    }

    [[nodiscard]] std::size_t size() const noexcept { return mReports.size(); }

    void clear()
    {
        mReports.clear();
        mClusters.clear();
    }

private:
    IntelCluster* nearestCluster(const Vec3& position)
    {
        IntelCluster* best = nullptr;
        float bestDist = kCorrelationRadius;
        for (auto& cluster : mClusters)
        {
            const float d = distance(cluster.centroid, position);
            if (d <= bestDist)
            {
                bestDist = d;
                best = &cluster;
            }
        }
        return best;
    }

    std::vector<IntelData> mReports;
    std::vector<IntelCluster> mClusters;
};

} // namespace fatp_fleet
