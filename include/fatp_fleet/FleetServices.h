#pragma once

/**
 * @file FleetServices.h
 * @brief The shared services every agent reads and writes, bundled for
 *        injection.
 */

// FleetServices owns one instance of each shared service: the communication
// hub, the three knowledge stores, the formation registry, the simulation
// clock, the world bounds, and the random engine behaviors draw from. Agents receive the
// FleetContext view (plain references) at construction and must not outlive
// the FleetServices that produced it.
//
// Tests build a FleetServices per test case, so no state leaks between cases.

#include <cstdint>
#include <random>

#include "AllyTracker.h"
#include "CommunicationHub.h"
#include "FormationRegistry.h"
#include "IntelligenceDatabase.h"
#include "ThreatDatabase.h"
#include "Types.h"

namespace fatp_fleet
{

/// @brief Non-owning view of the shared services.
struct FleetContext
{
    CommunicationHub& hub;
    ThreatDatabase& threats;
    AllyTracker& allies;
    IntelligenceDatabase& intel;
    FormationRegistry& formations;
    SimClock& clock;
    WorldBounds& world;
    std::mt19937& rng;

    /// @brief Uniform float in [lo, hi).
    [[nodiscard]] float randomRange(float lo, float hi) const
    {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(rng);
    }
};

/**
 * @brief Owner of the shared services.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class FleetServices
{
public:
    explicit FleetServices(uint32_t seed = 0x5EEDu)
        : mFormations(mHub)
        , mRng(seed)
        , mContext{mHub, mThreats, mAllies, mIntel, mFormations, mClock, mWorld, mRng}
    {
    }

    FleetServices(const FleetServices&) = delete;
    FleetServices& operator=(const FleetServices&) = delete;
    FleetServices(FleetServices&&) = delete;
    FleetServices& operator=(FleetServices&&) = delete;

    [[nodiscard]] FleetContext& context() noexcept { return mContext; }

    [[nodiscard]] CommunicationHub& hub() noexcept { return mHub; }
    [[nodiscard]] ThreatDatabase& threats() noexcept { return mThreats; }
    [[nodiscard]] AllyTracker& allies() noexcept { return mAllies; }
    [[nodiscard]] IntelligenceDatabase& intel() noexcept { return mIntel; }
    [[nodiscard]] FormationRegistry& formations() noexcept { return mFormations; }
    [[nodiscard]] SimClock& clock() noexcept { return mClock; }
    [[nodiscard]] WorldBounds& world() noexcept { return mWorld; }
    [[nodiscard]] std::mt19937& rng() noexcept { return mRng; }

    void reseed(uint32_t seed) { mRng.seed(seed); }

private:
    CommunicationHub mHub;
    ThreatDatabase mThreats;
    AllyTracker mAllies;
    IntelligenceDatabase mIntel;
    FormationRegistry mFormations;
    SimClock mClock;
    WorldBounds mWorld;
    std::mt19937 mRng;
    FleetContext mContext;
};

} // namespace fatp_fleet
