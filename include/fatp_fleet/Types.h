#pragma once

/**
 * @file Types.h
 * @brief Identifiers, enumerations, and the simulation clock shared by every
 *        fleet AI module.
 */

// FAT-P components used:
// - StrongId: Type-safe agent and formation identifiers
//
// AgentId and FormationId are 32-bit StrongIds handed out sequentially by the
// FleetManager (or by tests directly). Neither is ever reused during a run, so
// no generation bits are needed: a stale id simply fails every lookup.

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include <fat_p/StrongId.h>

#include "Vec3.h"

namespace fatp_fleet
{

// =============================================================================
// Identifiers
// =============================================================================

struct AgentTag
{
};

struct FormationTag
{
};

/// @brief Identity of one enemy ship. Stable for the agent's lifetime.
using AgentId = fat_p::StrongId<uint32_t,
                                AgentTag,
                                fat_p::strong_id::NoCheckPolicy,
                                fat_p::strong_id::UncheckedOpPolicy>;

/// @brief Identity of one formation in the FormationRegistry.
using FormationId = fat_p::StrongId<uint32_t,
                                    FormationTag,
                                    fat_p::strong_id::NoCheckPolicy,
                                    fat_p::strong_id::UncheckedOpPolicy>;

inline constexpr AgentId NullAgent = AgentId::invalid();
inline constexpr FormationId NullFormation = FormationId::invalid();

// =============================================================================
// Enumerations
// =============================================================================

enum class ShipType : uint8_t
{
    Scout,
    Fighter,
    Bomber,
    Interceptor
};

enum class Personality : uint8_t
{
    Aggressive,
    Defensive,
    Tactical,
    Reckless,
    Cautious,
    Balanced
};

/// @brief Identity of a behavior state. Two states are "the same" iff ids match.
enum class StateId : uint8_t
{
    Patrol,
    Attack,
    Pursue,
    Flee,
    Support
};

enum class FormationType : uint8_t
{
    VFormation,
    Diamond,
    Sphere,
    Helix,
    Line,
    Box,
    Wedge,
    Circle
};

enum class DifficultyLevel : uint8_t
{
    VeryEasy,
    Easy,
    Medium,
    Hard,
    VeryHard
};

[[nodiscard]] constexpr std::string_view toString(ShipType type) noexcept
{
    switch (type)
    {
    case ShipType::Scout:       return "Scout";
    case ShipType::Fighter:     return "Fighter";
    case ShipType::Bomber:      return "Bomber";
    case ShipType::Interceptor: return "Interceptor";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view toString(StateId id) noexcept
{
    switch (id)
    {
    case StateId::Patrol:  return "Patrol";
    case StateId::Attack:  return "Attack";
    case StateId::Pursue:  return "Pursue";
    case StateId::Flee:    return "Flee";
    case StateId::Support: return "Support";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view toString(FormationType type) noexcept
{
    switch (type)
    {
    case FormationType::VFormation: return "V";
    case FormationType::Diamond:    return "Diamond";
    case FormationType::Sphere:     return "Sphere";
    case FormationType::Helix:      return "Helix";
    case FormationType::Line:       return "Line";
    case FormationType::Box:        return "Box";
    case FormationType::Wedge:      return "Wedge";
    case FormationType::Circle:     return "Circle";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view toString(DifficultyLevel level) noexcept
{
    switch (level)
    {
    case DifficultyLevel::VeryEasy: return "VeryEasy";
    case DifficultyLevel::Easy:     return "Easy";
    case DifficultyLevel::Medium:   return "Medium";
    case DifficultyLevel::Hard:     return "Hard";
    case DifficultyLevel::VeryHard: return "VeryHard";
    }
    return "Unknown";
}

// =============================================================================
// Contact
// =============================================================================

/// @brief Snapshot of a hostile the agent tracks (in practice, the player).
struct Contact
{
    Vec3 position;
    Vec3 velocity;
    float health = 100.0f;

    /// @brief Hull class when the contact has been identified as one.
    std::optional<ShipType> shipType;
};

// =============================================================================
// WorldBounds
// =============================================================================

/// @brief Spherical play volume. Owned by FleetServices, set by the FleetManager.
struct WorldBounds
{
    Vec3 center;
    float radius = 500.0f;

    [[nodiscard]] bool contains(const Vec3& p) const noexcept
    {
        return distance(p, center) <= radius;
    }

    /// @brief True when the segment start..end leaves the volume.
    [[nodiscard]] bool exits(const Vec3& start, const Vec3& end) const noexcept
    {
        return contains(start) && !contains(end);
    }

    /// @brief Point on the boundary nearest p.
    [[nodiscard]] Vec3 surfacePoint(const Vec3& p) const noexcept
    {
        return center + normalize(p - center) * radius;
    }
};

// =============================================================================
// SimClock
// =============================================================================

/**
 * @brief Monotonic simulation time in seconds.
 *
 * Advanced once per tick by the FleetManager. Message timestamps and threat
 * "last seen" stamps read it, so tests control time exactly.
 *
 * @note Thread-safety: NOT thread-safe.
 */
class SimClock
{
public:
    void advance(float dt) noexcept { mNow += static_cast<double>(dt); }
    void reset(double now = 0.0) noexcept { mNow = now; }

    [[nodiscard]] double now() const noexcept { return mNow; }

private:
    double mNow = 0.0;
};

} // namespace fatp_fleet

// std::hash specializations so ids can key FastHashMap.
template <>
struct std::hash<fatp_fleet::AgentId>
{
    std::size_t operator()(fatp_fleet::AgentId id) const noexcept
    {
        return std::hash<uint32_t>{}(id.get());
    }
};

template <>
struct std::hash<fatp_fleet::FormationId>
{
    std::size_t operator()(fatp_fleet::FormationId id) const noexcept
    {
        return std::hash<uint32_t>{}(id.get());
    }
};
