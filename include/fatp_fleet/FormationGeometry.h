#pragma once

/**
 * @file FormationGeometry.h
 * @brief Slot layouts for every FormationType.
 */

// FAT-P components used:
// - SmallVector: Slot lists (formations rarely exceed 16 ships, so no heap)
//
// Local frame: +Z is the formation's heading, +X its right, +Y its up. Slot 0
// always belongs to the leader. localSlots() is pure; FormationController maps
// the result into world space with toWorld().

#include <cmath>
#include <cstddef>

#include <fat_p/SmallVector.h>

#include "Types.h"
#include "Vec3.h"

namespace fatp_fleet
{

using SlotList = fat_p::SmallVector<Vec3, 16>;

namespace formation_geometry
{

inline constexpr float kPi = 3.14159265358979323846f;

inline constexpr float kVSpacing = 25.0f;
inline constexpr float kVAngleDeg = 30.0f;
inline constexpr float kDiamondSpacing = 30.0f;
inline constexpr float kSphereRadius = 40.0f;
inline constexpr float kHelixRadius = 20.0f;
inline constexpr float kHelixPitch = 15.0f;
inline constexpr float kHelixStepDeg = 60.0f;
inline constexpr float kHelixTrail = 10.0f;
inline constexpr float kLineSpacing = 20.0f;
inline constexpr float kBoxSpacing = 25.0f;
inline constexpr float kWedgeSpacing = 20.0f;
inline constexpr float kCircleRadius = 30.0f;

[[nodiscard]] inline float toRadians(float deg) noexcept
{
    return deg * kPi / 180.0f;
}

// Leader at the apex, wingmen alternating left/right, one rank further back
// for every pair.
inline void vFormation(SlotList& out, std::size_t count, float scale)
{
    const float spacing = kVSpacing * scale;
    const float a = toRadians(kVAngleDeg);
    for (std::size_t i = 0; i < count; ++i)
    {
        if (i == 0)
        {
            out.push_back(Vec3::zero());
            continue;
        }
        const float side = (i % 2 == 1) ? -1.0f : 1.0f;
        const float rank = static_cast<float>((i + 1) / 2);
        out.push_back({side * std::sin(a) * spacing * rank,
                       0.0f,
                       -std::cos(a) * spacing * rank});
    }
}

// Front, left, right, rear; further ships extend the same four points on
// rings scaled by ring * 0.7.
inline void diamond(SlotList& out, std::size_t count, float scale)
{
    const float s = kDiamondSpacing * scale;
    for (std::size_t i = 0; i < count; ++i)
    {
        float r = s;
        std::size_t side = i;
        if (i >= 4)
        {
            const auto ring = static_cast<float>((i - 4) / 4 + 2);
            r = s * ring * 0.7f;
            side = (i - 4) % 4;
        }
        switch (side)
        {
        case 0:  out.push_back({0.0f, 0.0f, r}); break;
        case 1:  out.push_back({-r, 0.0f, 0.0f}); break;
        case 2:  out.push_back({r, 0.0f, 0.0f}); break;
        default: out.push_back({0.0f, 0.0f, -r}); break;
        }
    }
}

// Leader at the center, everyone else on a Fibonacci sphere.
inline void sphere(SlotList& out, std::size_t count, float scale)
{
    const float radius = kSphereRadius * scale;
    const double golden = 3.14159265358979323846 * (1.0 + std::sqrt(5.0));
    for (std::size_t i = 0; i < count; ++i)
    {
        if (i == 0)
        {
            out.push_back(Vec3::zero());
            continue;
        }
        const double k = static_cast<double>(i - 1);
        const double denom = count > 2 ? static_cast<double>(count - 2) : 1.0;
        const double phi = std::acos(1.0 - 2.0 * k / denom);
        const double theta = golden * k;
        out.push_back({radius * static_cast<float>(std::sin(phi) * std::cos(theta)),
                       radius * static_cast<float>(std::sin(phi) * std::sin(theta)),
                       radius * static_cast<float>(std::cos(phi))});
    }
}

inline void helix(SlotList& out, std::size_t count, float scale)
{
    const float radius = kHelixRadius * scale;
    const float pitch = kHelixPitch * scale;
    for (std::size_t i = 0; i < count; ++i)
    {
        const float fi = static_cast<float>(i);
        const float a = toRadians(kHelixStepDeg) * fi;
        out.push_back({radius * std::cos(a),
                       fi * pitch,
                       radius * std::sin(a) - fi * kHelixTrail});
    }
}

inline void line(SlotList& out, std::size_t count, float scale)
{
    const float spacing = kLineSpacing * scale;
    const float half = static_cast<float>(count) / 2.0f;
    for (std::size_t i = 0; i < count; ++i)
    {
        out.push_back({(static_cast<float>(i) - half) * spacing, 0.0f, 0.0f});
    }
}

inline void box(SlotList& out, std::size_t count, float scale)
{
    const float spacing = kBoxSpacing * scale;
    const auto perSide = static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<float>(count))));
    const float half = static_cast<float>(perSide) / 2.0f;
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto row = static_cast<float>(i / perSide);
        const auto col = static_cast<float>(i % perSide);
        out.push_back({(col - half) * spacing, 0.0f, (row - half) * spacing});
    }
}

// Rows of 1, 3, 5, ... ships, each row one spacing further back.
inline void wedge(SlotList& out, std::size_t count, float scale)
{
    const float spacing = kWedgeSpacing * scale;
    for (std::size_t i = 0; i < count; ++i)
    {
        std::size_t row = 0;
        std::size_t shipsInRow = 1;
        std::size_t before = 0;
        while (before + shipsInRow <= i)
        {
            before += shipsInRow;
            ++row;
            shipsInRow += 2;
        }
        const auto col = static_cast<float>(i - before);
        out.push_back({(col - static_cast<float>(shipsInRow) / 2.0f + 0.5f) * spacing,
                       0.0f,
                       -static_cast<float>(row) * spacing});
    }
}

// Leader at the center, the rest evenly around a horizontal ring.
inline void circle(SlotList& out, std::size_t count, float scale)
{
    const float radius = kCircleRadius * scale;
    for (std::size_t i = 0; i < count; ++i)
    {
        if (i == 0)
        {
            out.push_back(Vec3::zero());
            continue;
        }
        const float a = static_cast<float>(i - 1) * 2.0f * kPi / static_cast<float>(count - 1);
        out.push_back({radius * std::cos(a), 0.0f, radius * std::sin(a)});
    }
}

} // namespace formation_geometry

/// @brief Local-frame slot offsets for count ships.
[[nodiscard]] inline SlotList localSlots(FormationType type, std::size_t count, float scale)
{
    namespace fg = formation_geometry;

    SlotList out;
    switch (type)
    {
    case FormationType::VFormation: fg::vFormation(out, count, scale); break;
    case FormationType::Diamond:    fg::diamond(out, count, scale); break;
    case FormationType::Sphere:     fg::sphere(out, count, scale); break;
    case FormationType::Helix:      fg::helix(out, count, scale); break;
    case FormationType::Line:       fg::line(out, count, scale); break;
    case FormationType::Box:        fg::box(out, count, scale); break;
    case FormationType::Wedge:      fg::wedge(out, count, scale); break;
    case FormationType::Circle:     fg::circle(out, count, scale); break;
    }
    return out;
}

/**
 * @brief Maps a local slot into world space.
 *
 * right = normalize(cross(direction, +Y)), up = cross(right, direction). A
 * vertical heading has no defined right vector; +X is used instead.
 */
[[nodiscard]] inline Vec3 toWorld(const Vec3& local, const Vec3& center, const Vec3& direction)
{
    const Vec3 forward = normalize(direction);
    Vec3 right = normalize(cross(forward, Vec3::unitY()));
    if (right.lengthSquared() < 0.5f)
    {
        right = Vec3::unitX();
    }
    const Vec3 up = cross(right, forward);
    return center + right * local.x + up * local.y + forward * local.z;
}

} // namespace fatp_fleet
