#pragma once

/**
 * @file Vec3.h
 * @brief Minimal 3D vector used for agent kinematics and formation geometry.
 */

#include <cmath>

namespace fatp_fleet
{

/// @brief Float 3-vector with value semantics.
struct Vec3
{
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() noexcept = default;
    constexpr Vec3(float px, float py, float pz) noexcept : x(px), y(py), z(pz) {}

    [[nodiscard]] static constexpr Vec3 zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vec3 unitX() noexcept { return {1.0f, 0.0f, 0.0f}; }
    [[nodiscard]] static constexpr Vec3 unitY() noexcept { return {0.0f, 1.0f, 0.0f}; }
    [[nodiscard]] static constexpr Vec3 unitZ() noexcept { return {0.0f, 0.0f, 1.0f}; }

    constexpr Vec3 operator+(const Vec3& o) const noexcept { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const noexcept { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vec3 operator-() const noexcept { return {-x, -y, -z}; }
    constexpr Vec3 operator*(float s) const noexcept { return {x * s, y * s, z * s}; }
    constexpr Vec3 operator/(float s) const noexcept { return {x / s, y / s, z / s}; }

    constexpr Vec3& operator+=(const Vec3& o) noexcept
    {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& o) noexcept
    {
        x -= o.x;
        y -= o.y;
        z -= o.z;
        return *this;
    }

    constexpr Vec3& operator*=(float s) noexcept
    {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }

    constexpr bool operator==(const Vec3& o) const noexcept = default;

    [[nodiscard]] constexpr float lengthSquared() const noexcept { return x * x + y * y + z * z; }
    [[nodiscard]] float length() const noexcept { return std::sqrt(lengthSquared()); }
};

constexpr Vec3 operator*(float s, const Vec3& v) noexcept
{
    return v * s;
}

[[nodiscard]] constexpr float dot(const Vec3& a, const Vec3& b) noexcept
{
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

[[nodiscard]] constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept
{
    return {a.y * b.z - a.z * b.y,
            a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x};
}

/// @brief Unit vector along v. The zero vector normalizes to itself.
[[nodiscard]] inline Vec3 normalize(const Vec3& v) noexcept
{
    const float len = v.length();
    if (len <= 1e-6f)
    {
        return Vec3::zero();
    }
    return v / len;
}

[[nodiscard]] inline float distance(const Vec3& a, const Vec3& b) noexcept
{
    return (a - b).length();
}

[[nodiscard]] constexpr Vec3 lerp(const Vec3& a, const Vec3& b, float t) noexcept
{
    return a + (b - a) * t;
}

} // namespace fatp_fleet
