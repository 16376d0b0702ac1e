#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

namespace EvoSim {

/**
 * Small 2D vector. Grid positions use Vector2<int> with x = column and y = row.
 */
template <typename T>
struct Vector2 {
    T x = T{};
    T y = T{};

    Vector2 operator+(const Vector2& other) const { return { x + other.x, y + other.y }; }
    Vector2 operator-(const Vector2& other) const { return { x - other.x, y - other.y }; }
    Vector2 operator*(T scalar) const { return { x * scalar, y * scalar }; }

    bool operator==(const Vector2& other) const = default;

    T magnitudeSquared() const { return x * x + y * y; }

    double mag() const { return std::sqrt(static_cast<double>(magnitudeSquared())); }

    std::string toString() const
    {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
    }
};

using Vector2i = Vector2<int>;

// King-move distance: the number of 8-neighbour steps between two tiles.
inline int chebyshevDistance(const Vector2i& a, const Vector2i& b)
{
    return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

template <typename T>
void to_json(nlohmann::json& j, const Vector2<T>& v)
{
    j = nlohmann::json{ { "x", v.x }, { "y", v.y } };
}

template <typename T>
void from_json(const nlohmann::json& j, Vector2<T>& v)
{
    j.at("x").get_to(v.x);
    j.at("y").get_to(v.y);
}

} // namespace EvoSim

template <>
struct std::hash<EvoSim::Vector2i> {
    size_t operator()(const EvoSim::Vector2i& v) const noexcept
    {
        return std::hash<uint64_t>{}(
            (static_cast<uint64_t>(static_cast<uint32_t>(v.y)) << 32)
            | static_cast<uint32_t>(v.x));
    }
};
