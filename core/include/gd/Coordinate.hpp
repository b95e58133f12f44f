#ifndef GD_COORDINATE_HPP
#define GD_COORDINATE_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <ranges>

#include <fmt/format.h>

namespace gd {

/// affine transformation `{a, b, c, d, tx, ty}`: x' = a*x + b*y + tx, y' = c*x + d*y + ty
using Transform = std::array<double, 6>;

constexpr Transform kIdentityTransform{1.0, 0.0, 0.0, 1.0, 0.0, 0.0};

[[nodiscard]] inline Transform rotationTransform(double angle) noexcept {
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    return {c, -s, s, c, 0.0, 0.0};
}

struct BoundingBox {
    double minX    = 0.0;
    double minY    = 0.0;
    double maxX    = 0.0;
    double maxY    = 0.0;
    double centerX = 0.0;
    double centerY = 0.0;

    [[nodiscard]] constexpr double width() const noexcept { return maxX - minX; }
    [[nodiscard]] constexpr double height() const noexcept { return maxY - minY; }
};

struct Coordinate {
    double x = 0.0;
    double y = 0.0;

    constexpr Coordinate() noexcept = default;
    constexpr Coordinate(double x_, double y_) noexcept : x(x_), y(y_) {}

    constexpr Coordinate& apply(const Transform& t) noexcept {
        const double nx = t[0] * x + t[1] * y + t[4];
        const double ny = t[2] * x + t[3] * y + t[5];
        x               = nx;
        y               = ny;
        return *this;
    }

    constexpr Coordinate& shift(double dx, double dy) noexcept {
        x += dx;
        y += dy;
        return *this;
    }

    constexpr Coordinate& unshift(double dx, double dy) noexcept {
        x -= dx;
        y -= dy;
        return *this;
    }

    constexpr Coordinate& shiftByCoordinate(const Coordinate& c) noexcept { return shift(c.x, c.y); }
    constexpr Coordinate& unshiftByCoordinate(const Coordinate& c) noexcept { return unshift(c.x, c.y); }

    /// moves the coordinate the fraction `f` of the way towards `c`
    constexpr Coordinate& moveTowards(const Coordinate& c, double f) noexcept {
        x += f * (c.x - x);
        y += f * (c.y - y);
        return *this;
    }

    constexpr Coordinate& scale(double s) noexcept {
        x *= s;
        y *= s;
        return *this;
    }

    [[nodiscard]] double norm() const noexcept { return std::sqrt(x * x + y * y); }

    /// zero vectors normalise to (1,0)
    Coordinate& normalize() noexcept {
        const double n = norm();
        if (n == 0.0) {
            x = 1.0;
            y = 0.0;
        } else {
            x /= n;
            y /= n;
        }
        return *this;
    }

    [[nodiscard]] Coordinate normalized() const noexcept {
        Coordinate c = *this;
        return c.normalize();
    }

    constexpr Coordinate& operator+=(const Coordinate& o) noexcept { return shift(o.x, o.y); }
    constexpr Coordinate& operator-=(const Coordinate& o) noexcept { return unshift(o.x, o.y); }
    constexpr Coordinate& operator*=(double s) noexcept { return scale(s); }
    constexpr Coordinate& operator/=(double s) noexcept {
        x /= s;
        y /= s;
        return *this;
    }

    [[nodiscard]] friend constexpr Coordinate operator+(Coordinate a, const Coordinate& b) noexcept { return a += b; }
    [[nodiscard]] friend constexpr Coordinate operator-(Coordinate a, const Coordinate& b) noexcept { return a -= b; }
    [[nodiscard]] friend constexpr Coordinate operator-(const Coordinate& a) noexcept { return {-a.x, -a.y}; }
    [[nodiscard]] friend constexpr Coordinate operator*(Coordinate a, double s) noexcept { return a *= s; }
    [[nodiscard]] friend constexpr Coordinate operator*(double s, Coordinate a) noexcept { return a *= s; }
    [[nodiscard]] friend constexpr double     operator*(const Coordinate& a, const Coordinate& b) noexcept { return a.x * b.x + a.y * b.y; } // dot product
    [[nodiscard]] friend constexpr Coordinate operator/(Coordinate a, double s) noexcept { return a /= s; }

    [[nodiscard]] friend constexpr bool operator==(const Coordinate&, const Coordinate&) noexcept = default;
};

[[nodiscard]] inline double distance(const Coordinate& a, const Coordinate& b) noexcept { return (a - b).norm(); }

/// bounding box of a range of coordinates; all zero for an empty range
template<std::ranges::input_range R>
requires std::same_as<std::remove_cvref_t<std::ranges::range_value_t<R>>, Coordinate>
[[nodiscard]] BoundingBox boundingBox(R&& coordinates) noexcept {
    if (std::ranges::empty(coordinates)) {
        return {};
    }
    BoundingBox box{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest(), 0.0, 0.0};
    for (const Coordinate& c : coordinates) {
        box.minX = std::min(box.minX, c.x);
        box.minY = std::min(box.minY, c.y);
        box.maxX = std::max(box.maxX, c.x);
        box.maxY = std::max(box.maxY, c.y);
    }
    box.centerX = (box.minX + box.maxX) / 2.0;
    box.centerY = (box.minY + box.maxY) / 2.0;
    return box;
}

} // namespace gd

template<>
struct fmt::formatter<gd::Coordinate> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gd::Coordinate& c, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({}pt,{}pt)", c.x, c.y);
    }
};

#endif // GD_COORDINATE_HPP
