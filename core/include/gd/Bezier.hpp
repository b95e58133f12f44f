#ifndef GD_BEZIER_HPP
#define GD_BEZIER_HPP

#include <utility>

#include <gd/Coordinate.hpp>

namespace gd::bezier {

/**
 * @brief point on the cubic Bézier curve `from, s1, s2, to` at parameter `t` (de Casteljau), together with the
 * two innermost support points of the split: `left` ends the first half, `right` starts the second half, so the
 * tangent at `point` runs from `left` to `right`.
 */
struct CurvePoint {
    Coordinate point;
    Coordinate left;
    Coordinate right;
};

[[nodiscard]] constexpr CurvePoint atTime(const Coordinate& from, const Coordinate& s1, const Coordinate& s2, const Coordinate& to, double t) noexcept {
    const auto lerp = [t](const Coordinate& a, const Coordinate& b) { return Coordinate{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)}; };
    const Coordinate e = lerp(from, s1);
    const Coordinate f = lerp(s1, s2);
    const Coordinate g = lerp(s2, to);
    const Coordinate h = lerp(e, f);
    const Coordinate i = lerp(f, g);
    return {lerp(h, i), h, i};
}

/// support points of the cubic curve from `from` to `to` that passes through `p1` at time `t1` and `p2` at time `t2`
[[nodiscard]] constexpr std::pair<Coordinate, Coordinate> supportsForPointsAtTime(const Coordinate& from, const Coordinate& p1, double t1, const Coordinate& p2, double t2, const Coordinate& to) noexcept {
    // B(t) = (1-t)^3 from + 3(1-t)^2 t s1 + 3(1-t) t^2 s2 + t^3 to, solved for s1 and s2
    const double u1 = 1.0 - t1;
    const double u2 = 1.0 - t2;
    const double a  = 3.0 * u1 * u1 * t1;
    const double b  = 3.0 * u1 * t1 * t1;
    const double c  = 3.0 * u2 * u2 * t2;
    const double d  = 3.0 * u2 * t2 * t2;

    const Coordinate r1  = p1 - u1 * u1 * u1 * from - t1 * t1 * t1 * to;
    const Coordinate r2  = p2 - u2 * u2 * u2 * from - t2 * t2 * t2 * to;
    const double     det = a * d - b * c;
    return {(d * r1 - b * r2) / det, (a * r2 - c * r1) / det};
}

} // namespace gd::bezier

#endif // GD_BEZIER_HPP
