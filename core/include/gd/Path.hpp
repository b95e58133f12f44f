#ifndef GD_PATH_HPP
#define GD_PATH_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <gd/Coordinate.hpp>

namespace gd {

enum class PathOp : std::uint8_t { moveto, lineto, curveto, closepath };

/// a coordinate that is only known later, e.g. the anchor of a vertex that has not been placed yet
struct DeferredCoordinate {
    std::function<Coordinate()> resolve;
};

using PathPoint   = std::variant<Coordinate, DeferredCoordinate>;
using PathElement = std::variant<PathOp, Coordinate, DeferredCoordinate>;

[[nodiscard]] Coordinate rigid(const PathPoint& point);

/**
 * @brief piecewise linear/cubic path: a sequence of `moveto`, `lineto`, `curveto` (followed by two supports and
 * the end point) and `closepath` tokens, each followed by its points.
 *
 * Points may be deferred; geometric queries need a rigid path (see makeRigid()).
 */
class Path {
public:
    struct Segment {
        PathOp      action = PathOp::lineto; // lineto or curveto, closepath is segmentized as lineto
        std::size_t pathPos = 0UZ;           // index of the token in the path
        Coordinate  from;
        Coordinate  to;
        Coordinate  support1;
        Coordinate  support2;
        BoundingBox box;
    };

    struct Intersection {
        double      time  = 0.0;
        std::size_t index = 0UZ; // index of the segment token in the first path
        Coordinate  point;
    };

private:
    std::vector<PathElement> _elements;

public:
    Path() = default;
    /// a bare point where a token is expected means `lineto`; throws on ill-formed token arity
    Path(std::initializer_list<PathElement> init);

    [[nodiscard]] std::size_t                     size() const noexcept { return _elements.size(); }
    [[nodiscard]] bool                            empty() const noexcept { return _elements.empty(); }
    [[nodiscard]] const PathElement&              operator[](std::size_t i) const { return _elements[i]; }
    [[nodiscard]] const std::vector<PathElement>& elements() const noexcept { return _elements; }
    [[nodiscard]] auto                            begin() const noexcept { return _elements.begin(); }
    [[nodiscard]] auto                            end() const noexcept { return _elements.end(); }

    void clear() noexcept { _elements.clear(); }
    void appendMoveto(PathPoint point);
    void appendMoveto(double x, double y) { appendMoveto(Coordinate{x, y}); }
    void appendLineto(PathPoint point);
    void appendLineto(double x, double y) { appendLineto(Coordinate{x, y}); }
    void appendCurveto(PathPoint support1, PathPoint support2, PathPoint to);
    void appendClosepath();
    /// circular arc around the implied center, starting at the current point; angles in degrees
    void appendArc(double startAngle, double endAngle, double radius);

    [[nodiscard]] Path clone() const { return *this; }
    [[nodiscard]] Path reversed() const;

    Path& transform(const Transform& t);
    Path& shift(double dx, double dy);
    Path& shiftByCoordinate(const Coordinate& c) { return shift(c.x, c.y); }
    Path& unshiftByCoordinate(const Coordinate& c) { return shift(-c.x, -c.y); }

    /// resolves every deferred coordinate
    Path&              makeRigid();
    [[nodiscard]] bool isRigid() const noexcept;

    /// the concrete (non-deferred) coordinates of the path
    [[nodiscard]] std::vector<Coordinate> coordinates() const;
    [[nodiscard]] BoundingBox             boundingBox() const;
    [[nodiscard]] std::vector<Segment>    segmentize() const;

    [[nodiscard]] std::vector<Intersection> intersectionsWith(const Path& other) const;

    /// removes everything before the point at `time` of the segment whose token is at `index`
    void cutAtBeginning(std::size_t index, double time);
    /// removes everything after the point at `time` of the segment whose token is at `index`
    void cutAtEnd(std::size_t index, double time);

    /// outline of the (closed) path moved outward by `padding`
    [[nodiscard]] Path pad(double padding) const;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const Path& other) const;

private:
    void requireRigid(std::string_view operation) const;
    void appendPoint(PathPoint point);
    [[nodiscard]] std::optional<Coordinate> currentPoint() const;
};

} // namespace gd

template<>
struct fmt::formatter<gd::Path> {
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const gd::Path& path, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}", path.toString());
    }
};

#endif // GD_PATH_HPP
