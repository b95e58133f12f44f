#include <gd/Path.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <unordered_map>

#include <magic_enum.hpp>

#include <gd/Bezier.hpp>
#include <gd/Error.hpp>
#include <gd/meta/utils.hpp>

namespace gd {

namespace {

constexpr double kEps = 0.0001;

[[nodiscard]] constexpr std::size_t arity(PathOp op) noexcept {
    switch (op) {
    case PathOp::moveto:
    case PathOp::lineto: return 1UZ;
    case PathOp::curveto: return 3UZ;
    case PathOp::closepath: return 0UZ;
    }
    return 0UZ;
}

[[nodiscard]] bool isOp(const PathElement& e, PathOp op) noexcept {
    const auto* p = std::get_if<PathOp>(&e);
    return p != nullptr && *p == op;
}

[[nodiscard]] bool isPoint(const PathElement& e) noexcept { return !std::holds_alternative<PathOp>(e); }

[[nodiscard]] PathPoint toPoint(const PathElement& e) {
    if (const auto* c = std::get_if<Coordinate>(&e)) {
        return *c;
    }
    if (const auto* d = std::get_if<DeferredCoordinate>(&e)) {
        return *d;
    }
    throw gd::exception("path element is not a point");
}

[[nodiscard]] Coordinate rigidElement(const PathElement& e) { return rigid(toPoint(e)); }

[[nodiscard]] PathElement toElement(PathPoint p) {
    return std::visit([](auto&& v) -> PathElement { return std::forward<decltype(v)>(v); }, std::move(p));
}

[[nodiscard]] BoundingBox merge(const BoundingBox& a, const BoundingBox& b) noexcept { return {std::min(a.minX, b.minX), std::min(a.minY, b.minY), std::max(a.maxX, b.maxX), std::max(a.maxY, b.maxY), 0.0, 0.0}; }

[[nodiscard]] bool boxesIntersect(const BoundingBox& a, const BoundingBox& b) noexcept {
    constexpr double tolerance = kEps * kEps;
    return a.maxX >= b.minX - tolerance && a.minX <= b.maxX + tolerance && a.maxY >= b.minY - tolerance && a.minY <= b.maxY + tolerance;
}

struct Cubic {
    Coordinate a, b, c, d;

    [[nodiscard]] BoundingBox box() const noexcept { return boundingBox(std::array{a, b, c, d}); }

    [[nodiscard]] std::pair<Cubic, Cubic> split() const noexcept {
        const bezier::CurvePoint mid = bezier::atTime(a, b, c, d, 0.5);
        return {Cubic{a, (a + b) / 2.0, mid.left, mid.point}, Cubic{mid.point, mid.right, (c + d) / 2.0, d}};
    }

    static Cubic fromLine(const Coordinate& from, const Coordinate& to) noexcept { return {from, from * (2.0 / 3.0) + to * (1.0 / 3.0), from * (1.0 / 3.0) + to * (2.0 / 3.0), to}; }
};

void intersectCurves(double t0, double t1, const Cubic& c1, const Cubic& c2, std::vector<Path::Intersection>& result) {
    const BoundingBox box1 = c1.box();
    const BoundingBox box2 = c2.box();
    if (!(box1.maxX >= box2.minX && box1.minX <= box2.maxX && box1.maxY >= box2.minY && box1.minY <= box2.maxY)) {
        return;
    }
    if (box1.width() < kEps && box1.height() < kEps) {
        // c1 has collapsed to (almost) a line; intersect its chord with the chord of c2
        const double a   = c2.d.x - c2.a.x;
        const double b   = c1.a.x - c1.d.x;
        const double c   = c2.a.x - c1.a.x;
        const double d   = c2.d.y - c2.a.y;
        const double e   = c1.a.y - c1.d.y;
        const double f   = c2.a.y - c1.a.y;
        const double det = a * e - b * d;
        const double t   = det == 0.0 ? 0.0 : std::clamp((c * d - a * f) / det, 0.0, 1.0);
        result.push_back({t0 + t * (t1 - t0), 0UZ, Coordinate{c1.a.x + t * (c1.d.x - c1.a.x), c1.a.y + t * (c1.d.y - c1.a.y)}});
        return;
    }
    const auto [c1Left, c1Right] = c1.split();
    const auto [c2Left, c2Right] = c2.split();
    const double tm              = (t0 + t1) / 2.0;
    intersectCurves(t0, tm, c1Left, c2Left, result);
    intersectCurves(t0, tm, c1Left, c2Right, result);
    intersectCurves(tm, t1, c1Right, c2Left, result);
    intersectCurves(tm, t1, c1Right, c2Right, result);
}

[[nodiscard]] std::vector<Path::Intersection> intersectSegments(const Path::Segment& s1, const Path::Segment& s2) {
    std::vector<Path::Intersection> result;
    if (s1.action == PathOp::lineto && s2.action == PathOp::lineto) {
        const double a   = s2.to.x - s2.from.x;
        const double b   = s1.from.x - s1.to.x;
        const double c   = s2.from.x - s1.from.x;
        const double d   = s2.to.y - s2.from.y;
        const double e   = s1.from.y - s1.to.y;
        const double f   = s2.from.y - s1.from.y;
        const double det = a * e - b * d;
        if (std::abs(det) > kEps * kEps) {
            const double t = (c * d - a * f) / det;
            const double s = (b * f - e * c) / det;
            if (t >= 0.0 && t <= 1.0 && s >= 0.0 && s <= 1.0) {
                Coordinate p = s1.from;
                p.moveTowards(s1.to, t);
                result.push_back({t, 0UZ, p});
            }
        }
        return result;
    }
    const Cubic c1 = s1.action == PathOp::lineto ? Cubic::fromLine(s1.from, s1.to) : Cubic{s1.from, s1.support1, s1.support2, s1.to};
    const Cubic c2 = s2.action == PathOp::lineto ? Cubic::fromLine(s2.from, s2.to) : Cubic{s2.from, s2.support1, s2.support2, s2.to};
    intersectCurves(0.0, 1.0, c1, c2, result);
    return result;
}

/// bounding boxes of segment ranges [i, j], filled on demand by bisection
class RangeBoxes {
    const std::vector<Path::Segment>&                  _segments;
    std::unordered_map<std::uint64_t, BoundingBox>     _memo;

public:
    explicit RangeBoxes(const std::vector<Path::Segment>& segments) : _segments(segments) {}

    const BoundingBox& operator()(std::size_t i, std::size_t j) {
        if (i == j) {
            return _segments[i].box;
        }
        const std::uint64_t key = (static_cast<std::uint64_t>(i) << 32U) | static_cast<std::uint64_t>(j);
        if (auto it = _memo.find(key); it != _memo.end()) {
            return it->second;
        }
        const std::size_t mid = (i + j) / 2UZ;
        const BoundingBox box = merge((*this)(i, mid), (*this)(mid + 1UZ, j));
        return _memo.emplace(key, box).first->second;
    }
};

} // namespace

Coordinate rigid(const PathPoint& point) {
    return std::visit(meta::overloaded{[](const Coordinate& c) { return c; },
                          [](const DeferredCoordinate& d) {
                              if (!d.resolve) {
                                  throw gd::exception("deferred coordinate without resolver");
                              }
                              return d.resolve();
                          }},
        point);
}

Path::Path(std::initializer_list<PathElement> init) {
    std::size_t pending = 0UZ;
    for (const PathElement& e : init) {
        if (const auto* op = std::get_if<PathOp>(&e)) {
            if (pending != 0UZ) {
                throw gd::exception(fmt::format("ill-formed path: '{}' where {} more point(s) are expected", magic_enum::enum_name(*op), pending));
            }
            pending = arity(*op);
            _elements.push_back(e);
        } else {
            if (pending == 0UZ) {
                _elements.emplace_back(PathOp::lineto);
            } else {
                --pending;
            }
            _elements.push_back(e);
        }
    }
    if (pending != 0UZ) {
        throw gd::exception(fmt::format("ill-formed path: {} trailing point(s) missing", pending));
    }
}

void Path::appendPoint(PathPoint point) { _elements.push_back(toElement(std::move(point))); }

void Path::appendMoveto(PathPoint point) {
    _elements.emplace_back(PathOp::moveto);
    appendPoint(std::move(point));
}

void Path::appendLineto(PathPoint point) {
    _elements.emplace_back(PathOp::lineto);
    appendPoint(std::move(point));
}

void Path::appendCurveto(PathPoint support1, PathPoint support2, PathPoint to) {
    _elements.emplace_back(PathOp::curveto);
    appendPoint(std::move(support1));
    appendPoint(std::move(support2));
    appendPoint(std::move(to));
}

void Path::appendClosepath() { _elements.emplace_back(PathOp::closepath); }

std::optional<Coordinate> Path::currentPoint() const {
    for (auto it = _elements.rbegin(); it != _elements.rend(); ++it) {
        if (isOp(*it, PathOp::closepath)) {
            // the current point after a closepath is the start of the closed sub-path
            for (auto back = it; back != _elements.rend(); ++back) {
                if (isOp(*back, PathOp::moveto) && back != _elements.rbegin()) {
                    return rigidElement(*std::prev(back));
                }
            }
            return std::nullopt;
        }
        if (isPoint(*it)) {
            return rigidElement(*it);
        }
    }
    return std::nullopt;
}

void Path::appendArc(double startAngle, double endAngle, double radius) {
    const std::optional<Coordinate> start = currentPoint();
    if (!start) {
        throw gd::exception("appendArc needs a current point");
    }
    constexpr double toRadians = std::numbers::pi / 180.0;
    const double     a0        = startAngle * toRadians;
    const double     a1        = endAngle * toRadians;
    const Coordinate center    = *start - Coordinate{radius * std::cos(a0), radius * std::sin(a0)};

    // at most a quarter turn per curve, with a little slack for rounded multiples of 90 degrees
    const auto   pieces = static_cast<std::size_t>(std::max(1.0, std::ceil(std::abs(a1 - a0) / (std::numbers::pi / 2.0) - 1e-9)));
    const double step   = (a1 - a0) / static_cast<double>(pieces);
    const double k      = 4.0 / 3.0 * std::tan(step / 4.0);
    for (std::size_t i = 0UZ; i < pieces; ++i) {
        const double     from = a0 + static_cast<double>(i) * step;
        const double     to   = from + step;
        const Coordinate p0   = center + Coordinate{radius * std::cos(from), radius * std::sin(from)};
        const Coordinate p3   = center + Coordinate{radius * std::cos(to), radius * std::sin(to)};
        const Coordinate s1   = p0 + Coordinate{-std::sin(from), std::cos(from)} * (k * radius);
        const Coordinate s2   = p3 - Coordinate{-std::sin(to), std::cos(to)} * (k * radius);
        appendCurveto(s1, s2, p3);
    }
}

Path Path::reversed() const {
    struct Step {
        PathOp    action;
        PathPoint from;
        PathPoint to;
        PathPoint support1;
        PathPoint support2;
    };
    struct Subpath {
        PathPoint         start;
        std::vector<Step> steps;
    };

    std::vector<Subpath>     subpaths;
    std::optional<Subpath>   current;
    std::optional<PathPoint> prev;
    std::optional<PathPoint> start;

    auto finish = [&] {
        if (current) {
            subpaths.push_back(std::move(*current));
            current.reset();
        }
    };

    for (std::size_t i = 0UZ; i < _elements.size();) {
        const auto* op = std::get_if<PathOp>(&_elements[i]);
        if (op == nullptr) {
            throw gd::exception(fmt::format("illegal path element at {}", i));
        }
        switch (*op) {
        case PathOp::moveto:
            finish();
            prev    = toPoint(_elements[i + 1UZ]);
            start   = prev;
            current = Subpath{*prev, {}};
            i += 2UZ;
            break;
        case PathOp::lineto:
            if (current && prev) {
                current->steps.push_back({PathOp::lineto, *prev, toPoint(_elements[i + 1UZ]), {}, {}});
            }
            prev = toPoint(_elements[i + 1UZ]);
            i += 2UZ;
            break;
        case PathOp::closepath:
            if (current && prev && start) {
                current->steps.push_back({PathOp::closepath, *prev, *start, {}, {}});
            }
            prev.reset();
            start.reset();
            finish();
            i += 1UZ;
            break;
        case PathOp::curveto:
            if (current && prev) {
                current->steps.push_back({PathOp::curveto, *prev, toPoint(_elements[i + 3UZ]), toPoint(_elements[i + 1UZ]), toPoint(_elements[i + 2UZ])});
            }
            prev = toPoint(_elements[i + 3UZ]);
            i += 4UZ;
            break;
        }
    }
    finish();

    Path result;
    for (const Subpath& subpath : subpaths) {
        if (subpath.steps.empty()) {
            result.appendMoveto(subpath.start);
            continue;
        }
        result.appendMoveto(subpath.steps.back().to);
        for (auto it = subpath.steps.rbegin(); it != subpath.steps.rend(); ++it) {
            if (it->action == PathOp::curveto) {
                result.appendCurveto(it->support2, it->support1, it->from);
            } else {
                result.appendLineto(it->from);
            }
        }
        if (subpath.steps.back().action == PathOp::closepath) {
            result.appendClosepath();
        }
    }
    return result;
}

Path& Path::transform(const Transform& t) {
    for (PathElement& e : _elements) {
        if (auto* c = std::get_if<Coordinate>(&e)) {
            c->apply(t);
        }
    }
    return *this;
}

Path& Path::shift(double dx, double dy) {
    for (PathElement& e : _elements) {
        if (auto* c = std::get_if<Coordinate>(&e)) {
            c->shift(dx, dy);
        }
    }
    return *this;
}

Path& Path::makeRigid() {
    for (PathElement& e : _elements) {
        if (const auto* d = std::get_if<DeferredCoordinate>(&e)) {
            e = rigid(*d);
        }
    }
    return *this;
}

bool Path::isRigid() const noexcept {
    return std::ranges::none_of(_elements, [](const PathElement& e) { return std::holds_alternative<DeferredCoordinate>(e); });
}

void Path::requireRigid(std::string_view operation) const {
    if (!isRigid()) {
        throw gd::exception(fmt::format("{} needs a rigid path, call makeRigid() first", operation));
    }
}

std::vector<Coordinate> Path::coordinates() const {
    std::vector<Coordinate> result;
    for (const PathElement& e : _elements) {
        if (const auto* c = std::get_if<Coordinate>(&e)) {
            result.push_back(*c);
        }
    }
    return result;
}

BoundingBox Path::boundingBox() const {
    requireRigid("boundingBox");
    return gd::boundingBox(coordinates());
}

std::vector<Path::Segment> Path::segmentize() const {
    requireRigid("segmentize");
    std::vector<Segment>      segments;
    std::optional<Coordinate> prev;
    std::optional<Coordinate> start;

    const auto point = [this](std::size_t i) { return std::get<Coordinate>(_elements.at(i)); };
    for (std::size_t i = 0UZ; i < _elements.size();) {
        const auto* op = std::get_if<PathOp>(&_elements[i]);
        if (op == nullptr) {
            throw gd::exception(fmt::format("illegal path element at {}", i));
        }
        switch (*op) {
        case PathOp::lineto: {
            const Coordinate to = point(i + 1UZ);
            if (prev) {
                segments.push_back({PathOp::lineto, i, *prev, to, {}, {}, gd::boundingBox(std::array{*prev, to})});
            }
            prev = to;
            i += 2UZ;
        } break;
        case PathOp::moveto:
            prev  = point(i + 1UZ);
            start = prev;
            i += 2UZ;
            break;
        case PathOp::closepath:
            if (prev && start) {
                segments.push_back({PathOp::lineto, i, *prev, *start, {}, {}, gd::boundingBox(std::array{*prev, *start})});
            }
            prev.reset();
            start.reset();
            i += 1UZ;
            break;
        case PathOp::curveto: {
            const Coordinate s1 = point(i + 1UZ);
            const Coordinate s2 = point(i + 2UZ);
            const Coordinate to = point(i + 3UZ);
            if (prev) {
                segments.push_back({PathOp::curveto, i, *prev, to, s1, s2, gd::boundingBox(std::array{*prev, s1, s2, to})});
            }
            prev = to;
            i += 4UZ;
        } break;
        }
    }
    return segments;
}

std::vector<Path::Intersection> Path::intersectionsWith(const Path& other) const {
    const std::vector<Segment> p1 = segmentize();
    const std::vector<Segment> p2 = other.segmentize();
    if (p1.empty() || p2.empty()) {
        return {};
    }
    RangeBoxes boxes1(p1);
    RangeBoxes boxes2(p2);

    std::vector<Intersection> intersections;
    auto                      intersect = [&](auto& self, std::size_t i1, std::size_t j1, std::size_t i2, std::size_t j2) -> void {
        if (!boxesIntersect(boxes1(i1, j1), boxes2(i2, j2))) {
            return;
        }
        if (i1 == j1 && i2 == j2) {
            for (Intersection hit : intersectSegments(p1[i1], p2[i2])) {
                hit.index = p1[i1].pathPos;
                intersections.push_back(hit);
            }
        } else if (i1 == j1) {
            const std::size_t m2 = (i2 + j2) / 2UZ;
            self(self, i1, j1, i2, m2);
            self(self, i1, j1, m2 + 1UZ, j2);
        } else if (i2 == j2) {
            const std::size_t m1 = (i1 + j1) / 2UZ;
            self(self, i1, m1, i2, j2);
            self(self, m1 + 1UZ, j1, i2, j2);
        } else {
            const std::size_t m1 = (i1 + j1) / 2UZ;
            const std::size_t m2 = (i2 + j2) / 2UZ;
            self(self, i1, m1, i2, m2);
            self(self, m1 + 1UZ, j1, i2, m2);
            self(self, i1, m1, m2 + 1UZ, j2);
            self(self, m1 + 1UZ, j1, m2 + 1UZ, j2);
        }
    };
    intersect(intersect, 0UZ, p1.size() - 1UZ, 0UZ, p2.size() - 1UZ);

    std::ranges::sort(intersections, [](const Intersection& a, const Intersection& b) { return a.index < b.index || (a.index == b.index && a.time < b.time); });

    std::vector<Intersection> remains;
    for (const Intersection& next : intersections) {
        if (remains.empty() || std::abs(next.point.x - remains.back().point.x) + std::abs(next.point.y - remains.back().point.y) > kEps) {
            remains.push_back(next);
        }
    }
    return remains;
}

void Path::cutAtBeginning(std::size_t index, double time) {
    requireRigid("cutAtBeginning");
    if (index == 0UZ || index >= _elements.size() || !isPoint(_elements[index - 1UZ])) {
        throw gd::exception("segment before intersection does not end with a coordinate");
    }
    const auto point = [this](std::size_t i) { return std::get<Coordinate>(_elements.at(i)); };
    Coordinate from  = point(index - 1UZ);

    std::vector<PathElement> cut;
    switch (std::get<PathOp>(_elements[index])) {
    case PathOp::lineto: {
        from.moveTowards(point(index + 1UZ), time);
        cut = {PathOp::moveto, from};
        cut.insert(cut.end(), _elements.begin() + static_cast<std::ptrdiff_t>(index), _elements.end());
    } break;
    case PathOp::curveto: {
        Coordinate s1 = point(index + 1UZ);
        Coordinate s2 = point(index + 2UZ);
        Coordinate to = point(index + 3UZ);
        from.moveTowards(s1, time);
        s1.moveTowards(s2, time);
        s2.moveTowards(to, time);
        from.moveTowards(s1, time);
        s1.moveTowards(s2, time);
        from.moveTowards(s1, time);
        cut = {PathOp::moveto, from, PathOp::curveto, s1, s2, to};
        cut.insert(cut.end(), _elements.begin() + static_cast<std::ptrdiff_t>(index + 4UZ), _elements.end());
    } break;
    case PathOp::closepath: {
        const auto moveto = std::find_if(std::make_reverse_iterator(_elements.begin() + static_cast<std::ptrdiff_t>(index)), _elements.rend(), [](const PathElement& e) { return isOp(e, PathOp::moveto); });
        if (moveto == _elements.rend()) {
            throw gd::exception("no moveto found in path");
        }
        const Coordinate to = std::get<Coordinate>(*std::prev(moveto));
        from.moveTowards(to, time);
        cut = {PathOp::moveto, from, PathOp::lineto, to};
        cut.insert(cut.end(), _elements.begin() + static_cast<std::ptrdiff_t>(index + 1UZ), _elements.end());
    } break;
    case PathOp::moveto: throw gd::exception("cannot cut a path at a moveto");
    }
    _elements = std::move(cut);
}

void Path::cutAtEnd(std::size_t index, double time) {
    requireRigid("cutAtEnd");
    if (index == 0UZ || index >= _elements.size() || !isPoint(_elements[index - 1UZ])) {
        throw gd::exception("segment before intersection does not end with a coordinate");
    }
    const auto       point = [this](std::size_t i) { return std::get<Coordinate>(_elements.at(i)); };
    const Coordinate from  = point(index - 1UZ);

    std::vector<PathElement> cut(_elements.begin(), _elements.begin() + static_cast<std::ptrdiff_t>(index + 1UZ));
    switch (std::get<PathOp>(_elements[index])) {
    case PathOp::lineto: {
        Coordinate to = point(index + 1UZ);
        to.moveTowards(from, 1.0 - time);
        cut.emplace_back(to);
    } break;
    case PathOp::curveto: {
        Coordinate s1 = point(index + 1UZ);
        Coordinate s2 = point(index + 2UZ);
        Coordinate to = point(index + 3UZ);
        to.moveTowards(s2, 1.0 - time);
        s2.moveTowards(s1, 1.0 - time);
        s1.moveTowards(from, 1.0 - time);
        to.moveTowards(s2, 1.0 - time);
        s2.moveTowards(s1, 1.0 - time);
        to.moveTowards(s2, 1.0 - time);
        cut.emplace_back(s1);
        cut.emplace_back(s2);
        cut.emplace_back(to);
    } break;
    case PathOp::closepath: {
        const auto moveto = std::find_if(std::make_reverse_iterator(_elements.begin() + static_cast<std::ptrdiff_t>(index)), _elements.rend(), [](const PathElement& e) { return isOp(e, PathOp::moveto); });
        if (moveto == _elements.rend()) {
            throw gd::exception("no moveto found in path");
        }
        Coordinate to = std::get<Coordinate>(*std::prev(moveto));
        to.moveTowards(from, 1.0 - time);
        cut.back() = PathOp::lineto;
        cut.emplace_back(to);
    } break;
    case PathOp::moveto: throw gd::exception("cannot cut a path at a moveto");
    }
    _elements = std::move(cut);
}

Path Path::pad(double padding) const {
    Path padded = *this;
    padded.makeRigid();
    if (padding == 0.0) {
        return padded;
    }

    struct Subpath {
        std::vector<std::size_t>   points; // element indices, wrapped around by two at the end
        std::size_t                startIndex = 0UZ;
        std::size_t                endIndex   = 0UZ;
        std::optional<std::size_t> skipped;
    };
    const auto coordinate = [&padded](std::size_t i) -> Coordinate& { return std::get<Coordinate>(padded._elements[i]); };

    std::vector<Subpath> subpaths;
    Subpath              current;
    std::size_t          startIndex = 0UZ;
    const auto           closeSubpath = [&](std::size_t endIndex) {
        if (current.points.empty()) {
            return;
        }
        current.startIndex = startIndex;
        current.endIndex   = endIndex;
        startIndex         = endIndex + 1UZ;
        if (current.points.size() >= 2UZ) {
            std::size_t first = 0UZ;
            if ((coordinate(current.points.back()) - coordinate(current.points.front())).norm() < 0.01 && current.points.size() > 2UZ) {
                first           = 1UZ;
                current.skipped = current.points.front();
            }
            current.points.push_back(current.points[first]);
            current.points.push_back(current.points[first + 1UZ]);
            subpaths.push_back(std::move(current));
        }
        current = {};
    };
    for (std::size_t i = 0UZ; i < padded._elements.size(); ++i) {
        if (isOp(padded._elements[i], PathOp::closepath)) {
            closeSubpath(i);
        } else if (isPoint(padded._elements[i])) {
            current.points.push_back(i);
        }
    }
    closeSubpath(padded._elements.size() - 1UZ);

    for (const Subpath& subpath : subpaths) {
        std::vector<Coordinate> pts;
        pts.reserve(subpath.points.size());
        for (std::size_t idx : subpath.points) {
            pts.push_back(coordinate(idx));
        }
        const std::size_t m = pts.size();

        int count = 0; // winding direction
        for (std::size_t i = 0UZ; i + 2UZ < m; ++i) {
            const Coordinate d2   = pts[i + 1UZ] - pts[i];
            const Coordinate d1   = pts[i + 2UZ] - pts[i + 1UZ];
            const double     diff = std::atan2(d2.y, d2.x) - std::atan2(d1.y, d1.x);
            if (diff < -std::numbers::pi) {
                ++count;
            } else if (diff > std::numbers::pi) {
                --count;
            }
        }

        std::vector<Coordinate> moved(m);
        for (std::size_t i = 1UZ; i + 1UZ < m; ++i) {
            Coordinate orth1 = Coordinate{-(pts[i] - pts[i - 1UZ]).y, (pts[i] - pts[i - 1UZ]).x}.normalized();
            Coordinate orth2 = Coordinate{-(pts[i + 1UZ] - pts[i]).y, (pts[i + 1UZ] - pts[i]).x}.normalized();
            if (count < 0) {
                orth1.scale(-1.0);
                orth2.scale(-1.0);
            }
            const double det = orth1.x * orth2.y - orth1.y * orth2.x;
            Coordinate   offset;
            if (std::abs(det) < 0.1) {
                offset = (orth1 + orth2) * (padding / 2.0);
            } else {
                offset = Coordinate{padding * (orth2.y - orth1.y) / det, padding * (orth1.x - orth2.x) / det};
            }
            moved[i] = offset + pts[i];
        }
        for (std::size_t i = 1UZ; i + 1UZ < m; ++i) {
            coordinate(subpath.points[i]) = moved[i];
        }
        if (subpath.skipped) {
            coordinate(*subpath.skipped) = moved[m - 3UZ];
        }

        for (std::size_t i = subpath.startIndex; i <= subpath.endIndex && i < _elements.size(); ++i) {
            if (!isOp(_elements[i], PathOp::curveto) || i == 0UZ) {
                continue;
            }
            const Coordinate         from = rigidElement(_elements[i - 1UZ]);
            const Coordinate         s1   = rigidElement(_elements[i + 1UZ]);
            const Coordinate         s2   = rigidElement(_elements[i + 2UZ]);
            const Coordinate         to   = rigidElement(_elements[i + 3UZ]);
            const bezier::CurvePoint at1  = bezier::atTime(from, s1, s2, to, 1.0 / 3.0);
            const bezier::CurvePoint at2  = bezier::atTime(from, s1, s2, to, 2.0 / 3.0);
            Coordinate               orth1 = Coordinate{at1.point.y - at1.left.y, -(at1.point.x - at1.left.x)}.normalized() * -padding;
            Coordinate               orth2 = Coordinate{at2.point.y - at2.right.y, -(at2.point.x - at2.right.x)}.normalized() * padding;
            if (count < 0) {
                orth1.scale(-1.0);
                orth2.scale(-1.0);
            }
            const auto [newS1, newS2] = bezier::supportsForPointsAtTime(coordinate(i - 1UZ), at1.point + orth1, 1.0 / 3.0, at2.point + orth2, 2.0 / 3.0, coordinate(i + 3UZ));
            coordinate(i + 1UZ) = newS1;
            coordinate(i + 2UZ) = newS2;
        }
    }
    return padded;
}

std::string Path::toString() const {
    std::string result;
    for (std::size_t i = 0UZ; i < _elements.size(); ++i) {
        const auto* op = std::get_if<PathOp>(&_elements[i]);
        if (op == nullptr) {
            throw gd::exception("illegal path command");
        }
        switch (*op) {
        case PathOp::lineto:
            result += fmt::format(" -- {}", rigidElement(_elements[i + 1UZ]));
            i += 1UZ;
            break;
        case PathOp::moveto:
            result += fmt::format(" {}", rigidElement(_elements[i + 1UZ]));
            i += 1UZ;
            break;
        case PathOp::curveto:
            result += fmt::format(" .. controls {} and {} .. {}", rigidElement(_elements[i + 1UZ]), rigidElement(_elements[i + 2UZ]), rigidElement(_elements[i + 3UZ]));
            i += 3UZ;
            break;
        case PathOp::closepath: result += " -- cycle"; break;
        }
    }
    return result;
}

bool Path::operator==(const Path& other) const {
    return std::ranges::equal(_elements, other._elements, [](const PathElement& a, const PathElement& b) {
        if (const auto* opA = std::get_if<PathOp>(&a)) {
            const auto* opB = std::get_if<PathOp>(&b);
            return opB != nullptr && *opA == *opB;
        }
        const auto* cA = std::get_if<Coordinate>(&a);
        const auto* cB = std::get_if<Coordinate>(&b);
        return cA != nullptr && cB != nullptr && *cA == *cB;
    });
}

} // namespace gd
