#include <gd/Vertex.hpp>

#include <charconv>
#include <cmath>
#include <numbers>

namespace gd {

namespace {

[[nodiscard]] std::optional<Coordinate> compassPoint(std::string_view name, const BoundingBox& b) {
    if (name == "north") {
        return Coordinate{(b.minX + b.maxX) / 2.0, b.maxY};
    } else if (name == "south") {
        return Coordinate{(b.minX + b.maxX) / 2.0, b.minY};
    } else if (name == "east") {
        return Coordinate{b.maxX, (b.minY + b.maxY) / 2.0};
    } else if (name == "west") {
        return Coordinate{b.minX, (b.minY + b.maxY) / 2.0};
    } else if (name == "north west") {
        return Coordinate{b.minX, b.maxY};
    } else if (name == "north east") {
        return Coordinate{b.maxX, b.maxY};
    } else if (name == "south west") {
        return Coordinate{b.minX, b.minY};
    } else if (name == "south east") {
        return Coordinate{b.maxX, b.minY};
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<double> parseAngle(std::string_view name) {
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
    if (ec != std::errc{} || ptr != name.data() + name.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<Coordinate> Vertex::anchor(std::string_view anchorName) {
    if (auto it = anchors.find(anchorName); it != anchors.end() && it->second) {
        return it->second;
    }
    const Coordinate center = anchors.contains("center") && anchors.at("center") ? *anchors.at("center") : Coordinate{};

    std::optional<Coordinate> target = compassPoint(anchorName, boundingBox());
    if (!target) {
        if (auto angle = parseAngle(anchorName)) {
            const BoundingBox b = boundingBox();
            const double      r = std::max(b.width(), b.height());
            target              = Coordinate{r * std::cos(*angle / 180.0 * std::numbers::pi), r * std::sin(*angle / 180.0 * std::numbers::pi)} + center;
        }
    }
    if (!target) {
        return std::nullopt;
    }

    const Path                              ray{PathOp::moveto, center, PathOp::lineto, *target};
    const std::vector<Path::Intersection> hits = ray.intersectionsWith(path);
    std::optional<Coordinate>               result;
    if (!hits.empty()) {
        result = hits.front().point;
    }
    anchors.insert_or_assign(std::string(anchorName), result);
    return result;
}

} // namespace gd
