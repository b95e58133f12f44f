#include <gd/algorithm/force/QuadTree.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <gd/Error.hpp>

namespace gd::force {

bool QuadTree::Cell::containsParticle(const Particle& particle) const noexcept {
    return particle.pos.x >= x && particle.pos.x <= x + width && particle.pos.y >= y && particle.pos.y <= y + height;
}

void QuadTree::Cell::createSubcells() {
    subcells.reserve(4UZ);
    for (double sx : {x, x + width / 2.0}) {
        for (double sy : {y, y + height / 2.0}) {
            subcells.push_back(Cell{.x = sx, .y = sy, .width = width / 2.0, .height = height / 2.0, .maxParticles = maxParticles, .subcells = {}, .particles = {}, .centerOfMass = std::nullopt, .mass = 0.0});
        }
    }
}

QuadTree::Cell& QuadTree::Cell::findSubcell(const Particle& particle) {
    auto it = std::ranges::find_if(subcells, [&particle](const Cell& cell) { return cell.containsParticle(particle); });
    if (it == subcells.end()) {
        throw gd::exception(fmt::format("failed to find a cell for particle {}", particle.pos));
    }
    return *it;
}

void QuadTree::Cell::insert(Particle particle) {
    auto existing = std::ranges::find_if(particles, [&particle](const Particle& other) { return other.pos == particle.pos; });
    if (existing != particles.end()) {
        existing->subparticles.push_back(std::move(particle));
    } else if (subcells.empty() && particles.size() < maxParticles) {
        particles.push_back(std::move(particle));
    } else {
        if (subcells.empty()) {
            createSubcells();
        }
        for (Particle& moved : particles) {
            findSubcell(moved).insert(std::move(moved));
        }
        particles.clear();
        findSubcell(particle).insert(std::move(particle));
    }
    updateMass();
    updateCenterOfMass();
}

void QuadTree::Cell::updateMass() noexcept {
    mass = 0.0;
    if (subcells.empty()) {
        for (const Particle& p : particles) {
            mass += p.mass;
            for (const Particle& sp : p.subparticles) {
                mass += sp.mass;
            }
        }
    } else {
        for (const Cell& c : subcells) {
            mass += c.mass;
        }
    }
}

void QuadTree::Cell::updateCenterOfMass() noexcept {
    Coordinate weighted;
    if (subcells.empty()) {
        for (const Particle& p : particles) {
            for (const Particle& sp : p.subparticles) {
                weighted += sp.pos * sp.mass;
            }
            weighted += p.pos * p.mass;
        }
    } else {
        for (const Cell& c : subcells) {
            if (c.centerOfMass) {
                weighted += *c.centerOfMass * c.mass;
            }
        }
    }
    centerOfMass = mass > 0.0 ? std::optional<Coordinate>(weighted / mass) : std::nullopt;
}

QuadTree::QuadTree(double x, double y, double width, double height, std::size_t maxParticles) : _root{.x = x, .y = y, .width = width, .height = height, .maxParticles = maxParticles, .subcells = {}, .particles = {}, .centerOfMass = std::nullopt, .mass = 0.0} {}

std::vector<const QuadTree::Cell*> QuadTree::findInteractionCells(const Particle& particle, const InteractionTest& test) const {
    std::vector<const Cell*> cells;
    std::vector<const Cell*> stack{&_root};
    while (!stack.empty()) {
        const Cell* cell = stack.back();
        stack.pop_back();
        if (cell->subcells.empty() || !test || test(*cell, particle)) {
            cells.push_back(cell);
            continue;
        }
        for (auto it = cell->subcells.rbegin(); it != cell->subcells.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
    return cells;
}

bool QuadTree::barnesHutCriterion(const Cell& cell, const Particle& particle) noexcept {
    if (!cell.centerOfMass) {
        return true;
    }
    const double d = distance(particle.pos, *cell.centerOfMass);
    return cell.width / d <= kBarnesHutTheta;
}

} // namespace gd::force
