#ifndef GD_ALGORITHM_FORCE_QUADTREE_HPP
#define GD_ALGORITHM_FORCE_QUADTREE_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include <gd/Coordinate.hpp>
#include <gd/Identifiers.hpp>

namespace gd::force {

/**
 * @brief Barnes–Hut quadtree over weighted particles.
 *
 * A leaf cell holds up to `maxParticles` particles; particles that coincide with one already stored become its
 * subparticles. Every cell knows its total mass and centre of mass.
 */
class QuadTree {
public:
    struct Particle {
        Coordinate                pos;
        double                    mass = 1.0;
        std::optional<VertexId>   vertex;
        std::vector<Particle>     subparticles;
    };

    struct Cell {
        double                    x;
        double                    y;
        double                    width;
        double                    height;
        std::size_t               maxParticles = 1UZ;
        std::vector<Cell>         subcells;
        std::vector<Particle>     particles;
        std::optional<Coordinate> centerOfMass;
        double                    mass = 0.0;

        [[nodiscard]] bool containsParticle(const Particle& particle) const noexcept;
        void               insert(Particle particle);

    private:
        void  createSubcells();
        Cell& findSubcell(const Particle& particle);
        void  updateMass() noexcept;
        void  updateCenterOfMass() noexcept;

        friend class QuadTree;
    };

    /// decides whether a cell is far enough from the particle to be treated as a whole
    using InteractionTest = std::function<bool(const Cell& cell, const Particle& particle)>;

    static constexpr double kBarnesHutTheta = 1.2;

private:
    Cell _root;

public:
    QuadTree(double x, double y, double width, double height, std::size_t maxParticles = 1UZ);

    void insert(Particle particle) { _root.insert(std::move(particle)); }

    /// leaf cells and cells accepted by `test`, whichever is reached first on the way down
    [[nodiscard]] std::vector<const Cell*> findInteractionCells(const Particle& particle, const InteractionTest& test = {}) const;

    [[nodiscard]] const Cell& root() const noexcept { return _root; }

    /// `width / distance(particle, centre of mass) <= theta`
    [[nodiscard]] static bool barnesHutCriterion(const Cell& cell, const Particle& particle) noexcept;
};

} // namespace gd::force

#endif // GD_ALGORITHM_FORCE_QUADTREE_HPP
