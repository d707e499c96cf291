/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef QUADTREE_HPP
#define QUADTREE_HPP

#include "spatial/EntityStorage.hpp"
#include "spatial/Rectangle.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <vector>

namespace Formicary {

/**
 * @brief Point quadtree over entity positions.
 *
 * A node is either a leaf holding up to `capacity` entities or a divided
 * node owning exactly four children (NW, NE, SW, SE), never both. A leaf
 * at capacity subdivides on the next insert and pushes its points down.
 * Subdivision is permanent: removals never merge children back, only
 * clear() returns the node to an empty leaf. Callers rebalance by clearing
 * and reinserting (see World::update).
 *
 * Nodes at MAX_DEPTH stop subdividing and grow past capacity, which keeps
 * recursion bounded when many entities share a single position.
 */
class Quadtree : public EntityStorage {
public:
    static constexpr size_t DEFAULT_CAPACITY = 4;
    static constexpr int DEFAULT_MAX_DEPTH = 16;

    Quadtree(const Rectangle& boundary, size_t capacity = DEFAULT_CAPACITY,
             int maxDepth = DEFAULT_MAX_DEPTH);
    // A node that already sits `depth` levels below the root
    Quadtree(const Rectangle& boundary, size_t capacity, int maxDepth, int depth);
    ~Quadtree() override = default;

    Quadtree(const Quadtree&) = delete;
    Quadtree& operator=(const Quadtree&) = delete;

    bool insert(Entity* entity) override;
    Entity* remove(Entity* entity) override;
    void clear() override;
    void query(const Rectangle& range, std::vector<Entity*>& found) const override;
    using EntityStorage::query;

    const Rectangle& getBoundary() const { return m_boundary; }
    size_t getCapacity() const { return m_capacity; }
    bool isDivided() const { return m_divided; }

    // Statistics and debugging
    size_t size() const;
    size_t nodeCount() const;
    int maxDepth() const;
    void logStatistics() const;

private:
    // Stores an entity already known to lie inside this node
    void place(Entity* entity);
    void subdivide();
    Quadtree& childFor(const Vector2D& position);

    Rectangle m_boundary;
    size_t m_capacity;
    int m_maxDepth;
    int m_depth{0};
    bool m_divided{false};

    std::vector<Entity*> m_points;                    // leaf state
    std::array<std::unique_ptr<Quadtree>, 4> m_children; // divided state
};

} // namespace Formicary

#endif // QUADTREE_HPP
