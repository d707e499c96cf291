/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/Quadtree.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace Formicary {

Quadtree::Quadtree(const Rectangle& boundary, size_t capacity, int maxDepth)
    : Quadtree(boundary, capacity, maxDepth, 0) {}

Quadtree::Quadtree(const Rectangle& boundary, size_t capacity, int maxDepth, int depth)
    : m_boundary(boundary),
      m_capacity(std::max<size_t>(capacity, 1)),
      m_maxDepth(std::max(maxDepth, 0)),
      m_depth(depth) {
    m_points.reserve(m_capacity);
}

bool Quadtree::insert(Entity* entity) {
    if (!entity || !m_boundary.contains(entity->getPosition())) {
        return false;
    }
    place(entity);
    return true;
}

Entity* Quadtree::remove(Entity* entity) {
    if (!entity) {
        return nullptr;
    }

    if (!m_divided) {
        auto it = std::find(m_points.begin(), m_points.end(), entity);
        if (it == m_points.end()) {
            return nullptr;
        }
        m_points.erase(it);
        return entity;
    }

    return childFor(entity->getPosition()).remove(entity);
}

void Quadtree::clear() {
    for (auto& child : m_children) {
        child.reset();
    }
    m_points.clear();
    m_divided = false;
}

void Quadtree::query(const Rectangle& range, std::vector<Entity*>& found) const {
    if (!m_boundary.intersects(range)) {
        return;
    }

    if (!m_divided) {
        for (Entity* entity : m_points) {
            if (range.contains(entity->getPosition())) {
                found.push_back(entity);
            }
        }
        return;
    }

    for (const auto& child : m_children) {
        child->query(range, found);
    }
}

void Quadtree::place(Entity* entity) {
    if (!m_divided) {
        if (m_points.size() < m_capacity || m_depth >= m_maxDepth) {
            m_points.push_back(entity);
            return;
        }
        subdivide();
    }

    childFor(entity->getPosition()).place(entity);
}

void Quadtree::subdivide() {
    for (int q = Rectangle::NW; q <= Rectangle::SE; ++q) {
        m_children[q] = std::make_unique<Quadtree>(
            m_boundary.quadrant(static_cast<Rectangle::Quadrant>(q)), m_capacity, m_maxDepth,
            m_depth + 1);
    }
    m_divided = true;

    std::vector<Entity*> points;
    points.swap(m_points);
    for (Entity* point : points) {
        childFor(point->getPosition()).place(point);
    }
}

Quadtree& Quadtree::childFor(const Vector2D& position) {
    for (auto& child : m_children) {
        if (child->m_boundary.contains(position)) {
            return *child;
        }
    }

    // Rounding in the quadrant extents can leave a sliver of this node
    // uncovered by every child; pick by comparing against the center.
    const bool west = position.getX() <= m_boundary.center.getX();
    const bool north = position.getY() <= m_boundary.center.getY();
    const int q = north ? (west ? Rectangle::NW : Rectangle::NE)
                        : (west ? Rectangle::SW : Rectangle::SE);
    return *m_children[q];
}

size_t Quadtree::size() const {
    if (!m_divided) {
        return m_points.size();
    }
    size_t total = 0;
    for (const auto& child : m_children) {
        total += child->size();
    }
    return total;
}

size_t Quadtree::nodeCount() const {
    size_t total = 1;
    if (m_divided) {
        for (const auto& child : m_children) {
            total += child->nodeCount();
        }
    }
    return total;
}

int Quadtree::maxDepth() const {
    int deepest = m_depth;
    if (m_divided) {
        for (const auto& child : m_children) {
            deepest = std::max(deepest, child->maxDepth());
        }
    }
    return deepest;
}

void Quadtree::logStatistics() const {
    QUADTREE_INFO("Quadtree: " + std::to_string(size()) + " entities in " +
                  std::to_string(nodeCount()) + " nodes, depth " +
                  std::to_string(maxDepth()));
}

} // namespace Formicary
