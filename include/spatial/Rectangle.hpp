/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RECTANGLE_HPP
#define RECTANGLE_HPP

#include "utils/Vector2D.hpp"

namespace Formicary {

/**
 * @brief Axis-aligned box stored as center and half extents.
 *
 * Covers [cx-hw, cx+hw] x [cy-hh, cy+hh], inclusive on every edge.
 */
struct Rectangle {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    // Quadrant order used by subdivision
    enum Quadrant { NW = 0, NE = 1, SW = 2, SE = 3 };

    Rectangle() = default;
    Rectangle(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }

    bool contains(const Vector2D& p) const;
    bool intersects(const Rectangle& other) const;

    // One of the four equal quarters of this box
    Rectangle quadrant(Quadrant q) const;
};

} // namespace Formicary

#endif // RECTANGLE_HPP
