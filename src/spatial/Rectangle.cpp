/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "spatial/Rectangle.hpp"

namespace Formicary {

bool Rectangle::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

bool Rectangle::intersects(const Rectangle& other) const {
    // Strict separation only, so edge-touching boxes overlap
    if (right() < other.left() || other.right() < left()) return false;
    if (bottom() < other.top() || other.bottom() < top()) return false;
    return true;
}

Rectangle Rectangle::quadrant(Quadrant q) const {
    const float hw = halfSize.getX() * 0.5f;
    const float hh = halfSize.getY() * 0.5f;
    const float cx = center.getX();
    const float cy = center.getY();

    switch (q) {
    case NW: return Rectangle(cx - hw, cy - hh, hw, hh);
    case NE: return Rectangle(cx + hw, cy - hh, hw, hh);
    case SW: return Rectangle(cx - hw, cy + hh, hw, hh);
    case SE: return Rectangle(cx + hw, cy + hh, hw, hh);
    }
    return *this;
}

} // namespace Formicary
