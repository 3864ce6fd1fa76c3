/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/BoundingBox.hpp"
#include <algorithm>

namespace PongEngine {

bool BoundingBox::intersects(const BoundingBox& other) const {
    // Non-strict separation so edge-touching is NOT a collision
    if (right <= other.left || other.right <= left) return false;
    if (bottom <= other.top || other.bottom <= top) return false;
    return true;
}

bool BoundingBox::contains(const Vector2D& p) const {
    return p.getX() >= left && p.getX() <= right &&
           p.getY() >= top && p.getY() <= bottom;
}

Vector2D BoundingBox::closestPoint(const Vector2D& p) const {
    return Vector2D(std::clamp(p.getX(), left, std::max(left, right)),
                    std::clamp(p.getY(), top, std::max(top, bottom)));
}

} // namespace PongEngine
