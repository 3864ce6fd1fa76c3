/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BOUNDING_BOX_HPP
#define BOUNDING_BOX_HPP

#include "utils/Vector2D.hpp"

namespace PongEngine {

// Edge-based axis-aligned box in pixel space (top < bottom, y grows down)
struct BoundingBox {
    float left{0.0f};
    float right{0.0f};
    float top{0.0f};
    float bottom{0.0f};

    BoundingBox() = default;
    BoundingBox(float l, float r, float t, float b) : left(l), right(r), top(t), bottom(b) {}

    static BoundingBox fromRect(float x, float y, float width, float height) {
        return BoundingBox(x, x + width, y, y + height);
    }
    static BoundingBox fromCircle(const Vector2D& center, float radius) {
        return BoundingBox(center.getX() - radius, center.getX() + radius,
                           center.getY() - radius, center.getY() + radius);
    }

    float width() const { return right - left; }
    float height() const { return bottom - top; }
    Vector2D center() const { return Vector2D((left + right) * 0.5f, (top + bottom) * 0.5f); }
    bool isDegenerate() const { return !(right > left) || !(bottom > top); }

    // Minkowski sum with a circle's bounding square
    BoundingBox expanded(float amount) const {
        return BoundingBox(left - amount, right + amount, top - amount, bottom + amount);
    }

    bool intersects(const BoundingBox& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;
};

} // namespace PongEngine

#endif // BOUNDING_BOX_HPP
