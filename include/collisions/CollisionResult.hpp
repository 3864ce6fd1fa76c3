/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESULT_HPP
#define COLLISION_RESULT_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <ostream>

namespace PongEngine {

// Which side of a paddle the ball struck
enum class HitFace : uint8_t {
    FRONT,  // the face pointing at the field
    TOP,
    BOTTOM
};

inline std::ostream& operator<<(std::ostream& os, HitFace face) {
    switch (face) {
    case HitFace::FRONT:
        return os << "FRONT";
    case HitFace::TOP:
        return os << "TOP";
    case HitFace::BOTTOM:
        return os << "BOTTOM";
    }
    return os << "UNKNOWN";
}

// Ball-vs-paddle query result; a fresh value per query
struct CollisionResult {
    bool collided{false};
    HitFace hitFace{HitFace::FRONT};
    float deflectionModifier{0.0f};        // fraction of PI, within +/- maxDeflection
    float time{0.0f};                      // entry time within the frame's movement
    std::optional<Vector2D> collisionPoint; // ball centre at first contact
};

// Swept circle-vs-rectangle time of impact
struct SweepResult {
    bool collided{false};
    float t{0.0f};
    Vector2D normal{0.0f, 0.0f}; // axis-aligned, points from the box toward the ball
};

// Discrete circle-vs-box overlap
struct OverlapResult {
    bool collided{false};
    Vector2D normal{0.0f, 0.0f};
    Vector2D penetration{0.0f, 0.0f}; // normal * depth; add to the centre to separate
};

} // namespace PongEngine

#endif // COLLISION_RESULT_HPP
