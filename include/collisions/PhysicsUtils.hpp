/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_UTILS_HPP
#define PHYSICS_UTILS_HPP

#include "collisions/BoundingBox.hpp"
#include "collisions/CollisionResult.hpp"
#include "utils/Vector2D.hpp"

namespace PongEngine {

struct PhysicsConfig;

/**
 * @brief Stateless circle/box geometry used by the collision and physics
 * managers. Every function returns its result by value.
 */
namespace PhysicsUtils {

// Below this a velocity or movement component counts as zero
inline constexpr float MOTION_EPSILON = 1e-6f;

/**
 * @brief Discrete circle-vs-box overlap
 *
 * Clamps the centre onto the box to find the closest point. Reports an
 * overlap when the squared distance is below radius^2, with a unit normal
 * from the box toward the circle and the penetration vector that separates
 * them. A centre inside the box is pushed out through the nearest face.
 */
OverlapResult checkCircleAABBOverlap(const Vector2D& center, float radius, const BoundingBox& box);

/**
 * @brief Swept circle against a moving rectangle
 *
 * Works in the circle's reference frame: the relative displacement
 * (circleMove - rectMove) is cast as a ray from p0 against the rectangle
 * expanded by the radius (slab test). Displacements are for the whole
 * frame, so the returned time of impact lies in [0, 1].
 *
 * @param p0 circle centre at the start of the frame
 * @param circleMove circle displacement over the frame
 * @param radius circle radius
 * @param rect rectangle at the start of the frame
 * @param rectMove rectangle displacement over the frame
 */
SweepResult sweepCircleVsMovingRect(const Vector2D& p0, const Vector2D& circleMove, float radius,
                                    const BoundingBox& rect, const Vector2D& rectMove);

// v' = v - 2(v.n)n, n must be unit length
Vector2D reflectVelocity(const Vector2D& velocity, const Vector2D& normal);

/**
 * @brief Edge-zone deflection for a relative hit position
 * @param relativeHit 0 = paddle top, 1 = paddle bottom (clamped)
 * @return -maxDeflection at the top edge rising linearly to 0 at zoneSize,
 *         0 across the middle band, 0 to +maxDeflection across the bottom zone
 */
float computeEdgeDeflection(float relativeHit, float zoneSize, float maxDeflection);

/**
 * @brief Rotates an already reflected velocity by the edge-zone deflection
 * of the impact point (deflection * PI radians). A paddle without height
 * leaves the velocity unchanged.
 */
Vector2D applyPaddleDeflection(const Vector2D& impactPoint, const Vector2D& reflectedVelocity,
                               float paddleTop, float paddleBottom, const PhysicsConfig& config);

// Contact point nudged epsilon along the normal so the next frame starts clear
Vector2D correctPosition(const Vector2D& contactPoint, const Vector2D& normal, float epsilon);

} // namespace PhysicsUtils
} // namespace PongEngine

#endif // PHYSICS_UTILS_HPP
