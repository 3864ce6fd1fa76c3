/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_MANAGER_HPP
#define COLLISION_MANAGER_HPP

#include "collisions/CollisionResult.hpp"
#include "core/PhysicsConfig.hpp"
#include <cstddef>

namespace PongEngine {

class Collidable;
struct BoundingBox;

/**
 * @brief Continuous ball-vs-paddle collision query
 *
 * One query per paddle per physics step. The ball's movement from its
 * previous to its current position is swept against the paddle box
 * expanded by the ball radius, so no speed can carry the ball through a
 * paddle within a step. Each call returns a fresh CollisionResult.
 */
class CollisionManager {
public:
    explicit CollisionManager(const PhysicsConfig& config = PhysicsConfig{});

    /**
     * @brief Swept test of the ball's last step against a paddle
     *
     * @param ball ball hitbox (previous and current centre, radius, velocity)
     * @param paddle paddle hitbox at the end of the step; its box is swept
     *        back over getPosition() - getPreviousPosition()
     * @return collided=false if the ball is stationary, not approaching the
     *         paddle's near edge, or its path misses the expanded box
     *         within the step. Otherwise the hit face (later-entry axis:
     *         X is FRONT, Y is TOP when moving down and BOTTOM when moving
     *         up), the entry time, the ball centre at contact and, for
     *         FRONT hits, the edge-zone deflection.
     */
    CollisionResult checkBallPaddleCollision(const Collidable& ball, const Collidable& paddle);

    // Edge-zone deflection for a ball centre y against a paddle's vertical extent
    float calculateDeflection(float hitY, float paddleTop, float paddleBottom) const;

    const PhysicsConfig& getConfig() const { return m_config; }
    void setConfig(const PhysicsConfig& config) { m_config = config; }

    size_t getQueryCount() const { return m_queryCount; }
    size_t getHitCount() const { return m_hitCount; }
    void resetStats();

private:
    bool isApproachingPaddle(const Vector2D& ballPosition, const Vector2D& ballVelocity,
                             const BoundingBox& paddleBox) const;

    PhysicsConfig m_config;
    size_t m_queryCount{0};
    size_t m_hitCount{0};
};

} // namespace PongEngine

#endif // COLLISION_MANAGER_HPP
