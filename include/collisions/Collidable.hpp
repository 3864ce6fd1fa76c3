/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLIDABLE_HPP
#define COLLIDABLE_HPP

#include "collisions/BoundingBox.hpp"
#include "utils/Vector2D.hpp"

namespace PongEngine {

class Ball;
class Paddle;

/**
 * @brief Read-only view of an object taking part in a collision query
 *
 * Positions are the object's reference point: the centre for a ball, the
 * top-left corner for a paddle. Velocity is in pixels/second.
 */
class Collidable {
public:
    virtual ~Collidable() = default;

    virtual BoundingBox getBoundingBox() const = 0;
    virtual Vector2D getPosition() const = 0;
    virtual Vector2D getPreviousPosition() const = 0;
    virtual Vector2D getVelocity() const = 0;
    // Circle radius; 0 for boxes
    virtual float getRadius() const = 0;
};

class BallHitbox : public Collidable {
public:
    explicit BallHitbox(const Ball& ball) : m_ball(ball) {}

    BoundingBox getBoundingBox() const override;
    Vector2D getPosition() const override;
    Vector2D getPreviousPosition() const override;
    Vector2D getVelocity() const override;
    float getRadius() const override;

private:
    const Ball& m_ball;
};

class PaddleHitbox : public Collidable {
public:
    explicit PaddleHitbox(const Paddle& paddle) : m_paddle(paddle) {}

    BoundingBox getBoundingBox() const override;
    Vector2D getPosition() const override;
    Vector2D getPreviousPosition() const override;
    Vector2D getVelocity() const override;
    float getRadius() const override { return 0.0f; }

private:
    const Paddle& m_paddle;
};

} // namespace PongEngine

#endif // COLLIDABLE_HPP
