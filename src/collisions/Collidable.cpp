/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Collidable.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"

namespace PongEngine {

BoundingBox BallHitbox::getBoundingBox() const {
    return BoundingBox::fromCircle(m_ball.getPosition(), m_ball.getRadius());
}

Vector2D BallHitbox::getPosition() const {
    return m_ball.getPosition();
}

Vector2D BallHitbox::getPreviousPosition() const {
    return m_ball.getPreviousPosition();
}

Vector2D BallHitbox::getVelocity() const {
    return m_ball.getVelocity();
}

float BallHitbox::getRadius() const {
    return m_ball.getRadius();
}

BoundingBox PaddleHitbox::getBoundingBox() const {
    return m_paddle.getBoundingBox();
}

Vector2D PaddleHitbox::getPosition() const {
    return m_paddle.getPosition();
}

Vector2D PaddleHitbox::getPreviousPosition() const {
    return m_paddle.getPreviousPosition();
}

Vector2D PaddleHitbox::getVelocity() const {
    return m_paddle.getVelocity();
}

} // namespace PongEngine
