/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CollisionManager.hpp"
#include "collisions/BoundingBox.hpp"
#include "collisions/Collidable.hpp"
#include "collisions/PhysicsUtils.hpp"
#include "core/Logger.hpp"
#include <format>

namespace PongEngine {

CollisionManager::CollisionManager(const PhysicsConfig& config)
    : m_config(config) {}

CollisionResult CollisionManager::checkBallPaddleCollision(const Collidable& ball, const Collidable& paddle) {
    ++m_queryCount;
    CollisionResult result;

    const Vector2D velocity = ball.getVelocity();
    const Vector2D start = ball.getPreviousPosition();
    const BoundingBox paddleBox = paddle.getBoundingBox();

    // The start of the step decides the approach side; the end may already be past the edge
    if (velocity.isZero() || !isApproachingPaddle(start, velocity, paddleBox)) {
        return result;
    }

    const Vector2D ballMove = ball.getPosition() - start;
    // What the paddle actually did this step; clamping and freezes make it differ from its velocity
    const Vector2D paddleMove = paddle.getPosition() - paddle.getPreviousPosition();
    const BoundingBox startBox(paddleBox.left - paddleMove.getX(), paddleBox.right - paddleMove.getX(),
                               paddleBox.top - paddleMove.getY(), paddleBox.bottom - paddleMove.getY());

    const SweepResult sweep =
        PhysicsUtils::sweepCircleVsMovingRect(start, ballMove, ball.getRadius(), startBox, paddleMove);
    if (!sweep.collided) {
        return result;
    }

    const Vector2D contact = start + ballMove * sweep.t;
    result.collided = true;
    result.time = sweep.t;
    result.collisionPoint = contact;

    if (sweep.normal.getX() != 0.0f) {
        result.hitFace = HitFace::FRONT;
    } else {
        // Normal points up (ball above) when the ball came down onto the top edge
        result.hitFace = sweep.normal.getY() < 0.0f ? HitFace::TOP : HitFace::BOTTOM;
    }

    const float paddleTop = startBox.top + paddleMove.getY() * sweep.t;
    const float paddleBottom = startBox.bottom + paddleMove.getY() * sweep.t;

    if (result.hitFace == HitFace::FRONT ||
        m_config.topBottomDeflection == TopBottomDeflection::EdgeZone) {
        result.deflectionModifier = calculateDeflection(contact.getY(), paddleTop, paddleBottom);
    }

    ++m_hitCount;
    COLLISION_DEBUG(std::format("Hit at t={:.3f} ({:.1f}, {:.1f}), deflection {:.3f}",
                                sweep.t, contact.getX(), contact.getY(), result.deflectionModifier));
    return result;
}

float CollisionManager::calculateDeflection(float hitY, float paddleTop, float paddleBottom) const {
    const float height = paddleBottom - paddleTop;
    if (height <= 0.0f) {
        return 0.0f;
    }
    const float relativeHit = (hitY - paddleTop) / height;
    return PhysicsUtils::computeEdgeDeflection(relativeHit, m_config.edgeZoneSize, m_config.maxDeflection);
}

void CollisionManager::resetStats() {
    m_queryCount = 0;
    m_hitCount = 0;
}

bool CollisionManager::isApproachingPaddle(const Vector2D& ballPosition, const Vector2D& ballVelocity,
                                           const BoundingBox& paddleBox) const {
    const bool fromLeft = ballVelocity.getX() > 0.0f && ballPosition.getX() < paddleBox.left;
    const bool fromRight = ballVelocity.getX() < 0.0f && ballPosition.getX() > paddleBox.right;
    return fromLeft || fromRight;
}

} // namespace PongEngine
