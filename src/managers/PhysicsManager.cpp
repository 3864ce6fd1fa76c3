/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PhysicsManager.hpp"
#include "collisions/Collidable.hpp"
#include "collisions/PhysicsUtils.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include <algorithm>
#include <format>

namespace PongEngine {

PhysicsManager::PhysicsManager(Ball& ball, const PhysicsConfig& config)
    : m_ball(ball)
    , m_config(config)
    , m_collisionManager(config)
    , m_timestep(60.0f, config.fixedTimestep, config.maxDeltaTime, config.maxStepsPerFrame) {}

void PhysicsManager::addPaddle(Paddle& paddle) {
    if (std::find(m_paddles.begin(), m_paddles.end(), &paddle) != m_paddles.end()) {
        PHYSICS_WARN("Paddle already registered");
        return;
    }
    m_paddles.push_back(&paddle);
}

void PhysicsManager::clearPaddles() {
    m_paddles.clear();
}

bool PhysicsManager::step(float deltaTime, GameState state) {
    if (state != GameState::PLAYING) {
        return false;
    }

    for (Paddle* paddle : m_paddles) {
        paddle->updateMovement(deltaTime);
    }

    if (!m_ball.isDestroyed()) {
        m_ball.update(deltaTime, state);
        resolvePaddleContacts();
        separateOverlaps();
    }

    if (!m_ball.isDestroyed()) {
        m_scoreReported = false;
        return false;
    }
    if (m_scoreReported) {
        return false;
    }

    m_scoreReported = true;
    const bool hitLeft = m_ball.isHitLeftBorder();
    PHYSICS_INFO(std::format("Ball left the field through the {} border", hitLeft ? "left" : "right"));
    if (m_onScore) {
        m_onScore(hitLeft);
    }
    return true;
}

int PhysicsManager::advanceFrame(float frameSeconds, GameState state) {
    m_timestep.startFrame(frameSeconds);

    // The score callback may change the game state; the rest of the frame is dropped
    int steps = 0;
    bool scored = false;
    while (m_timestep.shouldUpdate()) {
        if (scored) {
            continue;
        }
        scored = step(m_timestep.getUpdateDeltaTime(), state);
        ++steps;
    }
    return steps;
}

bool PhysicsManager::resolvePaddleContacts() {
    const BallHitbox ballHitbox(m_ball);

    for (Paddle* paddle : m_paddles) {
        const PaddleHitbox paddleHitbox(*paddle);
        CollisionResult result = m_collisionManager.checkBallPaddleCollision(ballHitbox, paddleHitbox);
        if (!result.collided || !result.collisionPoint) {
            continue;
        }

        const Vector2D contact =
            PhysicsUtils::correctPosition(*result.collisionPoint, faceNormal(result.hitFace), m_config.contactEpsilon);
        m_ball.applyContact(contact, m_ball.getVelocity());
        m_ball.hit(result.hitFace, result.deflectionModifier);

        if (result.hitFace != HitFace::FRONT) {
            paddle->freezeMovement(m_config.paddleFreezeSeconds);
        }

        m_lastCollision = result;
        // One paddle per step; the ball now moves away from both
        return true;
    }
    return false;
}

void PhysicsManager::separateOverlaps() {
    for (Paddle* paddle : m_paddles) {
        const OverlapResult overlap =
            PhysicsUtils::checkCircleAABBOverlap(m_ball.getPosition(), m_ball.getRadius(), paddle->getBoundingBox());
        if (!overlap.collided) {
            continue;
        }

        PHYSICS_DEBUG(std::format("Separating ball from paddle by ({:.2f}, {:.2f})",
                                  overlap.penetration.getX(), overlap.penetration.getY()));
        m_ball.setPosition(m_ball.getPosition() + overlap.penetration + overlap.normal * m_config.contactEpsilon);

        if (m_ball.getVelocity().dot(overlap.normal) < 0.0f) {
            m_ball.setVelocity(PhysicsUtils::reflectVelocity(m_ball.getVelocity(), overlap.normal));
        }
        // A push toward a wall must not leave the ball outside the field
        m_ball.clampToField();
    }
}

Vector2D PhysicsManager::faceNormal(HitFace face) const {
    switch (face) {
    case HitFace::TOP:
        return Vector2D(0.0f, -1.0f);
    case HitFace::BOTTOM:
        return Vector2D(0.0f, 1.0f);
    case HitFace::FRONT:
        break;
    }
    // Front face: back toward where the ball came from
    return Vector2D(m_ball.getVelocity().getX() > 0.0f ? -1.0f : 1.0f, 0.0f);
}

} // namespace PongEngine
