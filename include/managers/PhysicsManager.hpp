/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PHYSICS_MANAGER_HPP
#define PHYSICS_MANAGER_HPP

#include "collisions/CollisionResult.hpp"
#include "core/GameState.hpp"
#include "core/PhysicsConfig.hpp"
#include "core/TimestepManager.hpp"
#include "managers/CollisionManager.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <functional>

namespace PongEngine {

class Ball;
class Paddle;

/**
 * @brief Fixed-step driver for the ball and paddles
 *
 * Owns the collision manager and the timestep accumulator; the ball and
 * paddles are owned by the caller and must outlive the manager.
 */
class PhysicsManager {
public:
    // Invoked once per rally when the ball leaves the field
    using ScoreCallback = std::function<void(bool hitLeftBorder)>;

    PhysicsManager(Ball& ball, const PhysicsConfig& config = PhysicsConfig{});

    void addPaddle(Paddle& paddle);
    void clearPaddles();
    size_t getPaddleCount() const { return m_paddles.size(); }

    void setScoreCallback(ScoreCallback callback) { m_onScore = std::move(callback); }

    /**
     * @brief One fixed sub-step; nothing moves unless state is PLAYING
     *
     * Paddles move, the ball integrates and bounces off the walls, then the
     * ball's step is swept against each paddle. The first paddle hit places
     * the ball at the contact point (plus the contact epsilon along the face
     * normal) and applies Ball::hit(); TOP/BOTTOM hits freeze that paddle.
     * A discrete overlap pass pushes the ball out of any paddle it still
     * intersects and keeps it inside the field. A ball that left the field
     * triggers the score callback once.
     *
     * @return true if this step reported a point
     */
    bool step(float deltaTime, GameState state);

    /**
     * @brief Runs as many fixed steps as the frame time allows
     *
     * Stops simulating after a step reports a point; the remaining frame
     * time is still consumed.
     *
     * @return number of steps run (bounded by maxStepsPerFrame)
     */
    int advanceFrame(float frameSeconds, GameState state);

    // Render blend factor for the last advanced frame
    double getInterpolationAlpha() const { return m_timestep.getInterpolationAlpha(); }

    void resetTiming() { m_timestep.reset(); }

    const CollisionResult& getLastCollision() const { return m_lastCollision; }
    CollisionManager& getCollisionManager() { return m_collisionManager; }
    TimestepManager& getTimestepManager() { return m_timestep; }

private:
    bool resolvePaddleContacts();
    void separateOverlaps();
    Vector2D faceNormal(HitFace face) const;

    Ball& m_ball;
    PhysicsConfig m_config;
    CollisionManager m_collisionManager;
    TimestepManager m_timestep;

    boost::container::small_vector<Paddle*, 2> m_paddles;

    ScoreCallback m_onScore;
    bool m_scoreReported{false};
    CollisionResult m_lastCollision;
};

} // namespace PongEngine

#endif // PHYSICS_MANAGER_HPP
