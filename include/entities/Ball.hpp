/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BALL_HPP
#define BALL_HPP

#include "collisions/CollisionResult.hpp"
#include "core/GameState.hpp"
#include "core/PhysicsConfig.hpp"
#include "entities/BallState.hpp"
#include "utils/Vector2D.hpp"
#include <memory>
#include <random>

namespace PongEngine {

class Canvas;

/**
 * @brief The ball: motion, wall rules, hit response and acceleration
 *
 * Position and velocity are in pixel space (velocity in pixels/second).
 * Radius and base speed derive from the canvas; the speed multiplier stays
 * within [initialMultiplier, maxMultiplier] outside of launch().
 *
 * Invariant: |velocity| == currentSpeed whenever the ball is moving.
 */
class Ball {
public:
    /**
     * @brief Creates a stationary ball
     * @throws std::invalid_argument if canvas is null or has no area
     */
    Ball(float x, float y, std::shared_ptr<const Canvas> canvas,
         const PhysicsConfig& config = PhysicsConfig{});

    /**
     * @brief Serves the ball
     *
     * Resets the multiplier to its initial value, picks an angle of
     * launchAngleBase +/- launchAngleVariation degrees, randomly up or down,
     * then flips the horizontal direction with probability 0.5. The
     * resulting speed is exactly the base speed.
     */
    void launch();
    void launch(std::mt19937& rng);

    /**
     * @brief Integrates one physics step
     *
     * No-op unless state is PLAYING. Stores the previous position (used by
     * the swept paddle test), advances by velocity * deltaTime and applies
     * the wall rules. A destroyed ball does not move.
     */
    void update(float deltaTime, GameState state);

    /**
     * @brief Paddle hit response
     *
     * FRONT mirrors the angle across the vertical axis, TOP and BOTTOM
     * mirror it across the horizontal axis and then force the ball away
     * from the paddle (up for TOP, down for BOTTOM). The deflection
     * modifier rotates the new angle by modifier * PI. Speed is kept, then
     * accelerate() is applied.
     */
    void hit(HitFace hitFace, float deflectionModifier = 0.0f);

    // multiplier += rate (capped), velocity rescaled to base * multiplier
    void accelerate();

    /**
     * @brief Re-derives radius and base speed from the canvas
     *
     * Existing velocity is scaled by the width and height ratios against
     * the canvas size seen at the previous call, then brought back to
     * base * multiplier. A zero previous or current size skips the rescale.
     */
    void updateSizes();

    // Snapshot normalised against the current canvas
    BallState saveState() const;
    // Snapshot normalised against explicit dimensions (e.g. the size before a resize)
    BallState saveState(int width, int height) const;

    /**
     * @brief Restores a snapshot
     *
     * Position is denormalised against the given (or current) canvas,
     * velocity is the stored direction * base speed * multiplier. The
     * multiplier is clamped into [initial, max]. Non-positive dimensions
     * are rejected and leave the ball untouched.
     */
    void restoreState(const BallState& state);
    void restoreState(const BallState& state, int width, int height);

    // Centre of the canvas, stationary, flags cleared
    void restart();

    void setPosition(const Vector2D& position);
    void setVelocity(const Vector2D& velocity);

    /**
     * @brief Places the ball at a resolved paddle contact
     *
     * The contact happened before any wall exit detected later in the same
     * step, so the destroyed/hitLeftBorder flags are cleared.
     */
    void applyContact(const Vector2D& position, const Vector2D& velocity);

    // Pulls y back into [radius, height - radius] and turns dy away from that wall; no acceleration
    void clampToField();

    const Vector2D& getPosition() const { return m_position; }
    const Vector2D& getPreviousPosition() const { return m_previousPosition; }
    const Vector2D& getVelocity() const { return m_velocity; }
    Vector2D getNormalizedVelocity() const { return m_velocity.normalized(); }
    Vector2D getInterpolatedPosition(float alpha) const;

    float getRadius() const { return m_radius; }
    float getBaseSpeed() const { return m_baseSpeed; }
    float getCurrentSpeed() const { return m_currentSpeed; }
    float getSpeedMultiplier() const { return m_speedMultiplier; }
    bool isDestroyed() const { return m_destroyed; }
    bool isHitLeftBorder() const { return m_hitLeftBorder; }

    const Canvas& getCanvas() const { return *m_canvas; }
    const PhysicsConfig& getConfig() const { return m_config; }

private:
    void checkBoundaries();
    void setVelocityFromAngle(float angle, float speed);

    std::shared_ptr<const Canvas> m_canvas;
    PhysicsConfig m_config;

    Vector2D m_position;
    Vector2D m_previousPosition;
    Vector2D m_velocity{0.0f, 0.0f};

    float m_radius{0.0f};
    float m_baseSpeed{0.0f};
    float m_currentSpeed{0.0f};
    float m_speedMultiplier{1.0f};

    bool m_destroyed{false};
    bool m_hitLeftBorder{false};

    // Canvas size at the last updateSizes() (or construction)
    int m_lastWidth{0};
    int m_lastHeight{0};

    std::mt19937 m_rng;
};

} // namespace PongEngine

#endif // BALL_HPP
