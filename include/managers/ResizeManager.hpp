/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESIZE_MANAGER_HPP
#define RESIZE_MANAGER_HPP

#include "core/PhysicsConfig.hpp"
#include <memory>

namespace PongEngine {

class Ball;
class Canvas;
class Paddle;
class PauseManager;

/**
 * @brief Rescales the match when the canvas changes size
 *
 * Resize events are debounced: each one force-pauses the game and re-arms
 * the timer, and only when the timer runs out (advanced by update()) are
 * the objects rescaled against the settled size. Physics never runs while
 * a resize is in flight because the game stays paused.
 */
class ResizeManager {
public:
    /**
     * @throws std::invalid_argument if canvas is null
     */
    ResizeManager(std::shared_ptr<const Canvas> canvas, Ball& ball, Paddle& leftPaddle, Paddle& rightPaddle,
                  PauseManager& pauseManager, const PhysicsConfig& config = PhysicsConfig{});

    // Entry point for the window layer; call after the canvas already has its new size
    void onCanvasResizedByEngine();

    // Counts the debounce down; runs resizeGameObjects() when it expires
    void update(float deltaTime);

    /**
     * @brief Rescales ball and paddles from the previous to the current size
     *
     * With a pause snapshot the snapshot is replayed at the new size;
     * otherwise positions scale proportionally. Paddles are re-anchored to
     * the side padding and clamped. During a countdown the ball is
     * recentred. A zero previous or current size skips the rescale.
     */
    void resizeGameObjects();

    // Cancels a pending resize
    void cleanup();

    bool isCurrentlyResizing() const { return m_resizing; }
    bool hasPendingResize() const { return m_pending; }
    float getDebounceRemaining() const { return m_debounceRemaining; }

    int getPreviousWidth() const { return m_previousWidth; }
    int getPreviousHeight() const { return m_previousHeight; }

private:
    void forcePause();

    std::shared_ptr<const Canvas> m_canvas;
    Ball& m_ball;
    Paddle& m_leftPaddle;
    Paddle& m_rightPaddle;
    PauseManager& m_pauseManager;
    PhysicsConfig m_config;

    // Size the objects are currently laid out for
    int m_previousWidth;
    int m_previousHeight;

    bool m_pending{false};
    bool m_resizing{false};
    float m_debounceRemaining{0.0f};
};

} // namespace PongEngine

#endif // RESIZE_MANAGER_HPP
