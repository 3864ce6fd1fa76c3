/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ResizeManager.hpp"
#include "core/Canvas.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include "managers/PauseManager.hpp"
#include <format>
#include <stdexcept>

namespace PongEngine {

ResizeManager::ResizeManager(std::shared_ptr<const Canvas> canvas, Ball& ball, Paddle& leftPaddle,
                             Paddle& rightPaddle, PauseManager& pauseManager, const PhysicsConfig& config)
    : m_canvas(std::move(canvas))
    , m_ball(ball)
    , m_leftPaddle(leftPaddle)
    , m_rightPaddle(rightPaddle)
    , m_pauseManager(pauseManager)
    , m_config(config)
{
    if (!m_canvas) {
        throw std::invalid_argument("ResizeManager requires a canvas");
    }
    m_previousWidth = m_canvas->getWidth();
    m_previousHeight = m_canvas->getHeight();
}

void ResizeManager::onCanvasResizedByEngine() {
    forcePause();

    if (m_pending) {
        RESIZE_DEBUG("Resize burst, re-arming debounce");
    }
    m_pending = true;
    m_resizing = true;
    m_debounceRemaining = m_config.resizeDebounceSeconds;
}

void ResizeManager::update(float deltaTime) {
    if (!m_pending) {
        return;
    }

    m_debounceRemaining -= deltaTime;
    if (m_debounceRemaining > 0.0f) {
        return;
    }

    m_pending = false;
    m_debounceRemaining = 0.0f;
    resizeGameObjects();
    m_resizing = false;
}

void ResizeManager::resizeGameObjects() {
    const int newWidth = m_canvas->getWidth();
    const int newHeight = m_canvas->getHeight();

    if (newWidth <= 0 || newHeight <= 0) {
        RESIZE_WARN(std::format("Canvas is {}x{}, keeping the {}x{} layout",
                                newWidth, newHeight, m_previousWidth, m_previousHeight));
        return;
    }
    if (m_previousWidth <= 0 || m_previousHeight <= 0) {
        RESIZE_WARN(std::format("No usable previous size ({}x{}), adopting {}x{} without rescaling",
                                m_previousWidth, m_previousHeight, newWidth, newHeight));
        m_previousWidth = newWidth;
        m_previousHeight = newHeight;
        return;
    }

    // Capture proportions against the old layout before any size changes
    const float leftRelativeY = m_leftPaddle.getRelativeCenterY(m_previousHeight);
    const float rightRelativeY = m_rightPaddle.getRelativeCenterY(m_previousHeight);
    const BallState ballState = m_ball.saveState(m_previousWidth, m_previousHeight);

    m_ball.updateSizes();
    m_leftPaddle.updateSizes();
    m_rightPaddle.updateSizes();

    const GameSizes sizes = calculateGameSizes(newWidth, newHeight, m_config);
    m_leftPaddle.setX(sizes.playerPadding);
    m_rightPaddle.setX(static_cast<float>(newWidth) - (sizes.playerPadding + sizes.paddleWidth));

    const std::optional<GameSnapshot>& snapshot = m_pauseManager.getSnapshot();
    if (snapshot) {
        m_leftPaddle.setRelativeCenterY(snapshot->leftPaddleRelativeY);
        m_rightPaddle.setRelativeCenterY(snapshot->rightPaddleRelativeY);
        m_ball.restoreState(snapshot->ballState, newWidth, newHeight);
        // Clamping may have moved the paddles; keep the snapshot in step
        m_pauseManager.updateSnapshotPaddles(m_leftPaddle.getRelativeCenterY(newHeight),
                                             m_rightPaddle.getRelativeCenterY(newHeight));
    } else {
        m_leftPaddle.setRelativeCenterY(leftRelativeY);
        m_rightPaddle.setRelativeCenterY(rightRelativeY);
        m_ball.restoreState(ballState, newWidth, newHeight);
    }

    if (m_pauseManager.hasState(GameState::COUNTDOWN)) {
        m_ball.restart();
    }

    RESIZE_INFO(std::format("Resized {}x{} -> {}x{}{}", m_previousWidth, m_previousHeight,
                            newWidth, newHeight, snapshot ? " from snapshot" : ""));
    m_previousWidth = newWidth;
    m_previousHeight = newHeight;
}

void ResizeManager::cleanup() {
    m_pending = false;
    m_resizing = false;
    m_debounceRemaining = 0.0f;
}

void ResizeManager::forcePause() {
    if (m_pauseManager.hasState(GameState::PLAYING)) {
        // The canvas already has its new size; normalise against the old one
        m_pauseManager.pause(m_previousWidth, m_previousHeight);
    } else if (m_pauseManager.hasState(GameState::COUNTDOWN)) {
        m_pauseManager.forcePauseFromCountdownKeepSnapshot();
    }
}

} // namespace PongEngine
