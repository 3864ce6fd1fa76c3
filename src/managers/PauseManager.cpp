/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PauseManager.hpp"
#include "core/Canvas.hpp"
#include "core/Logger.hpp"
#include "entities/Ball.hpp"
#include "entities/Paddle.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace PongEngine {

PauseManager::PauseManager(Ball& ball, Paddle& leftPaddle, Paddle& rightPaddle, const PhysicsConfig& config)
    : m_ball(ball)
    , m_leftPaddle(leftPaddle)
    , m_rightPaddle(rightPaddle)
    , m_config(config) {}

void PauseManager::startGame() {
    cancelCountdown();
    m_state = GameState::COUNTDOWN;
    startCountdown(CountdownAction::Serve);
}

void PauseManager::pause() {
    pause(m_ball.getCanvas().getWidth(), m_ball.getCanvas().getHeight());
}

void PauseManager::pause(int width, int height) {
    if (m_state == GameState::PAUSED) {
        return;
    }
    if (m_state == GameState::COUNTDOWN) {
        PAUSE_DEBUG("Pause requested during countdown, deferring");
        m_pendingPause = true;
        return;
    }

    saveGameState(width, height);
    m_state = GameState::PAUSED;
    m_leftPaddle.stop();
    m_rightPaddle.stop();
    PAUSE_INFO("Game paused");
}

void PauseManager::resume() {
    if (m_state != GameState::PAUSED) {
        return;
    }
    m_pendingPause = false;

    if (m_firstStart || !m_snapshot) {
        startGame();
        return;
    }
    m_state = GameState::COUNTDOWN;
    startCountdown(CountdownAction::Restore);
}

void PauseManager::handlePointScored() {
    cancelCountdown();
    m_snapshot.reset();
    m_pendingPause = false;
    m_ball.restart();
    m_state = GameState::COUNTDOWN;
    startCountdown(CountdownAction::Serve);
}

void PauseManager::update(float deltaTime) {
    if (m_state == GameState::PAUSED || m_countdownActive) {
        m_leftPaddle.stop();
        m_rightPaddle.stop();
        maintainPositionsFromSnapshot();
    }

    if (!m_countdownActive) {
        return;
    }

    m_countdownRemaining -= deltaTime;
    const int second = static_cast<int>(std::ceil(std::max(m_countdownRemaining, 0.0f)));
    if (second != m_lastAnnouncedSecond) {
        notifyCountdown(second);
    }
    if (m_countdownRemaining <= 0.0f) {
        finishCountdown();
    }
}

void PauseManager::forcePauseFromCountdownKeepSnapshot() {
    if (m_state != GameState::COUNTDOWN) {
        return;
    }
    cancelCountdown();
    m_pendingPause = false;
    m_state = GameState::PAUSED;
    PAUSE_DEBUG(std::format("Countdown interrupted, snapshot {}", m_snapshot ? "kept" : "absent"));
}

void PauseManager::forceStop() {
    cancelCountdown();
    m_snapshot.reset();
    m_pendingPause = false;
    m_state = GameState::PAUSED;
}

void PauseManager::updateSnapshotPaddles(float leftRelativeY, float rightRelativeY) {
    if (!m_snapshot) {
        return;
    }
    m_snapshot->leftPaddleRelativeY = leftRelativeY;
    m_snapshot->rightPaddleRelativeY = rightRelativeY;
}

void PauseManager::cleanup() {
    cancelCountdown();
    m_snapshot.reset();
    m_pendingPause = false;
    m_countdownCallback = nullptr;
    m_state = GameState::PAUSED;
}

void PauseManager::startCountdown(CountdownAction action) {
    m_countdownAction = action;
    m_countdownActive = true;
    m_countdownRemaining = m_config.countdownSeconds;

    if (m_countdownRemaining <= 0.0f) {
        finishCountdown();
        return;
    }
    notifyCountdown(static_cast<int>(std::ceil(m_countdownRemaining)));
}

void PauseManager::finishCountdown() {
    m_countdownActive = false;
    m_countdownRemaining = 0.0f;
    if (m_lastAnnouncedSecond != 0) {
        notifyCountdown(0);
    }

    switch (m_countdownAction) {
    case CountdownAction::Serve:
        m_ball.launch();
        m_firstStart = false;
        break;
    case CountdownAction::Restore:
        restoreGameState();
        m_snapshot.reset();
        break;
    }
    m_state = GameState::PLAYING;
    PAUSE_INFO("Countdown finished, playing");

    if (m_pendingPause) {
        m_pendingPause = false;
        pause();
    }
}

void PauseManager::cancelCountdown() {
    if (!m_countdownActive) {
        return;
    }
    m_countdownActive = false;
    m_countdownRemaining = 0.0f;
    notifyCountdown(0);
}

void PauseManager::saveGameState(int width, int height) {
    GameSnapshot snapshot;
    snapshot.ballState = m_ball.saveState(width, height);
    snapshot.leftPaddleRelativeY = m_leftPaddle.getRelativeCenterY(height);
    snapshot.rightPaddleRelativeY = m_rightPaddle.getRelativeCenterY(height);
    m_snapshot = snapshot;
}

void PauseManager::restoreGameState() {
    if (!m_snapshot) {
        return;
    }
    m_ball.restoreState(m_snapshot->ballState);
    m_leftPaddle.setRelativeCenterY(m_snapshot->leftPaddleRelativeY);
    m_rightPaddle.setRelativeCenterY(m_snapshot->rightPaddleRelativeY);
}

void PauseManager::maintainPositionsFromSnapshot() {
    restoreGameState();
}

void PauseManager::notifyCountdown(int secondsRemaining) {
    m_lastAnnouncedSecond = secondsRemaining;
    if (m_countdownCallback) {
        m_countdownCallback(secondsRemaining);
    }
}

} // namespace PongEngine
