/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PAUSE_MANAGER_HPP
#define PAUSE_MANAGER_HPP

#include "core/GameState.hpp"
#include "core/PhysicsConfig.hpp"
#include "entities/BallState.hpp"
#include <cstdint>
#include <functional>
#include <optional>

namespace PongEngine {

class Ball;
class Paddle;

// Everything needed to put a paused match back, independent of resolution
struct GameSnapshot {
    BallState ballState;
    float leftPaddleRelativeY{0.5f};   // paddle centre / canvas height
    float rightPaddleRelativeY{0.5f};
};

/**
 * @brief Match flow: pause, countdown and resume
 *
 * Starts PAUSED awaiting the first start. Countdowns are advanced by
 * update(deltaTime) from the game loop; nothing here runs on its own.
 *
 *   PAUSED --startGame/resume--> COUNTDOWN --expires--> PLAYING
 *   PLAYING --pause--> PAUSED (snapshot taken)
 *   COUNTDOWN --pause--> pending, applied once PLAYING
 */
class PauseManager {
public:
    // Whole seconds left on the countdown; 0 once it has finished or been cancelled
    using CountdownCallback = std::function<void(int secondsRemaining)>;

    PauseManager(Ball& ball, Paddle& leftPaddle, Paddle& rightPaddle,
                 const PhysicsConfig& config = PhysicsConfig{});

    // COUNTDOWN, then the ball is served and play starts
    void startGame();

    /**
     * @brief Pauses play and snapshots ball and paddles
     *
     * Ignored when already PAUSED. During a countdown the request is held
     * and applied as soon as play starts.
     */
    void pause();

    // Same, normalising the snapshot against explicit canvas dimensions
    void pause(int width, int height);

    /**
     * @brief Leaves PAUSED
     *
     * Before the first serve (or with no snapshot to restore) this serves a
     * fresh ball via startGame(); otherwise it counts down and then restores
     * the snapshot.
     */
    void resume();

    // Drops the snapshot, recentres the ball and counts down to a new serve
    void handlePointScored();

    /**
     * @brief Advances the countdown and holds objects still while not playing
     */
    void update(float deltaTime);

    // COUNTDOWN -> PAUSED, keeping whatever snapshot exists
    void forcePauseFromCountdownKeepSnapshot();

    // Cancels any countdown and returns to PAUSED without a snapshot
    void forceStop();

    bool hasState(GameState state) const { return m_state == state; }
    GameState getState() const { return m_state; }

    const std::optional<GameSnapshot>& getSnapshot() const { return m_snapshot; }
    // Keeps a held snapshot in step with paddles moved by a resize
    void updateSnapshotPaddles(float leftRelativeY, float rightRelativeY);

    bool isCountingDown() const { return m_countdownActive; }
    float getCountdownRemaining() const { return m_countdownRemaining; }
    bool isFirstStart() const { return m_firstStart; }
    bool hasPendingPause() const { return m_pendingPause; }

    void setCountdownCallback(CountdownCallback callback) { m_countdownCallback = std::move(callback); }

    void cleanup();

private:
    enum class CountdownAction : uint8_t {
        Serve,   // launch a fresh ball
        Restore  // put the snapshot back
    };

    void startCountdown(CountdownAction action);
    void finishCountdown();
    void cancelCountdown();
    void saveGameState(int width, int height);
    void restoreGameState();
    void maintainPositionsFromSnapshot();
    void notifyCountdown(int secondsRemaining);

    Ball& m_ball;
    Paddle& m_leftPaddle;
    Paddle& m_rightPaddle;
    PhysicsConfig m_config;

    GameState m_state{GameState::PAUSED};
    std::optional<GameSnapshot> m_snapshot;

    bool m_firstStart{true};
    bool m_pendingPause{false};

    bool m_countdownActive{false};
    float m_countdownRemaining{0.0f};
    int m_lastAnnouncedSecond{0};
    CountdownAction m_countdownAction{CountdownAction::Serve};
    CountdownCallback m_countdownCallback;
};

} // namespace PongEngine

#endif // PAUSE_MANAGER_HPP
