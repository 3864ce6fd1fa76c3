/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include <cstdint>
#include <ostream>

namespace PongEngine {

// Match phase as seen by the physics core; only PLAYING moves the ball
enum class GameState : uint8_t {
    PLAYING,
    PAUSED,
    COUNTDOWN
};

inline std::ostream& operator<<(std::ostream& os, GameState state) {
    switch (state) {
    case GameState::PLAYING:
        return os << "PLAYING";
    case GameState::PAUSED:
        return os << "PAUSED";
    case GameState::COUNTDOWN:
        return os << "COUNTDOWN";
    }
    return os << "UNKNOWN";
}

} // namespace PongEngine

#endif // GAME_STATE_HPP
